#pragma once
#include "chat_session.h"
#include "config/config_types.h"
#include <QMap>

class CozeChat final : public ChatSession {
public:
    explicit CozeChat(const ProviderEndpoints& endpoints = {});

    // Free-form; stored with the session and carried through serialize().
    VoidResult setParameter(const QString& key, const QString& value) override;
    const QMap<QString, QString>& parameters() const { return m_parameters; }

    ProviderRequest buildRequest(const ApiKey& key, const QString& prompt) const override;
    std::unique_ptr<IStreamDecoder> createDecoder() const override;

protected:
    QJsonObject parametersToJson() const override;
    VoidResult parametersFromJson(const QJsonObject& params) override;

private:
    QString m_chatUrl;
    QString m_botId;
    QString m_userId;
    QMap<QString, QString> m_parameters;

    QJsonArray buildAdditionalMessages(const QString& prompt) const;
};
