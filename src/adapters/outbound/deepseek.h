#pragma once
#include "chat_session.h"
#include "config/config_types.h"

class DeepSeekChat final : public ChatSession {
public:
    explicit DeepSeekChat(const ProviderEndpoints& endpoints = {});

    VoidResult setParameter(const QString& key, const QString& value) override;

    ProviderRequest buildRequest(const ApiKey& key, const QString& prompt) const override;
    std::unique_ptr<IStreamDecoder> createDecoder() const override;

    const QString& model() const { return m_model; }
    double temperature() const { return m_temperature; }
    int maxTokens() const { return m_maxTokens; }

protected:
    QJsonObject parametersToJson() const override;
    VoidResult parametersFromJson(const QJsonObject& params) override;

private:
    QString m_baseUrl;
    QString m_model;
    double m_temperature = 1.0;
    int m_maxTokens = 4096;
    double m_topP = 0.95;
    double m_frequencyPenalty = 0.0;
    double m_presencePenalty = 0.0;

    QJsonArray buildMessages(const QString& prompt) const;
};
