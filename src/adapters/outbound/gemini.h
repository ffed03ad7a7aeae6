#pragma once
#include "chat_session.h"
#include "config/config_types.h"

class GeminiChat final : public ChatSession {
public:
    explicit GeminiChat(const ProviderEndpoints& endpoints = {});

    VoidResult setParameter(const QString& key, const QString& value) override;

    ProviderRequest buildRequest(const ApiKey& key, const QString& prompt) const override;
    std::unique_ptr<IStreamDecoder> createDecoder() const override;

    const QString& model() const { return m_model; }
    double temperature() const { return m_temperature; }
    int maxTokens() const { return m_maxTokens; }
    double topP() const { return m_topP; }
    int topK() const { return m_topK; }

protected:
    QJsonObject parametersToJson() const override;
    VoidResult parametersFromJson(const QJsonObject& params) override;

private:
    QString m_baseUrl;
    QString m_model;
    double m_temperature = 0.95;
    int m_maxTokens = 8192;
    double m_topP = 0.95;
    int m_topK = 40;

    QJsonArray buildContents(const QString& prompt) const;
    QJsonObject buildGenerationConfig() const;
    static QJsonArray buildSafetySettings();
};
