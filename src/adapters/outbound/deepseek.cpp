#include "deepseek.h"
#include "adapters/stream/deepseek_stream.h"
#include <QJsonArray>
#include <QJsonDocument>

DeepSeekChat::DeepSeekChat(const ProviderEndpoints& endpoints)
    : ChatSession(ProviderKind::DeepSeek)
    , m_baseUrl(endpoints.deepseekBaseUrl)
    , m_model(endpoints.deepseekModel)
{
}

std::unique_ptr<IStreamDecoder> DeepSeekChat::createDecoder() const
{
    return std::make_unique<DeepSeekStreamDecoder>();
}

ProviderRequest DeepSeekChat::buildRequest(const ApiKey& key, const QString& prompt) const
{
    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.adapterHint = QStringLiteral("deepseek");

    QString baseUrl = m_baseUrl;
    while (baseUrl.endsWith(QLatin1Char('/')))
        baseUrl.chop(1);
    pr.url = baseUrl + QStringLiteral("/chat/completions");

    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    pr.headers[QStringLiteral("Accept")] = QStringLiteral("text/event-stream");
    pr.headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + key.key;

    QJsonObject body;
    body[QStringLiteral("model")] = m_model;
    body[QStringLiteral("messages")] = buildMessages(prompt);
    body[QStringLiteral("stream")] = true;
    body[QStringLiteral("temperature")] = m_temperature;
    body[QStringLiteral("max_tokens")] = m_maxTokens;
    body[QStringLiteral("top_p")] = m_topP;
    body[QStringLiteral("frequency_penalty")] = m_frequencyPenalty;
    body[QStringLiteral("presence_penalty")] = m_presencePenalty;

    pr.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    return pr;
}

QJsonArray DeepSeekChat::buildMessages(const QString& prompt) const
{
    auto makeMessage = [](const QString& role, const QString& content) {
        QJsonObject m;
        m[QStringLiteral("role")] = role;
        m[QStringLiteral("content")] = content;
        return m;
    };

    QJsonArray messages;
    if (!systemPrompt().isEmpty())
        messages.append(makeMessage(QStringLiteral("system"), systemPrompt()));
    for (const auto& msg : history())
        messages.append(makeMessage(roleToString(msg.role), msg.content));
    messages.append(makeMessage(QStringLiteral("user"), prompt));
    return messages;
}

VoidResult DeepSeekChat::setParameter(const QString& key, const QString& value)
{
    double* target = nullptr;
    if (key == QStringLiteral("temperature"))
        target = &m_temperature;
    else if (key == QStringLiteral("top_p"))
        target = &m_topP;
    else if (key == QStringLiteral("frequency_penalty"))
        target = &m_frequencyPenalty;
    else if (key == QStringLiteral("presence_penalty"))
        target = &m_presencePenalty;

    if (target) {
        auto v = parseDouble(key, value);
        if (!v) return std::unexpected(v.error());
        *target = *v;
        return {};
    }

    if (key == QStringLiteral("max_tokens")) {
        auto v = parseCount(key, value);
        if (!v) return std::unexpected(v.error());
        m_maxTokens = *v;
        return {};
    }
    if (key == QStringLiteral("model")) {
        m_model = value.trimmed();
        return {};
    }
    return unknownParameter(key);
}

QJsonObject DeepSeekChat::parametersToJson() const
{
    QJsonObject params;
    params[QStringLiteral("model")] = m_model;
    params[QStringLiteral("temperature")] = m_temperature;
    params[QStringLiteral("max_tokens")] = m_maxTokens;
    params[QStringLiteral("top_p")] = m_topP;
    params[QStringLiteral("frequency_penalty")] = m_frequencyPenalty;
    params[QStringLiteral("presence_penalty")] = m_presencePenalty;
    return params;
}

VoidResult DeepSeekChat::parametersFromJson(const QJsonObject& params)
{
    m_model = params.value(QStringLiteral("model")).toString(m_model);
    m_temperature = params.value(QStringLiteral("temperature")).toDouble(m_temperature);
    m_maxTokens = params.value(QStringLiteral("max_tokens")).toInt(m_maxTokens);
    m_topP = params.value(QStringLiteral("top_p")).toDouble(m_topP);
    m_frequencyPenalty = params.value(QStringLiteral("frequency_penalty")).toDouble(m_frequencyPenalty);
    m_presencePenalty = params.value(QStringLiteral("presence_penalty")).toDouble(m_presencePenalty);
    return {};
}
