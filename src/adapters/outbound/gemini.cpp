#include "gemini.h"
#include "adapters/stream/gemini_stream.h"
#include <QJsonArray>
#include <QJsonDocument>

GeminiChat::GeminiChat(const ProviderEndpoints& endpoints)
    : ChatSession(ProviderKind::Gemini)
    , m_baseUrl(endpoints.geminiBaseUrl)
    , m_model(endpoints.geminiModel)
{
}

std::unique_ptr<IStreamDecoder> GeminiChat::createDecoder() const
{
    return std::make_unique<GeminiStreamDecoder>();
}

ProviderRequest GeminiChat::buildRequest(const ApiKey& key, const QString& prompt) const
{
    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.adapterHint = QStringLiteral("gemini");

    QString baseUrl = m_baseUrl;
    while (baseUrl.endsWith(QLatin1Char('/')))
        baseUrl.chop(1);

    // No alt=sse: the body is one JSON array streamed element by element.
    pr.url = baseUrl + QStringLiteral("/models/") + m_model
             + QStringLiteral(":streamGenerateContent?key=") + key.key;
    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");

    QJsonObject body;
    body[QStringLiteral("contents")] = buildContents(prompt);

    if (!systemPrompt().isEmpty()) {
        QJsonObject part;
        part[QStringLiteral("text")] = systemPrompt();
        QJsonObject sysObj;
        sysObj[QStringLiteral("parts")] = QJsonArray{part};
        body[QStringLiteral("systemInstruction")] = sysObj;
    }

    body[QStringLiteral("generationConfig")] = buildGenerationConfig();
    body[QStringLiteral("safetySettings")] = buildSafetySettings();

    pr.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    return pr;
}

QJsonArray GeminiChat::buildContents(const QString& prompt) const
{
    auto makeContent = [](const QString& role, const QString& text) {
        QJsonObject part;
        part[QStringLiteral("text")] = text;
        QJsonObject content;
        content[QStringLiteral("role")] = role;
        content[QStringLiteral("parts")] = QJsonArray{part};
        return content;
    };

    QJsonArray contents;
    for (const auto& msg : history()) {
        if (msg.role == MessageRole::System)
            continue;  // carried by systemInstruction
        const QString role = msg.role == MessageRole::Assistant ? QStringLiteral("model")
                                                                : QStringLiteral("user");
        contents.append(makeContent(role, msg.content));
    }
    contents.append(makeContent(QStringLiteral("user"), prompt));
    return contents;
}

QJsonObject GeminiChat::buildGenerationConfig() const
{
    QJsonObject config;
    config[QStringLiteral("temperature")] = m_temperature;
    config[QStringLiteral("topP")] = m_topP;
    config[QStringLiteral("topK")] = m_topK;
    config[QStringLiteral("maxOutputTokens")] = m_maxTokens;
    return config;
}

QJsonArray GeminiChat::buildSafetySettings()
{
    static const char* const kCategories[] = {
        "HARM_CATEGORY_HARASSMENT",
        "HARM_CATEGORY_HATE_SPEECH",
        "HARM_CATEGORY_SEXUALLY_EXPLICIT",
        "HARM_CATEGORY_DANGEROUS_CONTENT",
    };

    QJsonArray settings;
    for (const char* category : kCategories) {
        QJsonObject s;
        s[QStringLiteral("category")] = QString::fromLatin1(category);
        s[QStringLiteral("threshold")] = QStringLiteral("BLOCK_NONE");
        settings.append(s);
    }
    return settings;
}

VoidResult GeminiChat::setParameter(const QString& key, const QString& value)
{
    if (key == QStringLiteral("temperature")) {
        auto v = parseDouble(key, value);
        if (!v) return std::unexpected(v.error());
        m_temperature = *v;
    } else if (key == QStringLiteral("max_tokens")) {
        auto v = parseCount(key, value);
        if (!v) return std::unexpected(v.error());
        m_maxTokens = *v;
    } else if (key == QStringLiteral("top_p")) {
        auto v = parseDouble(key, value);
        if (!v) return std::unexpected(v.error());
        m_topP = *v;
    } else if (key == QStringLiteral("top_k")) {
        auto v = parseCount(key, value);
        if (!v) return std::unexpected(v.error());
        m_topK = *v;
    } else if (key == QStringLiteral("model")) {
        m_model = value.trimmed();
    } else {
        return unknownParameter(key);
    }
    return {};
}

QJsonObject GeminiChat::parametersToJson() const
{
    QJsonObject params;
    params[QStringLiteral("model")] = m_model;
    params[QStringLiteral("temperature")] = m_temperature;
    params[QStringLiteral("max_tokens")] = m_maxTokens;
    params[QStringLiteral("top_p")] = m_topP;
    params[QStringLiteral("top_k")] = m_topK;
    return params;
}

VoidResult GeminiChat::parametersFromJson(const QJsonObject& params)
{
    m_model = params.value(QStringLiteral("model")).toString(m_model);
    m_temperature = params.value(QStringLiteral("temperature")).toDouble(m_temperature);
    m_maxTokens = params.value(QStringLiteral("max_tokens")).toInt(m_maxTokens);
    m_topP = params.value(QStringLiteral("top_p")).toDouble(m_topP);
    m_topK = params.value(QStringLiteral("top_k")).toInt(m_topK);
    return {};
}
