#include "coze.h"
#include "adapters/stream/coze_stream.h"
#include <QJsonArray>
#include <QJsonDocument>

CozeChat::CozeChat(const ProviderEndpoints& endpoints)
    : ChatSession(ProviderKind::Coze)
    , m_chatUrl(endpoints.cozeChatUrl)
    , m_botId(endpoints.cozeBotId)
    , m_userId(endpoints.cozeUserId)
{
}

std::unique_ptr<IStreamDecoder> CozeChat::createDecoder() const
{
    return std::make_unique<CozeStreamDecoder>();
}

ProviderRequest CozeChat::buildRequest(const ApiKey& key, const QString& prompt) const
{
    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.adapterHint = QStringLiteral("coze");
    pr.url = m_chatUrl;

    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    pr.headers[QStringLiteral("Authorization")] =
        key.key.startsWith(QStringLiteral("Bearer ")) ? key.key : QStringLiteral("Bearer ") + key.key;

    QJsonObject body;
    body[QStringLiteral("bot_id")] = m_botId;
    body[QStringLiteral("user_id")] = m_userId;
    body[QStringLiteral("stream")] = true;
    body[QStringLiteral("auto_save_history")] = false;
    body[QStringLiteral("additional_messages")] = buildAdditionalMessages(prompt);

    pr.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    return pr;
}

QJsonArray CozeChat::buildAdditionalMessages(const QString& prompt) const
{
    auto makeMessage = [](const QString& role, const QString& content) {
        QJsonObject m;
        m[QStringLiteral("role")] = role;
        m[QStringLiteral("content")] = content;
        m[QStringLiteral("content_type")] = QStringLiteral("text");
        return m;
    };

    QJsonArray messages;
    // The v3 chat API has no system role.
    if (!systemPrompt().isEmpty())
        messages.append(makeMessage(QStringLiteral("assistant"), systemPrompt()));
    for (const auto& msg : history()) {
        if (msg.role == MessageRole::System)
            continue;
        messages.append(makeMessage(roleToString(msg.role), msg.content));
    }
    messages.append(makeMessage(QStringLiteral("user"), prompt));
    return messages;
}

VoidResult CozeChat::setParameter(const QString& key, const QString& value)
{
    if (key.trimmed().isEmpty()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("provider.bad_parameter"), QStringLiteral("parameter name is empty")));
    }
    m_parameters.insert(key, value);
    return {};
}

QJsonObject CozeChat::parametersToJson() const
{
    QJsonObject params;
    for (auto it = m_parameters.constBegin(); it != m_parameters.constEnd(); ++it)
        params[it.key()] = it.value();
    return params;
}

VoidResult CozeChat::parametersFromJson(const QJsonObject& params)
{
    QMap<QString, QString> loaded;
    for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
        if (!it.value().isString()) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("provider.bad_snapshot"),
                QStringLiteral("parameter '%1' is not a string").arg(it.key())));
        }
        loaded.insert(it.key(), it.value().toString());
    }
    m_parameters = loaded;
    return {};
}
