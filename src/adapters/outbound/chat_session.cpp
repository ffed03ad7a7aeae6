#include "chat_session.h"
#include "semantic/stream_session.h"
#include "core/log_manager.h"
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <limits>

ChatSession::ChatSession(ProviderKind kind)
    : m_kind(kind)
    , m_time(QDateTime::currentDateTime().toString(Qt::ISODate))
{
}

QString ChatSession::currentTime()
{
    return QDateTime::currentDateTime().toString(QStringLiteral("HH:mm"));
}

VoidResult ChatSession::checkKey(const ApiKey& key) const
{
    if (key.type != m_kind) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("provider.key_mismatch"),
            QStringLiteral("API key '%1' is for %2, not %3")
                .arg(key.name, providerKindToString(key.type), providerKindToString(m_kind))));
    }
    if (key.key.isEmpty()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("provider.missing_key"), QStringLiteral("API key is empty")));
    }
    return {};
}

Result<QString> ChatSession::generateStreaming(IStreamExecutor& executor, const ApiKey& key,
                                               const QString& prompt, const DeltaSink& sink)
{
    if (auto ok = checkKey(key); !ok)
        return std::unexpected(ok.error());
    if (prompt.trimmed().isEmpty()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("provider.empty_prompt"), QStringLiteral("prompt is empty")));
    }

    const ProviderRequest request = buildRequest(key, prompt);
    std::unique_ptr<IStreamDecoder> decoder = createDecoder();

    StreamSession session(executor, *decoder, sink);
    Result<StreamOutcome> outcome = session.run(request);
    if (!outcome)
        return std::unexpected(outcome.error());

    if (outcome->isDegraded()) {
        LOG_WARNING(QStringLiteral("%1: response had no extractable text").arg(providerKindToString(m_kind)));
    }

    const QString now = currentTime();
    m_history.append(TranscriptMessage{MessageRole::User, prompt, now});
    m_history.append(TranscriptMessage{MessageRole::Assistant, outcome->text, now});
    return outcome->text;
}

Result<QString> ChatSession::regenerateStreaming(IStreamExecutor& executor, const ApiKey& key,
                                                 const DeltaSink& sink)
{
    if (auto ok = checkKey(key); !ok)
        return std::unexpected(ok.error());

    const QList<TranscriptMessage> saved = m_history;
    Result<QString> prompt = withdrawLast();
    if (!prompt)
        return prompt;

    Result<QString> reply = generateStreaming(executor, key, *prompt, sink);
    if (!reply)
        m_history = saved;
    return reply;
}

Result<QString> ChatSession::withdrawLast()
{
    qsizetype lastUser = m_history.size() - 1;
    while (lastUser >= 0 && m_history[lastUser].role != MessageRole::User)
        --lastUser;

    if (lastUser < 0) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("provider.nothing_to_withdraw"),
            QStringLiteral("No user message to withdraw")));
    }

    const QString prompt = m_history[lastUser].content;
    m_history.resize(lastUser);
    return prompt;
}

void ChatSession::clear()
{
    m_history.clear();
}

void ChatSession::loadFrom(const ChatTranscript& transcript)
{
    m_chatId = transcript.id;
    m_title = transcript.title;
    m_time = transcript.time;
    m_history = transcript.messages;
}

ChatTranscript ChatSession::saveTo() const
{
    ChatTranscript t;
    t.id = m_chatId;
    t.title = m_title;
    t.time = m_time;
    t.messages = m_history;
    return t;
}

QString ChatSession::serialize() const
{
    QJsonObject root = saveTo().toJson();
    root[QStringLiteral("provider")] = providerKindToString(m_kind);
    root[QStringLiteral("system_prompt")] = m_systemPrompt;
    root[QStringLiteral("parameters")] = parametersToJson();
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Compact));
}

VoidResult ChatSession::deserialize(const QString& data)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(data.toUtf8(), &err);
    if (!doc.isObject()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("provider.bad_snapshot"),
            QStringLiteral("Snapshot is not a JSON object: %1").arg(err.errorString())));
    }

    const QJsonObject root = doc.object();
    const auto provider = providerKindFromString(root.value(QStringLiteral("provider")).toString());
    if (!provider || *provider != m_kind) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("provider.snapshot_mismatch"),
            QStringLiteral("Snapshot belongs to '%1', not %2")
                .arg(root.value(QStringLiteral("provider")).toString(), providerKindToString(m_kind))));
    }

    if (auto ok = parametersFromJson(root.value(QStringLiteral("parameters")).toObject()); !ok)
        return ok;

    m_systemPrompt = root.value(QStringLiteral("system_prompt")).toString();
    loadFrom(ChatTranscript::fromJson(root));
    return {};
}

Result<double> ChatSession::parseDouble(const QString& key, const QString& value)
{
    bool ok = false;
    const double v = value.trimmed().toDouble(&ok);
    if (!ok) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("provider.bad_parameter"),
            QStringLiteral("Invalid %1 value: %2").arg(key, value)));
    }
    return v;
}

Result<int> ChatSession::parseCount(const QString& key, const QString& value)
{
    bool ok = false;
    const uint v = value.trimmed().toUInt(&ok);
    if (!ok || v > static_cast<uint>(std::numeric_limits<int>::max())) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("provider.bad_parameter"),
            QStringLiteral("Invalid %1 value: %2").arg(key, value)));
    }
    return static_cast<int>(v);
}

VoidResult ChatSession::unknownParameter(const QString& key)
{
    return std::unexpected(DomainFailure::invalidInput(
        QStringLiteral("provider.unknown_parameter"),
        QStringLiteral("Unknown parameter: %1").arg(key)));
}
