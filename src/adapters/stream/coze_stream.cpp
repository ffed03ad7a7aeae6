#include "coze_stream.h"
#include "core/log_manager.h"
#include <QJsonDocument>

namespace {

const QString kChatCreated     = QStringLiteral("conversation.chat.created");
const QString kChatInProgress  = QStringLiteral("conversation.chat.in_progress");
const QString kMessageDelta    = QStringLiteral("conversation.message.delta");
const QString kMessageComplete = QStringLiteral("conversation.message.completed");
const QString kChatCompleted   = QStringLiteral("conversation.chat.completed");
const QString kChatFailed      = QStringLiteral("conversation.chat.failed");

const QString kMetadataMarker  = QStringLiteral("{\"msg_type\":");

QString phaseName(CozeStreamDecoder::Phase phase)
{
    switch (phase) {
    case CozeStreamDecoder::Phase::Idle:       return QStringLiteral("idle");
    case CozeStreamDecoder::Phase::Created:    return QStringLiteral("created");
    case CozeStreamDecoder::Phase::InProgress: return QStringLiteral("in_progress");
    case CozeStreamDecoder::Phase::Streaming:  return QStringLiteral("streaming");
    case CozeStreamDecoder::Phase::Muted:      return QStringLiteral("muted");
    case CozeStreamDecoder::Phase::Completed:  return QStringLiteral("completed");
    case CozeStreamDecoder::Phase::Failed:     return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

} // namespace

QString CozeStreamDecoder::providerId() const
{
    return QStringLiteral("coze");
}

QString CozeStreamDecoder::stripMetadata(const QString& content)
{
    const qsizetype marker = content.indexOf(kMetadataMarker);
    if (marker >= 0) {
        const QString before = content.left(marker);
        if (before.trimmed().isEmpty())
            return {};
        return before;
    }

    // No inline marker: the whole fragment may still be a metadata object.
    const QString trimmed = content.trimmed();
    if (trimmed.startsWith(QLatin1Char('{')) && trimmed.contains(QStringLiteral("\"msg_type\"")))
        return {};
    return content;
}

void CozeStreamDecoder::decodeChunk(const QByteArray& chunk, DecodeBatch& batch)
{
    const QList<QByteArray> lines = m_splitter.feed(chunk);
    for (const QByteArray& line : lines) {
        handleLine(line, batch);
        if (isTerminated())
            return;
    }
}

void CozeStreamDecoder::decodeTail(DecodeBatch& batch)
{
    const QList<QByteArray> lines = m_splitter.flush();
    for (const QByteArray& line : lines) {
        handleLine(line, batch);
        if (isTerminated())
            return;
    }
}

void CozeStreamDecoder::handleLine(const QByteArray& line, DecodeBatch& batch)
{
    if (SseLineSplitter::isField(line, "event")) {
        m_event = QString::fromUtf8(SseLineSplitter::fieldValue(line));
        return;
    }
    if (SseLineSplitter::isField(line, "data")) {
        handleData(SseLineSplitter::fieldValue(line), batch);
        return;
    }
    // id:, retry: and anything else carry nothing we use
}

void CozeStreamDecoder::handleData(const QByteArray& payload, DecodeBatch& batch)
{
    if (payload.isEmpty() || payload == "[DONE]")
        return;

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        skipFragment(err.error != QJsonParseError::NoError ? err.errorString()
                                                           : QStringLiteral("payload is not an object"),
                     payload);
        return;
    }
    const QJsonObject data = doc.object();

    if (m_event == kChatCreated) {
        advance(Phase::Created);
    } else if (m_event == kChatInProgress) {
        advance(Phase::InProgress);
    } else if (m_event == kMessageDelta) {
        handleDelta(data, batch);
    } else if (m_event == kMessageComplete) {
        advance(Phase::Muted);
    } else if (m_event == kChatCompleted) {
        advance(Phase::Completed);
        terminate();
    } else if (m_event == kChatFailed) {
        handleFailed(data, batch);
    } else {
        if (data.value(QStringLiteral("status")).toString() == QStringLiteral("failed")) {
            handleFailed(data, batch);
            return;
        }
        if (m_phase >= Phase::Muted)
            return;
        const QJsonValue content = data.value(QStringLiteral("content"));
        if (content.isString())
            emitDelta(batch, content.toString());
    }
}

void CozeStreamDecoder::handleDelta(const QJsonObject& data, DecodeBatch& batch)
{
    if (m_phase >= Phase::Muted) {
        LOG_DEBUG(QStringLiteral("coze: delta after message completion ignored"));
        return;
    }
    advance(Phase::Streaming);

    const QJsonValue type = data.value(QStringLiteral("type"));
    if (!type.isUndefined() && type.toString() != QStringLiteral("answer"))
        return;

    QJsonValue content = data.value(QStringLiteral("content"));
    if (!content.isString())
        content = data.value(QStringLiteral("data")).toObject().value(QStringLiteral("content"));
    if (!content.isString())
        return;

    emitDelta(batch, stripMetadata(content.toString()));
}

void CozeStreamDecoder::handleFailed(const QJsonObject& data, DecodeBatch& batch)
{
    advance(Phase::Failed);

    DomainFailure failure = DomainFailure::protocolViolation(
        QStringLiteral("coze.chat_failed"), QStringLiteral("Coze chat failed"));

    const QJsonValue lastError = data.value(QStringLiteral("last_error"));
    if (lastError.isObject()) {
        const QJsonObject errObj = lastError.toObject();
        const QString msg = errObj.value(QStringLiteral("msg")).toString();
        if (!msg.isEmpty())
            failure.message = QStringLiteral("Coze chat failed: %1").arg(msg);
        failure.details.append(QString::fromUtf8(
            QJsonDocument(errObj).toJson(QJsonDocument::Compact)));
    } else if (lastError.isString()) {
        failure.details.append(lastError.toString());
    }
    fail(batch, failure);
}

void CozeStreamDecoder::advance(Phase next)
{
    if (next < m_phase) {
        LOG_DEBUG(QStringLiteral("coze: ignoring phase change %1 -> %2")
                      .arg(phaseName(m_phase), phaseName(next)));
        return;
    }
    m_phase = next;
}
