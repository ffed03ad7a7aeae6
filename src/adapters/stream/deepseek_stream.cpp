#include "deepseek_stream.h"
#include "core/log_manager.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

QString DeepSeekStreamDecoder::providerId() const
{
    return QStringLiteral("deepseek");
}

void DeepSeekStreamDecoder::decodeChunk(const QByteArray& chunk, DecodeBatch& batch)
{
    const QList<QByteArray> lines = m_splitter.feed(chunk);
    for (const QByteArray& line : lines)
        handleLine(line, batch);
}

void DeepSeekStreamDecoder::decodeTail(DecodeBatch& batch)
{
    const QList<QByteArray> lines = m_splitter.flush();
    for (const QByteArray& line : lines)
        handleLine(line, batch);
}

void DeepSeekStreamDecoder::handleLine(const QByteArray& line, DecodeBatch& batch)
{
    if (m_done || !SseLineSplitter::isField(line, "data"))
        return;

    const QByteArray payload = SseLineSplitter::fieldValue(line);
    if (payload == "[DONE]") {
        LOG_DEBUG(QStringLiteral("deepseek: [DONE] received"));
        m_done = true;
        return;
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        skipFragment(err.error != QJsonParseError::NoError ? err.errorString()
                                                           : QStringLiteral("payload is not an object"),
                     payload);
        return;
    }

    const QJsonArray choices = doc.object().value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty())
        return;

    const QJsonValue content = choices.first().toObject()
                                   .value(QStringLiteral("delta")).toObject()
                                   .value(QStringLiteral("content"));
    if (content.isString())
        emitDelta(batch, content.toString());
}
