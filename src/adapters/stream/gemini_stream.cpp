#include "gemini_stream.h"
#include <QJsonArray>
#include <QJsonDocument>

QString GeminiStreamDecoder::providerId() const
{
    return QStringLiteral("gemini");
}

void GeminiStreamDecoder::decodeChunk(const QByteArray& chunk, DecodeBatch& batch)
{
    const QList<QByteArray> objects = m_chunker.feed(chunk);
    for (const QByteArray& object : objects) {
        handleObject(object, batch);
        if (isTerminated())
            return;
    }
}

void GeminiStreamDecoder::decodeTail(DecodeBatch& batch)
{
    Q_UNUSED(batch);
    const std::optional<QByteArray> remainder = m_chunker.finish();
    if (remainder) {
        skipFragment(QStringLiteral("truncated object at end of stream"), *remainder);
    }
}

void GeminiStreamDecoder::handleObject(const QByteArray& object, DecodeBatch& batch)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(object, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        skipFragment(err.errorString(), object);
        return;
    }

    const QJsonObject root = doc.object();

    const QJsonObject errorObj = root.value(QStringLiteral("error")).toObject();
    if (!errorObj.isEmpty()) {
        DomainFailure failure = DomainFailure::protocolViolation(
            QStringLiteral("gemini.stream_error"),
            errorObj.value(QStringLiteral("message")).toString(
                QStringLiteral("Gemini reported an error inside the stream")));
        failure.statusCode = errorObj.value(QStringLiteral("code")).toInt();
        fail(batch, failure);
        return;
    }

    const QJsonArray candidates = root.value(QStringLiteral("candidates")).toArray();
    if (candidates.isEmpty())
        return;  // usage-only element

    const QJsonObject candidate = candidates.first().toObject();

    // A safety stop wins over any text carried by the same element.
    if (candidate.value(QStringLiteral("finishReason")).toString() == QStringLiteral("SAFETY")) {
        fail(batch, DomainFailure::safetyBlocked(blockedCategories(candidate)));
        return;
    }

    const QJsonArray parts = candidate.value(QStringLiteral("content")).toObject()
                                 .value(QStringLiteral("parts")).toArray();
    if (parts.isEmpty())
        return;

    const QJsonValue text = parts.first().toObject().value(QStringLiteral("text"));
    if (text.isString())
        emitDelta(batch, text.toString());
}

QStringList GeminiStreamDecoder::blockedCategories(const QJsonObject& candidate)
{
    QStringList categories;
    const QJsonArray ratings = candidate.value(QStringLiteral("safetyRatings")).toArray();
    for (const QJsonValue& rv : ratings) {
        const QJsonObject rating = rv.toObject();
        if (rating.value(QStringLiteral("blocked")).toBool(false)) {
            const QString category = rating.value(QStringLiteral("category")).toString();
            if (!category.isEmpty())
                categories.append(category);
        }
    }
    return categories;
}
