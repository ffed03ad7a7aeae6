#include "wolfram_session.h"
#include "core/log_manager.h"
#include <QDateTime>
#include <QJsonDocument>

namespace {

QString compact(const QJsonObject& obj)
{
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

std::optional<QString> stringField(const QJsonObject& obj, const char* key)
{
    const QJsonValue v = obj.value(QString::fromUtf8(key));
    if (v.isString())
        return v.toString();
    return std::nullopt;
}

}

WolframQuerySession::WolframQuerySession(const WolframOptions& options)
    : m_options(options)
{
}

QString WolframQuerySession::stopReasonName(StopReason reason)
{
    switch (reason) {
    case StopReason::None:              return "none";
    case StopReason::QueryCompleted:    return "query_completed";
    case StopReason::ConnectionClosed:  return "connection_closed";
    case StopReason::MessageCapReached: return "message_cap_reached";
    case StopReason::TimedOut:          return "timed_out";
    }
    return "unknown";
}

QString WolframQuerySession::encodeQueryInput(const QString& query)
{
    QJsonObject entry;
    entry["t"] = 0;
    entry["v"] = query;
    const QByteArray envelope = QJsonDocument(QJsonArray{entry}).toJson(QJsonDocument::Compact);
    return QString::fromLatin1(envelope.toBase64());
}

QJsonObject WolframQuerySession::buildInitMessage(qint64 expiryMs) const
{
    QJsonObject msg;
    msg["category"] = m_options.category;
    msg["type"] = "init";
    msg["lang"] = m_options.language;
    msg["wa_pro_s"] = "";
    msg["wa_pro_t"] = "";
    msg["wa_pro_u"] = "";
    msg["exp"] = expiryMs;
    msg["displayDebuggingInfo"] = false;
    msg["messages"] = QJsonArray();
    return msg;
}

QJsonObject WolframQuerySession::buildQueryMessage(const QString& query) const
{
    QJsonObject msg;
    msg["type"] = "newQuery";
    msg["locationId"] = m_options.locationId;
    msg["language"] = m_options.language;
    msg["displayDebuggingInfo"] = false;
    msg["yellowIsError"] = false;
    msg["requestSidebarAd"] = false;
    msg["category"] = m_options.category;
    msg["input"] = encodeQueryInput(query);
    msg["i2d"] = true;
    msg["assumption"] = QJsonArray();
    msg["apiParams"] = QJsonObject();
    msg["file"] = QJsonValue::Null;
    msg["theme"] = m_options.theme;
    return msg;
}

Result<WolframResults> WolframQuerySession::run(IGatewayChannel& channel, const QString& query, bool imageOnly)
{
    if (m_used)
        return std::unexpected(DomainFailure::invalidInput("wolfram.session_reused",
                                                           "a query session can only run once"));
    m_used = true;

    LOG_INFO(QString("wolfram: query '%1' (image_only=%2)").arg(query).arg(imageOnly));

    auto opened = channel.open(QUrl(m_options.gatewayUrl), m_options.handshakeTimeout);
    if (!opened) {
        LOG_ERROR(QString("wolfram: connect failed: %1").arg(opened.error().message));
        return std::unexpected(opened.error());
    }

    auto ready = handshake(channel);
    if (!ready)
        return std::unexpected(ready.error());

    auto sent = channel.sendText(compact(buildQueryMessage(query)));
    if (!sent)
        return std::unexpected(sent.error());

    auto results = collect(channel, imageOnly);
    if (!results)
        return results;

    LOG_INFO(QString("wolfram: collected %1 results in %2 messages (%3)")
                 .arg(results->size())
                 .arg(m_messageCount)
                 .arg(stopReasonName(m_stopReason)));

    if (results->isEmpty())
        return std::unexpected(DomainFailure::emptyResult("wolfram.no_pods_found",
                                                          "Query failed or returned no pods"));
    return results;
}

VoidResult WolframQuerySession::handshake(IGatewayChannel& channel)
{
    auto sent = channel.sendText(compact(buildInitMessage(QDateTime::currentMSecsSinceEpoch())));
    if (!sent)
        return sent;

    auto reply = channel.receive(m_options.handshakeTimeout);
    if (!reply) {
        if (reply.error().kind == ErrorKind::Timeout) {
            LOG_ERROR(QString("wolfram: no handshake response within %1 ms").arg(m_options.handshakeTimeout));
            return std::unexpected(DomainFailure::timeout("wolfram handshake timed out"));
        }
        return std::unexpected(reply.error());
    }

    if (reply->kind != GatewayMessage::Kind::Text) {
        return std::unexpected(DomainFailure::protocolViolation(
            "wolfram.unexpected_message", "Received unexpected message type during handshake"));
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(reply->text.toUtf8(), &err);
    if (!doc.isObject()) {
        return std::unexpected(DomainFailure::protocolViolation(
            "wolfram.malformed_init", QString("Invalid handshake response: %1").arg(err.errorString())));
    }

    if (doc.object().value("type").toString() != "ready") {
        DomainFailure failure = DomainFailure::protocolViolation(
            "wolfram.init_not_ready", "Initial connection response not ready");
        failure.details.append(reply->text);
        LOG_ERROR(QString("wolfram: init not ready: %1").arg(reply->text.left(200)));
        return std::unexpected(failure);
    }
    return {};
}

Result<WolframResults> WolframQuerySession::collect(IGatewayChannel& channel, bool imageOnly)
{
    WolframResults results;

    while (true) {
        auto message = channel.receive(m_options.messageTimeout);
        if (!message) {
            if (message.error().kind != ErrorKind::Timeout)
                return std::unexpected(message.error());

            m_stopReason = StopReason::TimedOut;
            if (results.isEmpty())
                return std::unexpected(DomainFailure::timeout("wolfram result collection timed out"));
            LOG_WARNING(QString("wolfram: timed out after %1 results, returning partial answer").arg(results.size()));
            break;
        }

        ++m_messageCount;
        if (m_messageCount > m_options.maxMessages) {
            m_stopReason = StopReason::MessageCapReached;
            LOG_WARNING(QString("wolfram: message cap (%1) reached, stopping").arg(m_options.maxMessages));
            break;
        }

        if (message->kind == GatewayMessage::Kind::Close) {
            m_stopReason = StopReason::ConnectionClosed;
            break;
        }
        if (message->kind == GatewayMessage::Kind::Binary) {
            LOG_DEBUG("wolfram: binary message ignored");
            continue;
        }

        QJsonParseError err;
        const QJsonDocument doc = QJsonDocument::fromJson(message->text.toUtf8(), &err);
        if (!doc.isObject()) {
            LOG_WARNING(QString("wolfram: skipped malformed message #%1: %2")
                            .arg(m_messageCount).arg(err.errorString()));
            continue;
        }

        const QJsonObject obj = doc.object();
        const QString type = obj.value("type").toString();
        if (type == "queryCompleted" || type == "queryComplete") {
            m_stopReason = StopReason::QueryCompleted;
            break;
        }
        if (type == "pods") {
            mergeMessage(obj, imageOnly, results);
        } else if (type.isEmpty()) {
            LOG_WARNING("wolfram: message without type field");
        } else {
            LOG_DEBUG(QString("wolfram: unhandled message type '%1'").arg(type));
        }
    }

    return results;
}

void WolframQuerySession::mergeMessage(const QJsonObject& message, bool imageOnly, WolframResults& results)
{
    QStringList related;
    for (const auto& q : message.value("relatedQueries").toArray()) {
        if (q.isString())
            related.append(q.toString());
    }
    if (!related.isEmpty()) {
        if (results.isEmpty()) {
            WolframResult holder;
            holder.relatedQueries = related;
            results.append(holder);
        } else {
            results.last().relatedQueries.append(related);
        }
    }

    for (const auto& podValue : message.value("pods").toArray()) {
        const QJsonObject pod = podValue.toObject();
        if (!pod.value("subpods").isArray())
            continue;

        WolframResult result;
        result.title = stringField(pod, "title");

        for (const auto& subValue : pod.value("subpods").toArray()) {
            const QJsonObject subpod = subValue.toObject();
            if (!imageOnly) {
                if (auto v = stringField(subpod, "plaintext")) result.plaintext = v;
                if (auto v = stringField(subpod, "minput")) result.minput = v;
                if (auto v = stringField(subpod, "moutput")) result.moutput = v;
            }
            const QJsonObject img = subpod.value("img").toObject();
            if (auto v = stringField(img, "data")) result.imgBase64 = v;
            if (auto v = stringField(img, "contenttype")) result.imgContentType = v;
        }
        results.append(result);
    }
}
