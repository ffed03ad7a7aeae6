#include "failure.h"
#include <QJsonArray>

QString DomainFailure::kindName() const {
    switch (kind) {
    case ErrorKind::ConnectionError:   return QStringLiteral("connection_error");
    case ErrorKind::HttpError:         return QStringLiteral("http_error");
    case ErrorKind::MalformedChunk:    return QStringLiteral("malformed_chunk");
    case ErrorKind::SafetyBlocked:     return QStringLiteral("safety_blocked");
    case ErrorKind::ProtocolViolation: return QStringLiteral("protocol_violation");
    case ErrorKind::Timeout:           return QStringLiteral("timeout");
    case ErrorKind::EmptyResult:       return QStringLiteral("empty_result");
    case ErrorKind::InvalidInput:      return QStringLiteral("invalid_input");
    case ErrorKind::Internal:          return QStringLiteral("internal");
    }
    return QStringLiteral("internal");
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject err;
    err["kind"] = kindName();
    err["code"] = code;
    err["message"] = message;
    if (!details.isEmpty())
        err["details"] = QJsonArray::fromStringList(details);
    if (statusCode != 0)
        err["status"] = statusCode;
    QJsonObject root;
    root["error"] = err;
    return root;
}

DomainFailure DomainFailure::connection(const QString& msg) {
    return {ErrorKind::ConnectionError, "connection_error", msg, {}, 0};
}

DomainFailure DomainFailure::httpStatus(int status, const QString& msg) {
    return {ErrorKind::HttpError, QStringLiteral("http_%1").arg(status), msg, {}, status};
}

DomainFailure DomainFailure::malformedChunk(const QString& msg) {
    return {ErrorKind::MalformedChunk, "malformed_chunk", msg, {}, 0};
}

DomainFailure DomainFailure::safetyBlocked(const QStringList& categories) {
    QString msg = QStringLiteral("Content blocked due to safety concerns");
    if (!categories.isEmpty())
        msg += QStringLiteral(": ") + categories.join(QStringLiteral(", "));
    return {ErrorKind::SafetyBlocked, "safety_blocked", msg, categories, 0};
}

DomainFailure DomainFailure::protocolViolation(const QString& code, const QString& msg) {
    return {ErrorKind::ProtocolViolation, code, msg, {}, 0};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, "timeout", msg, {}, 0};
}

DomainFailure DomainFailure::emptyResult(const QString& code, const QString& msg) {
    return {ErrorKind::EmptyResult, code, msg, {}, 0};
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg, {}, 0};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg, {}, 0};
}
