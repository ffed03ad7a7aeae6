#pragma once
#include "types.h"
#include <QString>
#include <QStringList>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    QStringList details;
    int         statusCode = 0;

    bool isFatal() const { return kind != ErrorKind::MalformedChunk; }
    QString kindName() const;
    QJsonObject toJson() const;

    static DomainFailure connection(const QString& msg);
    static DomainFailure httpStatus(int status, const QString& msg);
    static DomainFailure malformedChunk(const QString& msg);
    static DomainFailure safetyBlocked(const QStringList& categories);
    static DomainFailure protocolViolation(const QString& code, const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure emptyResult(const QString& code, const QString& msg);
    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure internal(const QString& msg);
};
