#include "transcript.h"
#include <QJsonArray>

QString roleToString(MessageRole role)
{
    switch (role) {
    case MessageRole::User:      return QStringLiteral("user");
    case MessageRole::Assistant: return QStringLiteral("assistant");
    case MessageRole::System:    return QStringLiteral("system");
    }
    return QStringLiteral("user");
}

MessageRole roleFromString(const QString& role)
{
    if (role == QStringLiteral("assistant"))
        return MessageRole::Assistant;
    if (role == QStringLiteral("system"))
        return MessageRole::System;
    return MessageRole::User;
}

QJsonObject ChatTranscript::toJson() const
{
    QJsonArray content;
    for (const auto& msg : messages) {
        QJsonObject m;
        m[QStringLiteral("role")] = roleToString(msg.role);
        m[QStringLiteral("content")] = msg.content;
        m[QStringLiteral("time")] = msg.time;
        content.append(m);
    }

    QJsonObject obj;
    obj[QStringLiteral("id")] = static_cast<qint64>(id);
    obj[QStringLiteral("title")] = title;
    obj[QStringLiteral("time")] = time;
    obj[QStringLiteral("content")] = content;
    return obj;
}

ChatTranscript ChatTranscript::fromJson(const QJsonObject& obj)
{
    ChatTranscript t;
    t.id = static_cast<quint32>(obj.value(QStringLiteral("id")).toInteger());
    t.title = obj.value(QStringLiteral("title")).toString();
    t.time = obj.value(QStringLiteral("time")).toString();
    const QJsonArray content = obj.value(QStringLiteral("content")).toArray();
    for (const QJsonValue& v : content) {
        const QJsonObject m = v.toObject();
        TranscriptMessage msg;
        msg.role = roleFromString(m.value(QStringLiteral("role")).toString());
        msg.content = m.value(QStringLiteral("content")).toString();
        msg.time = m.value(QStringLiteral("time")).toString();
        t.messages.append(msg);
    }
    return t;
}
