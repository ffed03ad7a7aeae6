#pragma once
#include "types.h"
#include <QList>
#include <QString>
#include <QJsonObject>

struct TranscriptMessage {
    MessageRole role = MessageRole::User;
    QString content;
    QString time;
};

struct ChatTranscript {
    quint32 id = 0;
    QString title;
    QString time;
    QList<TranscriptMessage> messages;

    QJsonObject toJson() const;
    static ChatTranscript fromJson(const QJsonObject& obj);
};

QString roleToString(MessageRole role);
MessageRole roleFromString(const QString& role);
