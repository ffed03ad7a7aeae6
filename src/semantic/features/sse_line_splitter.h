#pragma once
#include <QByteArray>
#include <QList>

// Turns text/event-stream bytes into logical lines ("event: ...", "data: ...").
// Lines are trimmed; blank separators and ":" comment lines are dropped.
// Classifying the lines is left to the provider decoders.
class SseLineSplitter {
public:
    static QList<QByteArray> split(const QByteArray& chunk);

    // Buffered variant for network reads: a line cut by the chunk boundary is
    // held back until its terminating newline arrives.
    QList<QByteArray> feed(const QByteArray& chunk);
    QList<QByteArray> flush();

    static bool isField(const QByteArray& line, const char* field);
    static QByteArray fieldValue(const QByteArray& line);

private:
    QByteArray m_pending;
};
