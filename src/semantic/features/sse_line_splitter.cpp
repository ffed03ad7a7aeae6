#include "sse_line_splitter.h"

QList<QByteArray> SseLineSplitter::split(const QByteArray& chunk)
{
    QList<QByteArray> lines;
    for (const QByteArray& raw : chunk.split('\n')) {
        const QByteArray line = raw.trimmed();
        if (line.isEmpty() || line.startsWith(':'))
            continue;
        lines.append(line);
    }
    return lines;
}

QList<QByteArray> SseLineSplitter::feed(const QByteArray& chunk)
{
    m_pending.append(chunk);
    const qsizetype lastNewline = m_pending.lastIndexOf('\n');
    if (lastNewline < 0)
        return {};

    const QByteArray complete = m_pending.left(lastNewline + 1);
    m_pending.remove(0, lastNewline + 1);
    return split(complete);
}

QList<QByteArray> SseLineSplitter::flush()
{
    const QByteArray rest = m_pending;
    m_pending.clear();
    return split(rest);
}

bool SseLineSplitter::isField(const QByteArray& line, const char* field)
{
    const QByteArray prefix = QByteArray(field) + ':';
    return line.startsWith(prefix);
}

QByteArray SseLineSplitter::fieldValue(const QByteArray& line)
{
    const qsizetype colon = line.indexOf(':');
    if (colon < 0)
        return {};
    return line.mid(colon + 1).trimmed();
}
