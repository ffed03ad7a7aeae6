#include "json_array_chunker.h"

QList<QByteArray> JsonArrayChunker::feed(const QByteArray& chunk)
{
    QList<QByteArray> objects;

    for (const char c : chunk) {
        if (m_inString && !m_escaped && c == '\\') {
            m_escaped = true;
            if (m_depth > 1)
                m_buffer.append(c);
            continue;
        }

        // The escaped character is copied as-is and never reinterpreted.
        if (m_inString && m_escaped) {
            m_escaped = false;
            if (m_depth > 1)
                m_buffer.append(c);
            continue;
        }

        if (c == '"') {
            m_inString = !m_inString;
        } else if (!m_inString && (c == '{' || c == '[')) {
            ++m_depth;
        } else if (!m_inString && (c == '}' || c == ']')) {
            if (m_depth > 0)
                --m_depth;
        }

        if (m_depth > 1) {
            appendInside(c);
        } else if (m_depth == 1 && !m_buffer.isEmpty()) {
            // The closing bracket moved depth back to 1 before it could be copied.
            m_buffer.append(c);
            objects.append(m_buffer);
            m_buffer.clear();
        }
        // Separators and the enclosing brackets at depth 0/1 are dropped.
    }

    return objects;
}

std::optional<QByteArray> JsonArrayChunker::finish()
{
    std::optional<QByteArray> remainder;
    if (!m_buffer.isEmpty())
        remainder = m_buffer;
    reset();
    return remainder;
}

void JsonArrayChunker::reset()
{
    m_buffer.clear();
    m_depth = 0;
    m_inString = false;
    m_escaped = false;
}

void JsonArrayChunker::appendInside(char c)
{
    if (!m_inString) {
        m_buffer.append(c);
        return;
    }

    // Raw control characters inside a string would make the object unparseable.
    switch (c) {
    case '\n': m_buffer.append("\\n"); break;
    case '\r': m_buffer.append("\\r"); break;
    case '\t': m_buffer.append("\\t"); break;
    default:   m_buffer.append(c);     break;
    }
}
