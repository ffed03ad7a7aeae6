#pragma once
#include <optional>
#include <QByteArray>
#include <QList>

// Splits a streamed top-level JSON array ("[{...},{...}]") into its element
// objects as the bytes arrive. Works on raw bytes: every structural character
// is ASCII, so a chunk boundary inside a multi-byte UTF-8 sequence is harmless.
//
// State invariants:
//   depth == 0  outside the enclosing array
//   depth == 1  between array elements
//   depth  > 1  inside an element; bytes are copied into the buffer
class JsonArrayChunker {
public:
    QList<QByteArray> feed(const QByteArray& chunk);

    // Returns the unterminated remainder, if any, and resets the chunker.
    std::optional<QByteArray> finish();

    void reset();

    int depth() const { return m_depth; }
    bool inString() const { return m_inString; }
    bool pending() const { return !m_buffer.isEmpty(); }

private:
    QByteArray m_buffer;
    int m_depth = 0;
    bool m_inString = false;
    bool m_escaped = false;

    void appendInside(char c);
};
