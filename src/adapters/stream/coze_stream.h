#pragma once
#include "semantic/stream_decoder.h"
#include "semantic/features/sse_line_splitter.h"
#include <QJsonObject>

// Coze v3 chat event stream. The phase only moves forward; it decides whether
// a data payload is content, bookkeeping or a terminal signal.
class CozeStreamDecoder : public DeltaStreamDecoder {
public:
    enum class Phase : quint8 {
        Idle,
        Created,
        InProgress,
        Streaming,
        Muted,
        Completed,
        Failed
    };

    QString providerId() const override;
    Phase phase() const { return m_phase; }

    // Drops embedded {"msg_type":...} metadata from an answer fragment.
    static QString stripMetadata(const QString& content);

protected:
    void decodeChunk(const QByteArray& chunk, DecodeBatch& batch) override;
    void decodeTail(DecodeBatch& batch) override;

private:
    SseLineSplitter m_splitter;
    QString m_event;
    Phase m_phase = Phase::Idle;

    void handleLine(const QByteArray& line, DecodeBatch& batch);
    void handleData(const QByteArray& payload, DecodeBatch& batch);
    void handleDelta(const QJsonObject& data, DecodeBatch& batch);
    void handleFailed(const QJsonObject& data, DecodeBatch& batch);
    void advance(Phase next);
};
