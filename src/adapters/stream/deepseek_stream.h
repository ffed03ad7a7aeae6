#pragma once
#include "semantic/stream_decoder.h"
#include "semantic/features/sse_line_splitter.h"

// OpenAI-compatible chat completion chunks: data: {"choices":[{"delta":{...}}]}
class DeepSeekStreamDecoder : public DeltaStreamDecoder {
public:
    QString providerId() const override;
    bool sawDone() const { return m_done; }

protected:
    void decodeChunk(const QByteArray& chunk, DecodeBatch& batch) override;
    void decodeTail(DecodeBatch& batch) override;

private:
    SseLineSplitter m_splitter;
    bool m_done = false;

    void handleLine(const QByteArray& line, DecodeBatch& batch);
};
