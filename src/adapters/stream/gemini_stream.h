#pragma once
#include "semantic/stream_decoder.h"
#include "semantic/features/json_array_chunker.h"
#include <QJsonObject>

// Decodes the raw (non-SSE) streamGenerateContent body: one JSON array whose
// elements arrive incrementally.
class GeminiStreamDecoder : public DeltaStreamDecoder {
public:
    QString providerId() const override;

protected:
    void decodeChunk(const QByteArray& chunk, DecodeBatch& batch) override;
    void decodeTail(DecodeBatch& batch) override;

private:
    JsonArrayChunker m_chunker;

    void handleObject(const QByteArray& object, DecodeBatch& batch);
    static QStringList blockedCategories(const QJsonObject& candidate);
};
