#pragma once
#include "ports.h"
#include "outcome.h"
#include <optional>
#include <QStringList>

struct DecodeBatch {
    QStringList deltas;
    std::optional<DomainFailure> failure;
};

// A provider wire-format parser. The decoder produces deltas; whoever drives it
// pulls each batch and hands the deltas on in order.
class IStreamDecoder {
public:
    virtual ~IStreamDecoder() = default;
    virtual QString providerId() const = 0;
    virtual DecodeBatch feed(const QByteArray& chunk) = 0;
    // Called once after the last chunk to drain buffered input.
    virtual DecodeBatch flush() = 0;
    virtual Result<StreamOutcome> finish() = 0;
    virtual bool isTerminated() const = 0;
    virtual int skippedFragments() const = 0;
};

// Bookkeeping shared by the provider decoders: received byte count, the
// accumulated text, skipped fragments and the end-of-stream outcome policy.
class DeltaStreamDecoder : public IStreamDecoder {
public:
    DecodeBatch feed(const QByteArray& chunk) final;
    DecodeBatch flush() final;
    Result<StreamOutcome> finish() final;
    bool isTerminated() const override { return m_terminated; }
    int skippedFragments() const override { return m_skipped; }

    qint64 bytesReceived() const { return m_bytesReceived; }
    const QString& text() const { return m_text; }

protected:
    virtual void decodeChunk(const QByteArray& chunk, DecodeBatch& batch) = 0;
    virtual void decodeTail(DecodeBatch& batch) { Q_UNUSED(batch); }

    void emitDelta(DecodeBatch& batch, const QString& delta);
    void fail(DecodeBatch& batch, const DomainFailure& failure);
    void terminate() { m_terminated = true; }
    void skipFragment(const QString& reason, const QByteArray& fragment);

private:
    qint64 m_bytesReceived = 0;
    QString m_text;
    int m_skipped = 0;
    bool m_terminated = false;
    std::optional<DomainFailure> m_failure;
};
