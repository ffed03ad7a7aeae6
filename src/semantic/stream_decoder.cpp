#include "stream_decoder.h"
#include "core/log_manager.h"

namespace {

constexpr qsizetype kLoggedFragmentLimit = 200;

}

DecodeBatch DeltaStreamDecoder::feed(const QByteArray& chunk)
{
    DecodeBatch batch;
    if (m_terminated || chunk.isEmpty())
        return batch;

    m_bytesReceived += chunk.size();
    decodeChunk(chunk, batch);
    return batch;
}

DecodeBatch DeltaStreamDecoder::flush()
{
    DecodeBatch batch;
    if (!m_terminated)
        decodeTail(batch);
    return batch;
}

Result<StreamOutcome> DeltaStreamDecoder::finish()
{
    if (m_failure) {
        return std::unexpected(*m_failure);
    }

    if (!m_text.isEmpty()) {
        LOG_DEBUG(QStringLiteral("%1: stream completed (%2 chars, %3 bytes)")
                      .arg(providerId())
                      .arg(m_text.size())
                      .arg(m_bytesReceived));
        return StreamOutcome::completed(m_text);
    }

    if (m_bytesReceived > 0) {
        LOG_WARNING(QStringLiteral("%1: received %2 bytes but extracted no text")
                        .arg(providerId())
                        .arg(m_bytesReceived));
        return StreamOutcome::degraded();
    }

    return std::unexpected(DomainFailure::emptyResult(
        QStringLiteral("stream.empty"),
        QStringLiteral("No text generated from the stream")));
}

void DeltaStreamDecoder::emitDelta(DecodeBatch& batch, const QString& delta)
{
    if (delta.isEmpty())
        return;
    m_text += delta;
    batch.deltas.append(delta);
}

void DeltaStreamDecoder::fail(DecodeBatch& batch, const DomainFailure& failure)
{
    LOG_ERROR(QStringLiteral("%1: stream failed [%2]: %3")
                  .arg(providerId(), failure.code, failure.message));
    m_failure = failure;
    m_terminated = true;
    batch.failure = failure;
}

void DeltaStreamDecoder::skipFragment(const QString& reason, const QByteArray& fragment)
{
    ++m_skipped;
    LOG_WARNING(QStringLiteral("%1: skipped malformed fragment (%2): %3")
                    .arg(providerId(), reason,
                         QString::fromUtf8(fragment.left(kLoggedFragmentLimit))));
}
