#include "stream_session.h"
#include "core/log_manager.h"

StreamSession::StreamSession(IStreamExecutor& executor,
                             IStreamDecoder& decoder,
                             DeltaSink sink)
    : m_executor(executor)
    , m_decoder(decoder)
    , m_sink(std::move(sink))
{
}

Result<StreamOutcome> StreamSession::run(const ProviderRequest& request)
{
    m_fatal.reset();
    m_deltaCount = 0;

    LOG_DEBUG(QStringLiteral("StreamSession[%1]: %2 %3")
                  .arg(m_decoder.providerId(), request.method, request.adapterHint));

    VoidResult transport = m_executor.stream(request, [this](const QByteArray& chunk) {
        if (!dispatch(m_decoder.feed(chunk)))
            return false;
        // A terminal event (e.g. chat completed) ends the read early.
        return !m_decoder.isTerminated();
    });

    if (m_fatal) {
        return std::unexpected(*m_fatal);
    }

    if (!transport) {
        LOG_ERROR(QStringLiteral("StreamSession[%1]: transport error [%2]: %3")
                      .arg(m_decoder.providerId(),
                           transport.error().code,
                           transport.error().message));
        return std::unexpected(transport.error());
    }

    if (!dispatch(m_decoder.flush())) {
        return std::unexpected(*m_fatal);
    }

    return m_decoder.finish();
}

bool StreamSession::dispatch(const DecodeBatch& batch)
{
    for (const QString& delta : batch.deltas) {
        ++m_deltaCount;
        if (m_sink)
            m_sink(delta);
    }

    if (batch.failure) {
        m_fatal = batch.failure;
        return false;
    }
    return true;
}
