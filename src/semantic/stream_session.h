#pragma once
#include "ports.h"
#include "stream_decoder.h"

// Runs one streamed provider call: bytes from the executor go through the
// decoder and every delta reaches the sink in arrival order.
class StreamSession {
public:
    StreamSession(IStreamExecutor& executor,
                  IStreamDecoder& decoder,
                  DeltaSink sink);

    Result<StreamOutcome> run(const ProviderRequest& request);

    int deltaCount() const { return m_deltaCount; }

private:
    IStreamExecutor& m_executor;
    IStreamDecoder& m_decoder;
    DeltaSink m_sink;
    std::optional<DomainFailure> m_fatal;
    int m_deltaCount = 0;

    bool dispatch(const DecodeBatch& batch);
};
