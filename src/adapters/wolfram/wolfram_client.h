#pragma once
#include "result_cache.h"
#include "wolfram_session.h"

// Long-lived entry point for Wolfram queries. Owns the answer cache; each
// uncached query gets its own channel from the factory and its own session.
class WolframClient {
public:
    WolframClient(const WolframOptions& options, GatewayChannelFactory channelFactory);

    Result<WolframResults> compute(const QString& query, bool imageOnly = false);

    WolframResultCache& cache() { return m_cache; }
    const WolframOptions& options() const { return m_options; }

private:
    WolframOptions m_options;
    GatewayChannelFactory m_channelFactory;
    WolframResultCache m_cache;
};
