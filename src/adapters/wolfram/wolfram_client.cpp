#include "wolfram_client.h"
#include "core/log_manager.h"

WolframClient::WolframClient(const WolframOptions& options, GatewayChannelFactory channelFactory)
    : m_options(options)
    , m_channelFactory(std::move(channelFactory))
    , m_cache(options.cacheCapacity)
{
}

Result<WolframResults> WolframClient::compute(const QString& query, bool imageOnly)
{
    const QString q = query.trimmed();
    if (q.isEmpty())
        return std::unexpected(DomainFailure::invalidInput("wolfram.empty_query", "query is empty"));

    if (auto cached = m_cache.lookup(q, imageOnly)) {
        LOG_DEBUG(QString("wolfram: cache hit for '%1'").arg(q));
        return *cached;
    }

    std::unique_ptr<IGatewayChannel> channel = m_channelFactory ? m_channelFactory() : nullptr;
    if (!channel)
        return std::unexpected(DomainFailure::internal("no gateway channel available"));

    WolframQuerySession session(m_options);
    auto results = session.run(*channel, q, imageOnly);
    channel->close();

    if (!results) {
        LOG_ERROR(QString("wolfram: query '%1' failed [%2]: %3")
                      .arg(q, results.error().code, results.error().message));
        return results;
    }

    m_cache.insert(q, imageOnly, *results);
    return results;
}
