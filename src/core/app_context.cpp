#include "app_context.h"
#include "log_manager.h"
#include "adapters/executor/qt_executor.h"
#include "adapters/wolfram/qt_gateway_channel.h"

namespace {

std::unique_ptr<IStreamExecutor> makeExecutor(const RuntimeOptions& runtime)
{
    auto executor = std::make_unique<QtExecutor>();
    executor->setRequestTimeout(runtime.requestTimeout);
    executor->setConnectionTimeout(runtime.connectionTimeout);
    return executor;
}

}

AppContext::AppContext(const AppConfig& config)
    : AppContext(config,
                 makeExecutor(config.runtime),
                 [] { return std::make_unique<QtGatewayChannel>(); })
{
}

AppContext::AppContext(const AppConfig& config,
                       std::unique_ptr<IStreamExecutor> executor,
                       GatewayChannelFactory channelFactory)
    : m_config(config)
    , m_executor(std::move(executor))
    , m_wolfram(config.wolfram, std::move(channelFactory))
{
    LOG_DEBUG(QStringLiteral("context ready (wolfram cache capacity %1)")
                  .arg(m_wolfram.cache().capacity()));
}

ChatProvider AppContext::createChat(ProviderKind kind)
{
    return ChatProvider::create(kind, m_config.endpoints, *m_executor);
}
