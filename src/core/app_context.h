#pragma once
#include "config/config_types.h"
#include "dispatch/chat_provider.h"
#include "adapters/wolfram/wolfram_client.h"
#include <memory>

// Everything that lives for the whole application session: the HTTP
// executor, the Wolfram client with its cache, and the configuration they
// were built from. Chats borrow the executor from here.
class AppContext {
public:
    explicit AppContext(const AppConfig& config);
    AppContext(const AppConfig& config,
               std::unique_ptr<IStreamExecutor> executor,
               GatewayChannelFactory channelFactory);

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    const AppConfig& config() const { return m_config; }
    IStreamExecutor& executor() { return *m_executor; }
    WolframClient& wolfram() { return m_wolfram; }

    ChatProvider createChat(ProviderKind kind);

private:
    AppConfig m_config;
    std::unique_ptr<IStreamExecutor> m_executor;
    WolframClient m_wolfram;
};
