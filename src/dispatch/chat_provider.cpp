#include "chat_provider.h"
#include "core/log_manager.h"

ChatProvider::ChatProvider(Variant chat, IStreamExecutor& executor)
    : m_chat(std::move(chat))
    , m_executor(&executor)
{
}

ChatProvider ChatProvider::create(ProviderKind kind, const ProviderEndpoints& endpoints,
                                  IStreamExecutor& executor)
{
    LOG_DEBUG(QStringLiteral("creating %1 chat").arg(providerKindToString(kind)));
    switch (kind) {
    case ProviderKind::Gemini:
        return ChatProvider(Variant(std::in_place_type<GeminiChat>, endpoints), executor);
    case ProviderKind::DeepSeek:
        return ChatProvider(Variant(std::in_place_type<DeepSeekChat>, endpoints), executor);
    case ProviderKind::Coze:
        return ChatProvider(Variant(std::in_place_type<CozeChat>, endpoints), executor);
    }
    Q_UNREACHABLE_RETURN(ChatProvider(Variant(std::in_place_type<GeminiChat>, endpoints), executor));
}

// Every call below resolves on the concrete (final) provider type held by the
// variant; ChatSession is only the shared implementation.

const ChatSession& ChatProvider::session() const
{
    return std::visit([](const auto& chat) -> const ChatSession& { return chat; }, m_chat);
}

ProviderKind ChatProvider::kind() const
{
    return std::visit([](const auto& chat) { return chat.kind(); }, m_chat);
}

Result<QString> ChatProvider::generateStreaming(const ApiKey& key, const QString& prompt,
                                                const DeltaSink& sink)
{
    return std::visit([&](auto& chat) {
        return chat.generateStreaming(*m_executor, key, prompt, sink);
    }, m_chat);
}

Result<QString> ChatProvider::regenerateStreaming(const ApiKey& key, const DeltaSink& sink)
{
    return std::visit([&](auto& chat) {
        return chat.regenerateStreaming(*m_executor, key, sink);
    }, m_chat);
}

Result<QString> ChatProvider::withdrawLast()
{
    return std::visit([](auto& chat) { return chat.withdrawLast(); }, m_chat);
}

void ChatProvider::clear()
{
    std::visit([](auto& chat) { chat.clear(); }, m_chat);
}

void ChatProvider::setSystemPrompt(const QString& prompt)
{
    std::visit([&](auto& chat) { chat.setSystemPrompt(prompt); }, m_chat);
}

QString ChatProvider::systemPrompt() const
{
    return std::visit([](const auto& chat) { return chat.systemPrompt(); }, m_chat);
}

VoidResult ChatProvider::setParameter(const QString& key, const QString& value)
{
    return std::visit([&](auto& chat) { return chat.setParameter(key, value); }, m_chat);
}

QString ChatProvider::serialize() const
{
    return std::visit([](const auto& chat) { return chat.serialize(); }, m_chat);
}

VoidResult ChatProvider::deserialize(const QString& data)
{
    return std::visit([&](auto& chat) { return chat.deserialize(data); }, m_chat);
}

void ChatProvider::loadFrom(const ChatTranscript& transcript)
{
    std::visit([&](auto& chat) { chat.loadFrom(transcript); }, m_chat);
}

ChatTranscript ChatProvider::saveTo() const
{
    return std::visit([](const auto& chat) { return chat.saveTo(); }, m_chat);
}
