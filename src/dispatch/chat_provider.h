#pragma once
#include "adapters/outbound/coze.h"
#include "adapters/outbound/deepseek.h"
#include "adapters/outbound/gemini.h"
#include <variant>

// Closed set of chat providers behind one value type. Every operation is
// resolved with std::visit on the concrete provider held by the variant.
class ChatProvider {
public:
    using Variant = std::variant<GeminiChat, DeepSeekChat, CozeChat>;

    static ChatProvider create(ProviderKind kind, const ProviderEndpoints& endpoints,
                               IStreamExecutor& executor);

    ProviderKind kind() const;

    Result<QString> generateStreaming(const ApiKey& key, const QString& prompt, const DeltaSink& sink);
    Result<QString> regenerateStreaming(const ApiKey& key, const DeltaSink& sink);
    Result<QString> withdrawLast();
    void clear();

    void setSystemPrompt(const QString& prompt);
    QString systemPrompt() const;
    VoidResult setParameter(const QString& key, const QString& value);

    QString serialize() const;
    VoidResult deserialize(const QString& data);

    void loadFrom(const ChatTranscript& transcript);
    ChatTranscript saveTo() const;

    const ChatSession& session() const;

private:
    ChatProvider(Variant chat, IStreamExecutor& executor);

    Variant m_chat;
    IStreamExecutor* m_executor;
};
