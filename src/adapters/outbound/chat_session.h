#pragma once
#include "semantic/api_key.h"
#include "semantic/ports.h"
#include "semantic/stream_decoder.h"
#include "semantic/transcript.h"
#include <memory>

// Conversation state shared by the provider chats: history, system prompt
// and transcript identity. Providers supply the request shape, the stream
// decoder and their sampling parameters.
class ChatSession {
public:
    explicit ChatSession(ProviderKind kind);
    virtual ~ChatSession() = default;

    ProviderKind kind() const { return m_kind; }

    // Streams one turn. History gains the user prompt and the reply only when
    // the stream succeeds.
    Result<QString> generateStreaming(IStreamExecutor& executor, const ApiKey& key,
                                      const QString& prompt, const DeltaSink& sink);
    // Re-asks the last user prompt after dropping the previous reply.
    Result<QString> regenerateStreaming(IStreamExecutor& executor, const ApiKey& key,
                                        const DeltaSink& sink);

    Result<QString> withdrawLast();
    void clear();

    const QString& systemPrompt() const { return m_systemPrompt; }
    void setSystemPrompt(const QString& prompt) { m_systemPrompt = prompt; }

    virtual VoidResult setParameter(const QString& key, const QString& value) = 0;

    QString serialize() const;
    VoidResult deserialize(const QString& data);

    void loadFrom(const ChatTranscript& transcript);
    ChatTranscript saveTo() const;

    const QList<TranscriptMessage>& history() const { return m_history; }
    quint32 chatId() const { return m_chatId; }
    void setChatId(quint32 id) { m_chatId = id; }
    const QString& title() const { return m_title; }
    void setTitle(const QString& title) { m_title = title; }

    virtual ProviderRequest buildRequest(const ApiKey& key, const QString& prompt) const = 0;
    virtual std::unique_ptr<IStreamDecoder> createDecoder() const = 0;

protected:
    virtual QJsonObject parametersToJson() const = 0;
    virtual VoidResult parametersFromJson(const QJsonObject& params) = 0;

    VoidResult checkKey(const ApiKey& key) const;

    static Result<double> parseDouble(const QString& key, const QString& value);
    static Result<int> parseCount(const QString& key, const QString& value);
    static VoidResult unknownParameter(const QString& key);

private:
    ProviderKind m_kind;
    QList<TranscriptMessage> m_history;
    QString m_systemPrompt;
    quint32 m_chatId = 0;
    QString m_title;
    QString m_time;

    static QString currentTime();
};
