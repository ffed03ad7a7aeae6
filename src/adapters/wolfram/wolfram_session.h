#pragma once
#include "wolfram_types.h"
#include "config/config_types.h"
#include "semantic/ports.h"

// One query against the Wolfram|Alpha gateway: connect, init handshake,
// newQuery, then collect pods until the server signals completion.
// A session is used for exactly one query.
class WolframQuerySession {
public:
    enum class StopReason : quint8 {
        None,
        QueryCompleted,
        ConnectionClosed,
        MessageCapReached,
        TimedOut
    };

    explicit WolframQuerySession(const WolframOptions& options);

    Result<WolframResults> run(IGatewayChannel& channel, const QString& query, bool imageOnly);

    int messageCount() const { return m_messageCount; }
    StopReason stopReason() const { return m_stopReason; }

    QJsonObject buildInitMessage(qint64 expiryMs) const;
    QJsonObject buildQueryMessage(const QString& query) const;
    static QString encodeQueryInput(const QString& query);
    static QString stopReasonName(StopReason reason);

private:
    WolframOptions m_options;
    bool m_used = false;
    int m_messageCount = 0;
    StopReason m_stopReason = StopReason::None;

    VoidResult handshake(IGatewayChannel& channel);
    Result<WolframResults> collect(IGatewayChannel& channel, bool imageOnly);
    static void mergeMessage(const QJsonObject& message, bool imageOnly, WolframResults& results);
};
