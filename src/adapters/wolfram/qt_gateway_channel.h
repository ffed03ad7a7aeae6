#pragma once
#include "semantic/ports.h"
#include <QObject>
#include <QQueue>
#include <QWebSocket>

class QEventLoop;

// Blocking facade over QWebSocket. Incoming frames are queued by the socket
// signals and handed out by receive(); waits spin a local event loop.
class QtGatewayChannel : public QObject, public IGatewayChannel {
    Q_OBJECT

public:
    explicit QtGatewayChannel(QObject* parent = nullptr);
    ~QtGatewayChannel() override;

    VoidResult open(const QUrl& url, int timeoutMs) override;
    VoidResult sendText(const QString& message) override;
    Result<GatewayMessage> receive(int timeoutMs) override;
    void close() override;

    // HTTP status carried by a failed upgrade, 0 when the text has none.
    static int statusFromHandshakeError(const QString& errorString);

private:
    QWebSocket m_socket;
    QQueue<GatewayMessage> m_inbox;
    QEventLoop* m_waiter = nullptr;
    QString m_lastError;
    bool m_connected = false;
    bool m_closed = false;

    bool waitUntil(int timeoutMs, const std::function<bool()>& ready);
    void wake();
};
