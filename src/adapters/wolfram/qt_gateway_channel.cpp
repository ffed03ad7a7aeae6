#include "qt_gateway_channel.h"
#include "core/log_manager.h"
#include <QEventLoop>
#include <QRegularExpression>
#include <QTimer>

QtGatewayChannel::QtGatewayChannel(QObject* parent)
    : QObject(parent)
{
    connect(&m_socket, &QWebSocket::connected, this, [this]() {
        m_connected = true;
        wake();
    });
    connect(&m_socket, &QWebSocket::disconnected, this, [this]() {
        m_closed = true;
        wake();
    });
    connect(&m_socket, &QWebSocket::textMessageReceived, this, [this](const QString& message) {
        m_inbox.enqueue(GatewayMessage::fromText(message));
        wake();
    });
    connect(&m_socket, &QWebSocket::binaryMessageReceived, this, [this](const QByteArray&) {
        m_inbox.enqueue(GatewayMessage::binary());
        wake();
    });
    connect(&m_socket, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        m_lastError = m_socket.errorString();
        LOG_WARNING(QString("gateway socket error: %1").arg(m_lastError));
        wake();
    });
}

QtGatewayChannel::~QtGatewayChannel()
{
    close();
}

int QtGatewayChannel::statusFromHandshakeError(const QString& errorString)
{
    static const QRegularExpression pattern(
        QStringLiteral("status code:?\\s*(\\d{3})"), QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch match = pattern.match(errorString);
    if (!match.hasMatch())
        return 0;
    return match.captured(1).toInt();
}

void QtGatewayChannel::wake()
{
    if (m_waiter)
        m_waiter->quit();
}

bool QtGatewayChannel::waitUntil(int timeoutMs, const std::function<bool()>& ready)
{
    if (ready())
        return true;

    QEventLoop loop;
    QTimer timer;
    bool timedOut = false;
    timer.setSingleShot(true);
    connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    m_waiter = &loop;
    timer.start(timeoutMs);
    while (!ready() && !timedOut)
        loop.exec();
    m_waiter = nullptr;

    return ready();
}

VoidResult QtGatewayChannel::open(const QUrl& url, int timeoutMs)
{
    if (!url.isValid())
        return std::unexpected(DomainFailure::invalidInput("gateway.bad_url",
                                                           QString("invalid gateway url: %1").arg(url.toString())));

    m_inbox.clear();
    m_lastError.clear();
    m_connected = false;
    m_closed = false;

    LOG_INFO(QString("connecting to %1").arg(url.toString()));
    m_socket.open(url);

    const bool settled = waitUntil(timeoutMs, [this]() {
        return m_connected || m_closed || !m_lastError.isEmpty();
    });

    if (m_connected)
        return {};

    if (!settled) {
        m_socket.abort();
        return std::unexpected(DomainFailure::timeout(
            QString("gateway connect timed out after %1 ms").arg(timeoutMs)));
    }

    const QString reason = m_lastError.isEmpty() ? QString("connection closed during upgrade") : m_lastError;
    const int status = statusFromHandshakeError(reason);
    m_socket.abort();
    if (status > 0)
        return std::unexpected(DomainFailure::httpStatus(status, reason));
    return std::unexpected(DomainFailure::connection(reason));
}

VoidResult QtGatewayChannel::sendText(const QString& message)
{
    if (!m_connected || m_closed)
        return std::unexpected(DomainFailure::connection("gateway is not connected"));

    if (m_socket.sendTextMessage(message) < 0)
        return std::unexpected(DomainFailure::connection(m_socket.errorString()));
    m_socket.flush();
    return {};
}

Result<GatewayMessage> QtGatewayChannel::receive(int timeoutMs)
{
    waitUntil(timeoutMs, [this]() {
        return !m_inbox.isEmpty() || m_closed;
    });

    if (!m_inbox.isEmpty())
        return m_inbox.dequeue();
    if (m_closed)
        return GatewayMessage::close();
    return std::unexpected(DomainFailure::timeout(
        QString("no gateway message within %1 ms").arg(timeoutMs)));
}

void QtGatewayChannel::close()
{
    if (m_socket.state() != QAbstractSocket::UnconnectedState)
        m_socket.close();
    m_connected = false;
}
