#include <QTest>
#include <QHostAddress>
#include <QWebSocket>
#include <QWebSocketServer>
#include "adapters/wolfram/qt_gateway_channel.h"

class TestGatewayChannel : public QObject {
    Q_OBJECT

private:
    QWebSocketServer* m_server = nullptr;
    QList<QWebSocket*> m_peers;

    QUrl serverUrl() const {
        return QUrl(QStringLiteral("ws://127.0.0.1:%1").arg(m_server->serverPort()));
    }

private slots:
    void init() {
        m_server = new QWebSocketServer(QStringLiteral("echo"), QWebSocketServer::NonSecureMode, this);
        QVERIFY(m_server->listen(QHostAddress::LocalHost, 0));
        connect(m_server, &QWebSocketServer::newConnection, this, [this]() {
            QWebSocket* peer = m_server->nextPendingConnection();
            m_peers.append(peer);
            connect(peer, &QWebSocket::textMessageReceived, peer, [peer](const QString& message) {
                peer->sendTextMessage(QStringLiteral("echo:") + message);
            });
        });
    }

    void cleanup() {
        qDeleteAll(m_peers);
        m_peers.clear();
        m_server->close();
        delete m_server;
        m_server = nullptr;
    }

    void testRoundTrip() {
        QtGatewayChannel channel;
        QVERIFY(channel.open(serverUrl(), 5000).has_value());
        QVERIFY(channel.sendText(QStringLiteral("ping")).has_value());

        auto reply = channel.receive(5000);
        QVERIFY(reply.has_value());
        QCOMPARE(reply->kind, GatewayMessage::Kind::Text);
        QCOMPARE(reply->text, QStringLiteral("echo:ping"));
    }

    void testReceiveTimesOut() {
        QtGatewayChannel channel;
        QVERIFY(channel.open(serverUrl(), 5000).has_value());

        auto reply = channel.receive(100);
        QVERIFY(!reply.has_value());
        QCOMPARE(reply.error().kind, ErrorKind::Timeout);
    }

    void testServerCloseYieldsCloseMessage() {
        QtGatewayChannel channel;
        QVERIFY(channel.open(serverUrl(), 5000).has_value());
        QTRY_COMPARE(m_peers.size(), 1);

        m_peers.first()->close();
        auto reply = channel.receive(5000);
        QVERIFY(reply.has_value());
        QCOMPARE(reply->kind, GatewayMessage::Kind::Close);

        QVERIFY(!channel.sendText(QStringLiteral("late")).has_value());
    }

    void testSendBeforeOpenFails() {
        QtGatewayChannel channel;
        auto sent = channel.sendText(QStringLiteral("ping"));
        QVERIFY(!sent.has_value());
        QCOMPARE(sent.error().kind, ErrorKind::ConnectionError);
    }

    void testRefusedConnection() {
        const QUrl url = serverUrl();
        m_server->close();

        QtGatewayChannel channel;
        auto opened = channel.open(url, 5000);
        QVERIFY(!opened.has_value());
        QVERIFY(opened.error().kind == ErrorKind::ConnectionError
                || opened.error().kind == ErrorKind::Timeout);
    }

    void testStatusFromHandshakeError() {
        QCOMPARE(QtGatewayChannel::statusFromHandshakeError(
                     QStringLiteral("QWebSocketPrivate::processHandshake: Unhandled http status code: 403 (Forbidden).")),
                 403);
        QCOMPARE(QtGatewayChannel::statusFromHandshakeError(QStringLiteral("Status code 502")), 502);
        QCOMPARE(QtGatewayChannel::statusFromHandshakeError(QStringLiteral("Connection refused")), 0);
    }
};

QTEST_MAIN(TestGatewayChannel)
#include "tst_gateway_channel.moc"
