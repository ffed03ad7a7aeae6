#include <QTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include "adapters/wolfram/wolfram_client.h"

// Scripted gateway: replays queued replies and records everything sent.
class FakeGatewayChannel : public IGatewayChannel {
public:
    struct Script {
        std::optional<DomainFailure> openFailure;
        QList<Result<GatewayMessage>> replies;
        QStringList sent;
        QUrl url;
        int closeCount = 0;
    };

    explicit FakeGatewayChannel(Script& script) : m_script(script) {}

    VoidResult open(const QUrl& url, int) override {
        m_script.url = url;
        if (m_script.openFailure)
            return std::unexpected(*m_script.openFailure);
        return {};
    }

    VoidResult sendText(const QString& message) override {
        m_script.sent.append(message);
        return {};
    }

    Result<GatewayMessage> receive(int) override {
        if (m_script.replies.isEmpty())
            return std::unexpected(DomainFailure::timeout(QStringLiteral("nothing scripted")));
        return m_script.replies.takeFirst();
    }

    void close() override { ++m_script.closeCount; }

private:
    Script& m_script;
};

namespace {

Result<GatewayMessage> text(const QString& s)
{
    return GatewayMessage::fromText(s);
}

Result<GatewayMessage> ready()
{
    return text(QStringLiteral("{\"type\":\"ready\"}"));
}

Result<GatewayMessage> completed()
{
    return text(QStringLiteral("{\"type\":\"queryComplete\"}"));
}

Result<GatewayMessage> pods(const QString& title, const QString& plaintext)
{
    QJsonObject img;
    img["data"] = "aW1n";
    img["contenttype"] = "image/png";
    QJsonObject subpod;
    subpod["plaintext"] = plaintext;
    subpod["img"] = img;
    QJsonObject pod;
    pod["title"] = title;
    pod["subpods"] = QJsonArray{subpod};
    QJsonObject msg;
    msg["type"] = "pods";
    msg["pods"] = QJsonArray{pod};
    return text(QString::fromUtf8(QJsonDocument(msg).toJson(QJsonDocument::Compact)));
}

QJsonObject parse(const QString& s)
{
    return QJsonDocument::fromJson(s.toUtf8()).object();
}

}

class TestWolframClient : public QObject {
    Q_OBJECT

private:
    FakeGatewayChannel::Script m_script;
    int m_channelsMade = 0;

    WolframClient makeClient(const WolframOptions& options = WolframOptions{}) {
        return WolframClient(options, [this]() {
            ++m_channelsMade;
            return std::make_unique<FakeGatewayChannel>(m_script);
        });
    }

private slots:
    void init() {
        m_script = FakeGatewayChannel::Script{};
        m_channelsMade = 0;
    }

    void testSimpleArithmetic() {
        m_script.replies = {ready(), pods(QStringLiteral("Input"), QStringLiteral("1+1")),
                            pods(QStringLiteral("Result"), QStringLiteral("2")), completed()};
        WolframClient client = makeClient();

        auto results = client.compute(QStringLiteral("  1+1 "));
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), 2);
        QCOMPARE(*results->at(1).title, QStringLiteral("Result"));
        QCOMPARE(*results->at(1).plaintext, QStringLiteral("2"));
        QCOMPARE(*results->at(1).imgContentType, QStringLiteral("image/png"));
        QCOMPARE(m_script.closeCount, 1);
        QCOMPARE(m_script.url.toString(), WolframOptions{}.gatewayUrl);

        QCOMPARE(m_script.sent.size(), 2);
        const QJsonObject initMsg = parse(m_script.sent[0]);
        QCOMPARE(initMsg["type"].toString(), QStringLiteral("init"));
        QCOMPARE(initMsg["lang"].toString(), QStringLiteral("en"));
        QVERIFY(initMsg["exp"].toDouble() > 0);

        const QJsonObject queryMsg = parse(m_script.sent[1]);
        QCOMPARE(queryMsg["type"].toString(), QStringLiteral("newQuery"));
        QCOMPARE(queryMsg["locationId"].toString(), QStringLiteral("oi8ft_en_light"));
        QCOMPARE(queryMsg["input"].toString(), WolframQuerySession::encodeQueryInput(QStringLiteral("1+1")));
        QVERIFY(queryMsg["i2d"].toBool());
        QVERIFY(queryMsg["file"].isNull());
    }

    void testEncodeQueryInput() {
        const QString encoded = WolframQuerySession::encodeQueryInput(QStringLiteral("1+1"));
        const QByteArray decoded = QByteArray::fromBase64(encoded.toLatin1());
        QCOMPARE(decoded, QByteArray("[{\"t\":0,\"v\":\"1+1\"}]"));
    }

    void testCacheHitSkipsNetwork() {
        m_script.replies = {ready(), pods(QStringLiteral("Result"), QStringLiteral("2")), completed()};
        WolframClient client = makeClient();

        QVERIFY(client.compute(QStringLiteral("1+1")).has_value());
        QCOMPARE(m_channelsMade, 1);

        auto again = client.compute(QStringLiteral("1+1"));
        QVERIFY(again.has_value());
        QCOMPARE(*again->first().plaintext, QStringLiteral("2"));
        QCOMPARE(m_channelsMade, 1);
        QCOMPARE(client.cache().size(), 1);
    }

    void testEmptyQueryRejected() {
        WolframClient client = makeClient();
        auto results = client.compute(QStringLiteral("   "));
        QVERIFY(!results.has_value());
        QCOMPARE(results.error().kind, ErrorKind::InvalidInput);
        QCOMPARE(m_channelsMade, 0);
    }

    void testConnectFailurePropagates() {
        m_script.openFailure = DomainFailure::httpStatus(403, QStringLiteral("status code: 403"));
        WolframClient client = makeClient();
        auto results = client.compute(QStringLiteral("1+1"));
        QVERIFY(!results.has_value());
        QCOMPARE(results.error().kind, ErrorKind::HttpError);
        QCOMPARE(results.error().statusCode, 403);
    }

    void testHandshakeTimeout() {
        WolframClient client = makeClient();
        auto results = client.compute(QStringLiteral("1+1"));
        QVERIFY(!results.has_value());
        QCOMPARE(results.error().kind, ErrorKind::Timeout);
        QCOMPARE(client.cache().size(), 0);
    }

    void testInitNotReady() {
        m_script.replies = {text(QStringLiteral("{\"type\":\"error\",\"message\":\"nope\"}"))};
        WolframClient client = makeClient();
        auto results = client.compute(QStringLiteral("1+1"));
        QVERIFY(!results.has_value());
        QCOMPARE(results.error().kind, ErrorKind::ProtocolViolation);
        QCOMPARE(results.error().code, QStringLiteral("wolfram.init_not_ready"));
        QVERIFY(results.error().details.first().contains(QStringLiteral("nope")));
    }

    void testBinaryHandshakeRejected() {
        m_script.replies = {GatewayMessage::binary()};
        WolframClient client = makeClient();
        auto results = client.compute(QStringLiteral("1+1"));
        QVERIFY(!results.has_value());
        QCOMPARE(results.error().code, QStringLiteral("wolfram.unexpected_message"));
    }

    void testNoPodsIsEmptyResult() {
        m_script.replies = {ready(), text(QStringLiteral("{\"type\":\"progress\"}")), completed()};
        WolframClient client = makeClient();
        auto results = client.compute(QStringLiteral("asdfghjkl"));
        QVERIFY(!results.has_value());
        QCOMPARE(results.error().kind, ErrorKind::EmptyResult);
        QCOMPARE(results.error().message, QStringLiteral("Query failed or returned no pods"));
    }

    void testMessageCap() {
        m_script.replies = {ready()};
        for (int i = 0; i < 51; ++i)
            m_script.replies.append(pods(QStringLiteral("Pod %1").arg(i), QString::number(i)));

        WolframQuerySession session(WolframOptions{});
        FakeGatewayChannel channel(m_script);
        auto results = session.run(channel, QStringLiteral("busy"), false);
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), 50);
        QCOMPARE(session.stopReason(), WolframQuerySession::StopReason::MessageCapReached);
        QCOMPARE(session.messageCount(), 51);
    }

    void testSessionRunsOnce() {
        m_script.replies = {ready(), pods(QStringLiteral("Result"), QStringLiteral("2")), completed()};
        WolframQuerySession session(WolframOptions{});
        FakeGatewayChannel channel(m_script);
        QVERIFY(session.run(channel, QStringLiteral("1+1"), false).has_value());
        QCOMPARE(session.stopReason(), WolframQuerySession::StopReason::QueryCompleted);

        auto second = session.run(channel, QStringLiteral("1+1"), false);
        QVERIFY(!second.has_value());
        QCOMPARE(second.error().kind, ErrorKind::InvalidInput);
    }

    void testTimeoutKeepsPartialResults() {
        m_script.replies = {ready(), pods(QStringLiteral("Result"), QStringLiteral("2"))};
        WolframQuerySession session(WolframOptions{});
        FakeGatewayChannel channel(m_script);
        auto results = session.run(channel, QStringLiteral("1+1"), false);
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), 1);
        QCOMPARE(session.stopReason(), WolframQuerySession::StopReason::TimedOut);
    }

    void testServerCloseEndsCollection() {
        m_script.replies = {ready(), pods(QStringLiteral("Result"), QStringLiteral("2")),
                            GatewayMessage::close(), pods(QStringLiteral("Late"), QStringLiteral("x"))};
        WolframQuerySession session(WolframOptions{});
        FakeGatewayChannel channel(m_script);
        auto results = session.run(channel, QStringLiteral("1+1"), false);
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), 1);
        QCOMPARE(session.stopReason(), WolframQuerySession::StopReason::ConnectionClosed);
    }

    void testMalformedMessagesSkipped() {
        m_script.replies = {ready(), text(QStringLiteral("{not json")), GatewayMessage::binary(),
                            pods(QStringLiteral("Result"), QStringLiteral("2")),
                            text(QStringLiteral("{\"type\":\"queryCompleted\"}"))};
        WolframClient client = makeClient();
        auto results = client.compute(QStringLiteral("1+1"));
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), 1);
    }

    void testImageOnlyDropsText() {
        m_script.replies = {ready(), pods(QStringLiteral("Plot"), QStringLiteral("curve")), completed()};
        WolframClient client = makeClient();
        auto results = client.compute(QStringLiteral("plot sin x"), true);
        QVERIFY(results.has_value());
        const WolframResult& r = results->first();
        QVERIFY(!r.plaintext.has_value());
        QCOMPARE(*r.imgBase64, QStringLiteral("aW1n"));

        const QJsonObject json = r.toJson();
        QVERIFY(!json.contains(QStringLiteral("plaintext")));
        QCOMPARE(json["img_contenttype"].toString(), QStringLiteral("image/png"));
    }

    void testRelatedQueries() {
        m_script.replies = {
            ready(),
            text(QStringLiteral("{\"type\":\"pods\",\"relatedQueries\":[\"sin x\",\"cos x\"],\"pods\":[]}")),
            pods(QStringLiteral("Result"), QStringLiteral("2")),
            text(QStringLiteral("{\"type\":\"pods\",\"relatedQueries\":[\"tan x\"]}")),
            completed()};
        WolframClient client = makeClient();
        auto results = client.compute(QStringLiteral("derivative"));
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), 2);
        QCOMPARE(results->at(0).relatedQueries, QStringList({QStringLiteral("sin x"), QStringLiteral("cos x")}));
        QVERIFY(!results->at(0).title.has_value());
        QCOMPARE(results->at(1).relatedQueries, QStringList({QStringLiteral("tan x")}));
    }

    void testPodsWithoutSubpodsIgnored() {
        m_script.replies = {
            ready(),
            text(QStringLiteral("{\"type\":\"pods\",\"pods\":[{\"title\":\"Empty\"}]}")),
            pods(QStringLiteral("Result"), QStringLiteral("2")),
            completed()};
        WolframClient client = makeClient();
        auto results = client.compute(QStringLiteral("1+1"));
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), 1);
        QCOMPARE(*results->first().title, QStringLiteral("Result"));
    }

    void testFormatters() {
        WolframResult r;
        r.title = QStringLiteral("Result");
        r.plaintext = QStringLiteral("2");
        const QString md = formatWolframMarkdown({r});
        QVERIFY(md.contains(QStringLiteral("Result")));
        QVERIFY(md.contains(QStringLiteral("2")));
        QVERIFY(formatWolframHtml({}).contains(QStringLiteral("No results")));
        QCOMPARE(wolframResultsToJson({r}).size(), 1);
    }
};

QTEST_MAIN(TestWolframClient)
#include "tst_wolfram_client.moc"
