#include <QTest>
#include "semantic/features/sse_line_splitter.h"

class TestSseLineSplitter : public QObject {
    Q_OBJECT

private slots:
    void testCommentAndBlankLinesDropped() {
        const QList<QByteArray> lines = SseLineSplitter::split(":ping\n\ndata: hello\n\n");
        QCOMPARE(lines.size(), 1);
        QCOMPARE(lines[0], QByteArray("data: hello"));
    }

    void testEventAndDataLines() {
        const QList<QByteArray> lines = SseLineSplitter::split(
            "event: conversation.message.delta\r\n"
            "data: {\"content\":\"x\"}\r\n"
            "\r\n");
        QCOMPARE(lines.size(), 2);
        QVERIFY(SseLineSplitter::isField(lines[0], "event"));
        QCOMPARE(SseLineSplitter::fieldValue(lines[0]), QByteArray("conversation.message.delta"));
        QVERIFY(SseLineSplitter::isField(lines[1], "data"));
        QCOMPARE(SseLineSplitter::fieldValue(lines[1]), QByteArray("{\"content\":\"x\"}"));
    }

    void testFieldValueKeepsColonsInPayload() {
        QCOMPARE(SseLineSplitter::fieldValue("data:{\"a\":\"b:c\"}"), QByteArray("{\"a\":\"b:c\"}"));
        QVERIFY(!SseLineSplitter::isField("database: x", "data"));
    }

    void testFeedHoldsPartialLine() {
        SseLineSplitter splitter;
        QVERIFY(splitter.feed("data: {\"choices\":[{\"delta\":").isEmpty());

        const QList<QByteArray> lines = splitter.feed("{\"content\":\"Hi\"}}]}\n\ndata: [DO");
        QCOMPARE(lines.size(), 1);
        QCOMPARE(lines[0], QByteArray("data: {\"choices\":[{\"delta\":{\"content\":\"Hi\"}}]}"));

        const QList<QByteArray> tail = splitter.flush();
        QCOMPARE(tail.size(), 1);
        QCOMPARE(tail[0], QByteArray("data: [DO"));
        QVERIFY(splitter.flush().isEmpty());
    }

    void testMultiByteCharacterAcrossChunks() {
        SseLineSplitter splitter;
        const QByteArray payload = "data: \xe4\xbd\xa0\xe5\xa5\xbd\n";
        QVERIFY(splitter.feed(payload.left(8)).isEmpty());
        const QList<QByteArray> lines = splitter.feed(payload.mid(8));
        QCOMPARE(lines.size(), 1);
        QCOMPARE(QString::fromUtf8(SseLineSplitter::fieldValue(lines[0])),
                 QString::fromUtf8("\xe4\xbd\xa0\xe5\xa5\xbd"));
    }
};

QTEST_MAIN(TestSseLineSplitter)
#include "tst_sse_line_splitter.moc"
