#include <QTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include "semantic/features/json_array_chunker.h"

namespace {

const QByteArray kStream =
    "[{\"candidates\":[{\"content\":{\"parts\":[{\"text\":\"He said \\\"hi\\\"\"}],\"role\":\"model\"}}]}\r\n"
    ",\r\n"
    "{\"candidates\":[{\"content\":{\"parts\":[{\"text\":\"back\\\\slash and {braces} [brackets]\"}]}}]}\r\n"
    ",\r\n"
    "{\"candidates\":[{\"content\":{\"parts\":[{\"text\":\"\xc3\xa9t\xc3\xa9 \xe2\x88\x9a" "2\"}]},\"finishReason\":\"STOP\"}]}\r\n"
    "]";

QString firstText(const QByteArray& object)
{
    const QJsonDocument doc = QJsonDocument::fromJson(object);
    return doc.object()["candidates"].toArray()[0].toObject()["content"].toObject()
        ["parts"].toArray()[0].toObject()["text"].toString();
}

}

class TestJsonArrayChunker : public QObject {
    Q_OBJECT

private slots:
    void testWholeStream() {
        JsonArrayChunker chunker;
        const QList<QByteArray> objects = chunker.feed(kStream);

        QCOMPARE(objects.size(), 3);
        for (const auto& obj : objects) {
            QJsonParseError err;
            QJsonDocument::fromJson(obj, &err);
            QCOMPARE(err.error, QJsonParseError::NoError);
        }
        QCOMPARE(firstText(objects[0]), QStringLiteral("He said \"hi\""));
        QCOMPARE(firstText(objects[1]), QStringLiteral("back\\slash and {braces} [brackets]"));
        QCOMPARE(firstText(objects[2]), QString::fromUtf8("\xc3\xa9t\xc3\xa9 \xe2\x88\x9a" "2"));
        QCOMPARE(chunker.depth(), 0);
        QVERIFY(!chunker.pending());
        QVERIFY(!chunker.finish().has_value());
    }

    void testEverySplitOffsetMatchesWholeStream() {
        JsonArrayChunker reference;
        const QList<QByteArray> expected = reference.feed(kStream);

        for (qsizetype cut = 0; cut <= kStream.size(); ++cut) {
            JsonArrayChunker chunker;
            QList<QByteArray> got = chunker.feed(kStream.left(cut));
            got += chunker.feed(kStream.mid(cut));
            QVERIFY2(got == expected, qPrintable(QStringLiteral("split at %1").arg(cut)));
        }
    }

    void testByteAtATime() {
        JsonArrayChunker reference;
        const QList<QByteArray> expected = reference.feed(kStream);

        JsonArrayChunker chunker;
        QList<QByteArray> got;
        for (const char c : kStream)
            got += chunker.feed(QByteArray(1, c));
        QCOMPARE(got, expected);
    }

    void testEscapedQuoteStraddlingBoundary() {
        JsonArrayChunker chunker;
        // The backslash ends the first chunk; the quote it escapes starts the second.
        QVERIFY(chunker.feed("[{\"text\":\"a\\").isEmpty());
        QVERIFY(chunker.inString());

        const QList<QByteArray> objects = chunker.feed("\"b\"}]");
        QVERIFY(!chunker.inString());
        QCOMPARE(objects.size(), 1);
        QCOMPARE(QJsonDocument::fromJson(objects[0]).object()["text"].toString(),
                 QStringLiteral("a\"b"));
    }

    void testRawNewlineInsideStringIsEscaped() {
        JsonArrayChunker chunker;
        const QList<QByteArray> objects = chunker.feed("[{\"text\":\"line1\nline2\"}]");
        QCOMPARE(objects.size(), 1);
        QCOMPARE(objects[0], QByteArray("{\"text\":\"line1\\nline2\"}"));
        QCOMPARE(QJsonDocument::fromJson(objects[0]).object()["text"].toString(),
                 QStringLiteral("line1\nline2"));
    }

    void testTruncatedObjectIsReturnedByFinish() {
        JsonArrayChunker chunker;
        QCOMPARE(chunker.feed("[{\"a\":1},{\"b\":").size(), 1);
        QVERIFY(chunker.pending());

        const auto remainder = chunker.finish();
        QVERIFY(remainder.has_value());
        QCOMPARE(*remainder, QByteArray("{\"b\":"));
        QCOMPARE(chunker.depth(), 0);
        QVERIFY(!chunker.pending());
    }

    void testDepthNeverNegative() {
        JsonArrayChunker chunker;
        QVERIFY(chunker.feed("]]}}").isEmpty());
        QCOMPARE(chunker.depth(), 0);
        QCOMPARE(chunker.feed("[{\"x\":true}]").size(), 1);
    }
};

QTEST_MAIN(TestJsonArrayChunker)
#include "tst_json_array_chunker.moc"
