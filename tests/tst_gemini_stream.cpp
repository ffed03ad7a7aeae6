#include <QTest>
#include "adapters/stream/gemini_stream.h"

namespace {

QByteArray textElement(const QByteArray& text)
{
    return "{\"candidates\":[{\"content\":{\"parts\":[{\"text\":\"" + text + "\"}],\"role\":\"model\"}}]}";
}

}

class TestGeminiStream : public QObject {
    Q_OBJECT

private slots:
    void testDeltasAcrossChunks() {
        GeminiStreamDecoder decoder;
        const QByteArray body = "[" + textElement("Hello") + ",\r\n" + textElement(", world") + "]";

        const DecodeBatch first = decoder.feed(body.left(40));
        const DecodeBatch second = decoder.feed(body.mid(40));
        const DecodeBatch tail = decoder.flush();

        QStringList deltas = first.deltas + second.deltas + tail.deltas;
        QCOMPARE(deltas, QStringList({QStringLiteral("Hello"), QStringLiteral(", world")}));

        auto outcome = decoder.finish();
        QVERIFY(outcome.has_value());
        QCOMPARE(outcome->status, OutcomeStatus::Completed);
        QCOMPARE(outcome->text, QStringLiteral("Hello, world"));
    }

    void testSafetyStopWinsOverText() {
        GeminiStreamDecoder decoder;
        const QByteArray blocked =
            "{\"candidates\":[{\"content\":{\"parts\":[{\"text\":\"partial\"}]},"
            "\"finishReason\":\"SAFETY\","
            "\"safetyRatings\":[{\"category\":\"HARM_CATEGORY_HARASSMENT\",\"probability\":\"HIGH\",\"blocked\":true},"
            "{\"category\":\"HARM_CATEGORY_HATE_SPEECH\",\"probability\":\"LOW\"}]}]}";

        const DecodeBatch batch = decoder.feed("[" + textElement("ok ") + "," + blocked + "]");
        QCOMPARE(batch.deltas, QStringList({QStringLiteral("ok ")}));
        QVERIFY(batch.failure.has_value());
        QCOMPARE(batch.failure->kind, ErrorKind::SafetyBlocked);
        QCOMPARE(batch.failure->details, QStringList({QStringLiteral("HARM_CATEGORY_HARASSMENT")}));
        QVERIFY(decoder.isTerminated());

        auto outcome = decoder.finish();
        QVERIFY(!outcome.has_value());
        QCOMPARE(outcome.error().kind, ErrorKind::SafetyBlocked);
    }

    void testInStreamErrorElement() {
        GeminiStreamDecoder decoder;
        const DecodeBatch batch = decoder.feed(
            "[{\"error\":{\"code\":429,\"message\":\"Resource has been exhausted\",\"status\":\"RESOURCE_EXHAUSTED\"}}]");
        QVERIFY(batch.failure.has_value());
        QCOMPARE(batch.failure->kind, ErrorKind::ProtocolViolation);
        QCOMPARE(batch.failure->code, QStringLiteral("gemini.stream_error"));
        QCOMPARE(batch.failure->message, QStringLiteral("Resource has been exhausted"));
    }

    void testBytesWithoutTextIsDegraded() {
        GeminiStreamDecoder decoder;
        decoder.feed("[{\"usageMetadata\":{\"promptTokenCount\":3}}]");
        decoder.flush();

        auto outcome = decoder.finish();
        QVERIFY(outcome.has_value());
        QVERIFY(outcome->isDegraded());
        QCOMPARE(outcome->text, QString::fromUtf8(kDegradedPlaceholder));
    }

    void testNoBytesIsEmptyResult() {
        GeminiStreamDecoder decoder;
        decoder.flush();
        auto outcome = decoder.finish();
        QVERIFY(!outcome.has_value());
        QCOMPARE(outcome.error().kind, ErrorKind::EmptyResult);
    }

    void testMalformedElementSkipped() {
        GeminiStreamDecoder decoder;
        const DecodeBatch batch = decoder.feed("[{\"candidates\":oops}," + textElement("fine") + "]");
        QCOMPARE(batch.deltas, QStringList({QStringLiteral("fine")}));
        QVERIFY(!batch.failure.has_value());
        QCOMPARE(decoder.skippedFragments(), 1);
    }

    void testTruncatedTailReported() {
        GeminiStreamDecoder decoder;
        decoder.feed("[" + textElement("a") + ",{\"candidates\":[{\"content\":");
        QCOMPARE(decoder.skippedFragments(), 0);
        const DecodeBatch tail = decoder.flush();
        QVERIFY(!tail.failure.has_value());
        QCOMPARE(decoder.skippedFragments(), 1);

        auto outcome = decoder.finish();
        QVERIFY(outcome.has_value());
        QCOMPARE(outcome->text, QStringLiteral("a"));
    }
};

QTEST_MAIN(TestGeminiStream)
#include "tst_gemini_stream.moc"
