#include <QTest>
#include "adapters/wolfram/result_cache.h"

namespace {

WolframResults answer(const QString& text)
{
    WolframResult r;
    r.title = QStringLiteral("Result");
    r.plaintext = text;
    return {r};
}

}

class TestResultCache : public QObject {
    Q_OBJECT

private slots:
    void testLookupMiss() {
        WolframResultCache cache(4);
        QVERIFY(!cache.lookup(QStringLiteral("1+1"), false).has_value());
        QCOMPARE(cache.size(), 0);
        QCOMPARE(cache.capacity(), 4);
    }

    void testInsertAndLookup() {
        WolframResultCache cache(4);
        cache.insert(QStringLiteral("1+1"), false, answer(QStringLiteral("2")));

        auto hit = cache.lookup(QStringLiteral("1+1"), false);
        QVERIFY(hit.has_value());
        QCOMPARE(hit->size(), 1);
        QCOMPARE(*hit->first().plaintext, QStringLiteral("2"));
    }

    void testImageOnlyIsSeparateKey() {
        WolframResultCache cache(4);
        cache.insert(QStringLiteral("plot sin x"), true, answer(QStringLiteral("img")));
        QVERIFY(cache.lookup(QStringLiteral("plot sin x"), true).has_value());
        QVERIFY(!cache.lookup(QStringLiteral("plot sin x"), false).has_value());
    }

    void testOverflowEvictsExactlyOne() {
        const int capacity = 5;
        WolframResultCache cache(capacity);
        for (int i = 0; i <= capacity; ++i)
            cache.insert(QString::number(i), false, answer(QString::number(i)));

        QCOMPARE(cache.size(), capacity);

        int present = 0;
        for (int i = 0; i <= capacity; ++i) {
            if (cache.lookup(QString::number(i), false))
                ++present;
        }
        QCOMPARE(present, capacity);
        // The key just inserted always survives.
        QVERIFY(cache.lookup(QString::number(capacity), false).has_value());
    }

    void testReplacingExistingKeyDoesNotEvict() {
        WolframResultCache cache(2);
        cache.insert(QStringLiteral("a"), false, answer(QStringLiteral("1")));
        cache.insert(QStringLiteral("b"), false, answer(QStringLiteral("2")));
        cache.insert(QStringLiteral("a"), false, answer(QStringLiteral("3")));

        QCOMPARE(cache.size(), 2);
        QCOMPARE(*cache.lookup(QStringLiteral("a"), false)->first().plaintext, QStringLiteral("3"));
        QVERIFY(cache.lookup(QStringLiteral("b"), false).has_value());
    }

    void testClear() {
        WolframResultCache cache(2);
        cache.insert(QStringLiteral("a"), false, answer(QStringLiteral("1")));
        cache.clear();
        QCOMPARE(cache.size(), 0);
        QVERIFY(!cache.lookup(QStringLiteral("a"), false).has_value());
    }
};

QTEST_MAIN(TestResultCache)
#include "tst_result_cache.moc"
