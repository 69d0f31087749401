#include <QtTest/QtTest>

#include "core/query/keyword_spec_cache.h"

class TestKeywordSpecCache : public QObject {
    Q_OBJECT

private slots:
    void testHitReturnsSameParse();
    void testChangedSpecReparses();
    void testLruEviction();
    void testInvalidateAndClear();
    void testZeroCapacityNeverStores();
};

void TestKeywordSpecCache::testHitReturnsSameParse()
{
    rb::KeywordSpecCache cache;
    const auto first = cache.get(1, QStringLiteral("wifi,password"));
    const auto second = cache.get(1, QStringLiteral("wifi,password"));
    QCOMPARE(first.get(), second.get());
    QCOMPARE(first->phrases().size(), 2);

    const auto stats = cache.stats();
    QCOMPARE(stats.hits, uint64_t(1));
    QCOMPARE(stats.misses, uint64_t(1));
    QCOMPARE(stats.currentSize, 1);
}

void TestKeywordSpecCache::testChangedSpecReparses()
{
    rb::KeywordSpecCache cache;
    const auto before = cache.get(7, QStringLiteral("hours"));
    const auto after = cache.get(7, QStringLiteral("hours,re:^open"));
    QVERIFY(before.get() != after.get());
    QCOMPARE(before->matchers.size(), size_t(1));
    QCOMPARE(after->matchers.size(), size_t(2));
    QCOMPARE(cache.stats().misses, uint64_t(2));
    QCOMPARE(cache.stats().currentSize, 1);
}

void TestKeywordSpecCache::testLruEviction()
{
    rb::KeywordSpecCacheConfig config;
    config.maxEntries = 2;
    rb::KeywordSpecCache cache(config);

    cache.get(1, QStringLiteral("a"));
    cache.get(2, QStringLiteral("b"));
    cache.get(1, QStringLiteral("a"));   // 1 becomes most recent
    cache.get(3, QStringLiteral("c"));   // evicts 2

    QCOMPARE(cache.stats().evictions, uint64_t(1));
    QCOMPARE(cache.stats().currentSize, 2);

    cache.get(1, QStringLiteral("a"));
    QCOMPARE(cache.stats().hits, uint64_t(2));
    cache.get(2, QStringLiteral("b"));
    QCOMPARE(cache.stats().misses, uint64_t(4));
}

void TestKeywordSpecCache::testInvalidateAndClear()
{
    rb::KeywordSpecCache cache;
    cache.get(1, QStringLiteral("a"));
    cache.get(2, QStringLiteral("b"));

    cache.invalidate(1);
    QCOMPARE(cache.stats().currentSize, 1);
    cache.invalidate(42);
    QCOMPARE(cache.stats().currentSize, 1);

    cache.clear();
    QCOMPARE(cache.stats().currentSize, 0);
}

void TestKeywordSpecCache::testZeroCapacityNeverStores()
{
    rb::KeywordSpecCacheConfig config;
    config.maxEntries = 0;
    rb::KeywordSpecCache cache(config);

    const auto parsed = cache.get(1, QStringLiteral("wifi"));
    QCOMPARE(parsed->phrases(), QStringList({QStringLiteral("wifi")}));
    QCOMPARE(cache.stats().currentSize, 0);
}

QTEST_MAIN(TestKeywordSpecCache)
#include "test_keyword_spec_cache.moc"
