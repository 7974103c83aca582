#include <QTest>
#include <QThread>
#include "core/cache/LruCache.hpp"
#include <atomic>
#include <memory>
#include <vector>

namespace {

using StringCache = hush::LruCache<QString>;

std::unique_ptr<StringCache> makeCache(qint64 budget)
{
    return std::make_unique<StringCache>("TestCache", budget,
                                         [](const QString& v) { return qint64(v.size()); });
}

} // namespace

class TestLruCache : public QObject {
    Q_OBJECT
private slots:
    void computesOnceThenHits()
    {
        auto cache = makeCache(100);
        int calls = 0;
        auto compute = [&] { ++calls; return QString("value"); };

        QCOMPARE(cache->getOrCompute("k", compute), QString("value"));
        QCOMPARE(cache->getOrCompute("k", compute), QString("value"));
        QCOMPARE(calls, 1);
        QCOMPARE(cache->residentBytes(), qint64(5));
        QVERIFY(cache->peek("k") == QString("value"));
        QVERIFY(!cache->peek("missing").has_value());
    }

    void evictsLeastRecentlyUsed()
    {
        auto cache = makeCache(10);
        cache->getOrCompute("a", [] { return QString("aaaa"); });
        cache->getOrCompute("b", [] { return QString("bbbb"); });
        QVERIFY(cache->peek("a").has_value());  // a is now most recent

        cache->getOrCompute("c", [] { return QString("cccc"); });
        QVERIFY(cache->peek("a").has_value());
        QVERIFY(!cache->peek("b").has_value());
        QVERIFY(cache->peek("c").has_value());
        QVERIFY(cache->residentBytes() <= cache->budget());
    }

    void oversizedValueIsReturnedButNotKept()
    {
        auto cache = makeCache(4);
        QCOMPARE(cache->getOrCompute("big", [] { return QString("too large"); }), QString("too large"));
        QCOMPARE(cache->size(), 0);
        QCOMPARE(cache->residentBytes(), qint64(0));
    }

    void shrinkingBudgetEvicts()
    {
        auto cache = makeCache(100);
        cache->getOrCompute("a", [] { return QString(40, 'a'); });
        cache->getOrCompute("b", [] { return QString(40, 'b'); });
        cache->setBudget(50);
        QCOMPARE(cache->size(), 1);
        QVERIFY(cache->peek("b").has_value());
        cache->clear();
        QCOMPARE(cache->size(), 0);
        QCOMPARE(cache->residentBytes(), qint64(0));
    }

    void failureIsCachedWithBackoff()
    {
        auto cache = makeCache(1000);
        qint64 now = 0;
        cache->setClock([&] { return now; });

        int calls = 0;
        auto failing = [&]() -> QString {
            ++calls;
            throw hush::CacheComputeError("broken");
        };

        QVERIFY(cache->getOrCompute("k", failing).isEmpty());
        QVERIFY(cache->isNegative("k"));
        QVERIFY(cache->getOrCompute("k", failing).isEmpty());
        QCOMPARE(calls, 1);

        now = 1000;
        cache->getOrCompute("k", failing);
        QCOMPARE(calls, 2);

        // second failure doubles the wait
        now = 2500;
        cache->getOrCompute("k", failing);
        QCOMPARE(calls, 2);
        now = 3000;
        QCOMPARE(cache->getOrCompute("k", [&] { ++calls; return QString("ok"); }), QString("ok"));
        QCOMPARE(calls, 3);
        QVERIFY(!cache->isNegative("k"));
    }

    void concurrentMissesComputeOnce()
    {
        auto cache = makeCache(1000);
        std::atomic<int> calls{0};
        std::atomic<int> matches{0};

        std::vector<std::unique_ptr<QThread>> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back(QThread::create([&] {
                const QString v = cache->getOrCompute("shared", [&] {
                    ++calls;
                    QThread::msleep(100);
                    return QString("computed");
                });
                if (v == QLatin1String("computed"))
                    ++matches;
            }));
        }
        for (auto& t : threads)
            t->start();
        for (auto& t : threads)
            QVERIFY(t->wait(5000));

        QCOMPARE(calls.load(), 1);
        QCOMPARE(matches.load(), 8);
    }
};

QTEST_GUILESS_MAIN(TestLruCache)
#include "test_lru_cache.moc"
