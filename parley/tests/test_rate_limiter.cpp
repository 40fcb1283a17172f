#include <QtTest/QtTest>

#include "security/rate_limiter.hpp"

using namespace parley;

namespace {

struct ManualClock {
    RateLimiter::TimePoint now = RateLimiter::TimePoint(std::chrono::hours(1));

    RateLimiter::Clock fn() {
        return [this]() { return now; };
    }
};

}  // namespace

class RateLimiterTests : public QObject {
    Q_OBJECT

private slots:
    void allowsUpToLimitThenRejects();
    void windowResetsCounter();
    void keysAreIndependent();
    void clearForgetsKey();
    void sweepDropsStaleCounters();
    void banOutlastsWindow();
};

void RateLimiterTests::allowsUpToLimitThenRejects() {
    ManualClock clock;
    RateLimiter limiter(10, 3600, 0, clock.fn());
    std::string reason;

    for (int i = 0; i < 10; i++) {
        QVERIFY(limiter.allow("10.0.0.1", reason));
    }
    QVERIFY(!limiter.allow("10.0.0.1", reason));
    QCOMPARE(QString::fromStdString(reason), QString("too many requests"));
}

void RateLimiterTests::windowResetsCounter() {
    ManualClock clock;
    RateLimiter limiter(2, 60, 0, clock.fn());
    std::string reason;

    QVERIFY(limiter.allow("k", reason));
    QVERIFY(limiter.allow("k", reason));
    QVERIFY(!limiter.allow("k", reason));

    clock.now += std::chrono::seconds(59);
    QVERIFY(!limiter.allow("k", reason));

    clock.now += std::chrono::seconds(1);
    QVERIFY(limiter.allow("k", reason));
    QVERIFY(reason.empty());
}

void RateLimiterTests::keysAreIndependent() {
    ManualClock clock;
    RateLimiter limiter(1, 60, 0, clock.fn());
    std::string reason;

    QVERIFY(limiter.allow("10.0.0.1-offer", reason));
    QVERIFY(!limiter.allow("10.0.0.1-offer", reason));
    QVERIFY(limiter.allow("10.0.0.1-answer", reason));
    QVERIFY(limiter.allow("10.0.0.2-offer", reason));
}

void RateLimiterTests::clearForgetsKey() {
    ManualClock clock;
    RateLimiter limiter(1, 60, 0, clock.fn());
    std::string reason;

    QVERIFY(limiter.allow("k", reason));
    QVERIFY(!limiter.allow("k", reason));
    limiter.clear("k");
    QVERIFY(limiter.allow("k", reason));
}

void RateLimiterTests::sweepDropsStaleCounters() {
    ManualClock clock;
    RateLimiter limiter(5, 60, 0, clock.fn());
    std::string reason;

    limiter.allow("old", reason);
    clock.now += std::chrono::seconds(30);
    limiter.allow("fresh", reason);
    QCOMPARE(int(limiter.trackedKeys()), 2);

    clock.now += std::chrono::seconds(30);
    QCOMPARE(int(limiter.sweepExpired()), 1);
    QCOMPARE(int(limiter.trackedKeys()), 1);

    clock.now += std::chrono::seconds(30);
    QCOMPARE(int(limiter.sweepExpired()), 1);
    QCOMPARE(int(limiter.trackedKeys()), 0);
}

void RateLimiterTests::banOutlastsWindow() {
    ManualClock clock;
    RateLimiter limiter(1, 10, 300, clock.fn());
    std::string reason;

    QVERIFY(limiter.allow("k", reason));
    QVERIFY(!limiter.allow("k", reason));

    clock.now += std::chrono::seconds(60);
    QVERIFY(!limiter.allow("k", reason));
    QCOMPARE(QString::fromStdString(reason), QString("temporarily banned"));
    QCOMPARE(int(limiter.sweepExpired()), 0);

    clock.now += std::chrono::seconds(241);
    QVERIFY(limiter.allow("k", reason));
}

QTEST_MAIN(RateLimiterTests)
#include "test_rate_limiter.moc"
