#include <QtTest/QtTest>

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>

#include "server/periodic_task.hpp"

using namespace parley;

class PeriodicTaskTests : public QObject {
    Q_OBJECT

private slots:
    void throwingJobIsRescheduled();
    void stopEndsSchedule();
};

void PeriodicTaskTests::throwingJobIsRescheduled() {
    boost::asio::io_context ioc;
    int runs = 0;
    auto task = std::make_shared<PeriodicTask>(ioc, "flaky", std::chrono::milliseconds(10), [&]() {
        ++runs;
        if (runs == 1) {
            throw std::runtime_error("first run fails");
        }
        if (runs == 3) {
            ioc.stop();
        }
    });
    task->start();

    ioc.run_for(std::chrono::seconds(5));

    QCOMPARE(runs, 3);
}

void PeriodicTaskTests::stopEndsSchedule() {
    boost::asio::io_context ioc;
    int runs = 0;
    std::shared_ptr<PeriodicTask> task;
    task = std::make_shared<PeriodicTask>(ioc, "counter", std::chrono::milliseconds(10), [&]() {
        ++runs;
        if (runs == 2) {
            task->stop();
        }
    });
    task->start();

    // Returns early once the cancelled timer leaves no pending work.
    ioc.run_for(std::chrono::seconds(5));

    QCOMPARE(runs, 2);
}

QTEST_MAIN(PeriodicTaskTests)
#include "test_periodic_task.moc"
