#ifndef PARLEY_PERIODIC_TASK_HPP
#define PARLEY_PERIODIC_TASK_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace parley {

/**
 * Fixed-interval job on an io_context. A tick that throws is logged and the
 * timer is re-armed anyway; only stop() ends the schedule.
 */
class PeriodicTask : public std::enable_shared_from_this<PeriodicTask> {
public:
    PeriodicTask(boost::asio::io_context& ioc,
                 std::string name,
                 std::chrono::milliseconds interval,
                 std::function<void()> job);

    void start();
    void stop();

    const std::string& name() const { return name_; }

private:
    void schedule();
    void tick();

    boost::asio::steady_timer timer_;
    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> job_;
    bool running_ = false;
};

} // namespace parley

#endif // PARLEY_PERIODIC_TASK_HPP
