#include "../../include/server/periodic_task.hpp"
#include "../../include/utils/logger.hpp"

namespace parley {

PeriodicTask::PeriodicTask(boost::asio::io_context& ioc,
                           std::string name,
                           std::chrono::milliseconds interval,
                           std::function<void()> job)
    : timer_(boost::asio::make_strand(ioc)),
      name_(std::move(name)),
      interval_(interval),
      job_(std::move(job)) {}

void PeriodicTask::start() {
    boost::asio::post(timer_.get_executor(), [self = shared_from_this()]() {
        if (self->running_) {
            return;
        }
        self->running_ = true;
        Logger::getInstance().info("Scheduled task '" + self->name_ + "' started (every " +
                                   std::to_string(self->interval_.count()) + " ms)");
        self->schedule();
    });
}

void PeriodicTask::stop() {
    boost::asio::post(timer_.get_executor(), [self = shared_from_this()]() {
        if (!self->running_) {
            return;
        }
        self->running_ = false;
        self->timer_.cancel();
        Logger::getInstance().info("Scheduled task '" + self->name_ + "' stopped");
    });
}

void PeriodicTask::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !self->running_) {
            return;
        }
        if (ec) {
            Logger::getInstance().error("Timer error in task '" + self->name_ + "': " + ec.message());
        } else {
            self->tick();
        }
        self->schedule();
    });
}

void PeriodicTask::tick() {
    try {
        job_();
    } catch (const std::exception& e) {
        Logger::getInstance().error("Scheduled task '" + name_ + "' failed: " + e.what());
    }
}

} // namespace parley
