#include "JobScheduler.h"
#include "calendar/TimeUtil.h"
#include "observability/Logging.h"
#include <stdexcept>

namespace scheduling {

AsioJobScheduler::AsioJobScheduler(boost::asio::io_context& ioc, boost::asio::thread_pool& workers)
    : ioc_(ioc), workers_(workers), state_(std::make_shared<State>()) {}

AsioJobScheduler::~AsioJobScheduler() { shutdown(); }

void AsioJobScheduler::submit(calendar::Clock::time_point run_at, ScheduledCallJob job, Handler handler) {
    if (!handler) throw std::invalid_argument("job handler is empty");
    auto timer = std::make_shared<Timer>(boost::asio::make_strand(ioc_));
    timer->expires_at(run_at);
    auto workers = workers_.get_executor();

    std::lock_guard<std::mutex> lk(state_->mu);
    if (state_->stopped) throw std::runtime_error("job scheduler is shut down");
    state_->timers.insert(timer);
    // Started under the lock so shutdown() either sees this timer or rejected the job.
    timer->async_wait([state = state_, timer, workers, job = std::move(job), handler = std::move(handler)](const boost::system::error_code& ec) {
        bool stopped;
        {
            std::lock_guard<std::mutex> lk(state->mu);
            state->timers.erase(timer);
            stopped = state->stopped;
        }
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                observability::log_warn("jobs.timer_failed", {{"event_id", job.event_id}, {"err", ec.message()}});
            }
            return;
        }
        if (stopped) return;
        boost::asio::post(workers, [job, handler] {
            observability::log_info("jobs.fire", {{"event_id", job.event_id}, {"run_at", calendar::format_iso_z(job.run_at)}});
            try {
                handler(job);
            } catch (const std::exception& e) {
                observability::log_error("jobs.handler_failed", {{"event_id", job.event_id}, {"err", std::string(e.what())}});
            } catch (...) {
                observability::log_error("jobs.handler_failed", {{"event_id", job.event_id}, {"err", std::string("non-standard exception")}});
            }
        });
    });
}

std::size_t AsioJobScheduler::pending() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->timers.size();
}

void AsioJobScheduler::shutdown() {
    std::unordered_set<std::shared_ptr<Timer>> timers;
    {
        std::lock_guard<std::mutex> lk(state_->mu);
        state_->stopped = true;
        timers.swap(state_->timers);
    }
    // Timers are touched only on their own strand.
    for (auto& t : timers) {
        boost::asio::post(t->get_executor(), [t]{
            boost::system::error_code ec;
            t->cancel(ec);
        });
    }
}

}
