#pragma once

#include "CallJob.h"
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace scheduling {

// One-shot, time addressed job runner.
class JobScheduler {
public:
    using Handler = std::function<void(const ScheduledCallJob&)>;
    virtual ~JobScheduler() = default;
    // Invokes `handler(job)` once, at or after `run_at`. Never blocks the caller.
    // Throws std::runtime_error when the job cannot be accepted.
    virtual void submit(calendar::Clock::time_point run_at, ScheduledCallJob job, Handler handler) = 0;
};

// Timers live on the application io_context; handlers run on `workers` so a
// blocking call placement never delays other timers. A handler that throws is
// logged and does not affect other jobs.
class AsioJobScheduler : public JobScheduler {
public:
    AsioJobScheduler(boost::asio::io_context& ioc, boost::asio::thread_pool& workers);
    ~AsioJobScheduler() override;

    void submit(calendar::Clock::time_point run_at, ScheduledCallJob job, Handler handler) override;
    std::size_t pending() const;
    // Cancels every pending timer; later submissions are rejected. Safe to
    // call while the io_context runs; the scheduler may then be destroyed.
    void shutdown();

private:
    using Timer = boost::asio::system_timer;
    // Shared with in-flight timer completions, which may outlive the scheduler.
    struct State {
        std::mutex mu;
        std::unordered_set<std::shared_ptr<Timer>> timers;
        bool stopped = false;
    };

    boost::asio::io_context& ioc_;
    boost::asio::thread_pool& workers_;
    std::shared_ptr<State> state_;
};

}
