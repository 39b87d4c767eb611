#include <boost/asio.hpp>
#include <csignal>
#include <boost/asio/thread_pool.hpp>
#include <iostream>
#include <string>
#include <memory>
#include <thread>
#include <vector>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "calendar/CalendarPoller.h"
#include "calendar/GoogleCalendarSource.h"
#include "scheduling/EventRegistry.h"
#include "scheduling/JobScheduler.h"
#include "scheduling/SchedulingPipeline.h"
#include "telephony/BridgeResponder.h"
#include "telephony/CallDispatcher.h"
#include "telephony/TwilioClient.h"
#include "web/Dashboard.h"

using config::Config;
using observability::log_info;
using observability::set_log_level;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    int lvl = 2;
    switch (cfg.log_level) {
        case Config::LogLevel::DEBUG: lvl = 1; break;
        case Config::LogLevel::INFO: lvl = 2; break;
        case Config::LogLevel::WARN: lvl = 3; break;
        case Config::LogLevel::ERROR: lvl = 4; break;
    }
    set_log_level(lvl);

    auto problems = cfg.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) std::cerr << "fatal: " << p << "\n";
        return 2;
    }

    try {
        boost::asio::io_context io;
        boost::asio::thread_pool workers(static_cast<std::size_t>(cfg.worker_threads));
        // Dashboard calendar reads; kept apart so they never delay call jobs.
        boost::asio::thread_pool web_workers(static_cast<std::size_t>(cfg.http_threads));

        scheduling::AsioJobScheduler jobs(io, workers);
        telephony::TwilioClient twilio(cfg.twilio_account_sid, cfg.twilio_auth_token);
        telephony::CallDispatcher dispatcher(twilio, cfg.owner_phone_number, cfg.twilio_phone_number,
                                             cfg.app_url, cfg.webhook_signing_secret);
        scheduling::EventRegistry registry;
        scheduling::SchedulingPipeline pipeline(registry, jobs,
            [&dispatcher](const scheduling::ScheduledCallJob& job) {
                log_info("jobs.fired", {{"event_id", job.event_id}, {"event_name", job.event_name}});
                dispatcher.place_call(job.meeting_phone, job.event_name);
            },
            cfg.dedup_policy);

        calendar::GoogleCalendarSource source(cfg.google_token_file, cfg.calendar_id);
        auto poller = std::make_shared<calendar::CalendarPoller>(io, workers, source, pipeline,
            std::chrono::seconds(cfg.poll_interval_sec), std::chrono::seconds(cfg.lookahead_sec));

        telephony::BridgeResponder responder(cfg.owner_phone_number, cfg.webhook_signing_secret);
        web::Dashboard dashboard(*poller, pipeline, registry, responder, web_workers);
        Router router;
        dashboard.register_routes(router, cfg.metrics_enabled);

        HttpServer server(io, cfg.port, router, cfg.metrics_enabled, cfg.access_log);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            log_info("server_stop", {{"signal", int64_t(sig)}});
            poller->stop();
            jobs.shutdown();
            server.stop();
            io.stop();
        });

        log_info("server_start", {
            {"port", int64_t(server.port())},
            {"calendar_id", cfg.calendar_id},
            {"poll_interval_sec", int64_t(cfg.poll_interval_sec)},
            {"lookahead_sec", int64_t(cfg.lookahead_sec)},
        });
        server.run();
        poller->start();

        std::vector<std::thread> threads;
        for (int i = 1; i < cfg.http_threads; ++i) threads.emplace_back([&io]{ io.run(); });
        io.run();
        for (auto& t : threads) t.join();
        web_workers.join();
        workers.join();
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
