#include "delta/order_client.hpp"
#include "delta/ws_client.hpp"
#include "replicator/config.hpp"
#include "replicator/connection_manager.hpp"
#include "replicator/context.hpp"
#include "replicator/decision_engine.hpp"
#include "replicator/event_router.hpp"
#include "replicator/execution_worker.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<int> g_signal{0};

void handle_signal(int sig) {
    g_signal.store(sig);
}

void install_shutdown_handler() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

} // namespace

int main(int argc, char** argv) {
    replicator::BotConfig config;
    try {
        const auto command_line = replicator::parse_command_line(argc, argv);
        if (command_line.show_help) {
            std::cout << replicator::usage(argv[0]);
            return 0;
        }
        if (!replicator::load_env_file(command_line.env_file) && command_line.env_file != ".env") {
            throw replicator::ConfigError("cannot read env file " + command_line.env_file);
        }
        replicator::apply_cli_overrides(command_line);
        config = replicator::load_config();
        config.validate();
    } catch (const replicator::ConfigError& ex) {
        std::cerr << "[Config] " << ex.what() << std::endl;
        std::cerr << "Run with --help for the list of options." << std::endl;
        return 2;
    }

    replicator::ReplicationContext context{config};

    std::unique_ptr<delta::OrderClient> orders;
    try {
        orders = std::make_unique<delta::OrderClient>(config.credentials(), config.order_settings(),
                                                      config.client_options());
    } catch (const delta::HttpError& ex) {
        std::cerr << "[Order] " << ex.what() << std::endl;
        return 1;
    }
    orders->set_retry_callback([&context](const delta::RetryNotice& notice) {
        context.log.action(notice.status_code == 0 ? "rest_exc_retry" : "rest_retry",
                           {{"path", notice.path},
                            {"status", notice.status_code},
                            {"attempt", notice.attempt},
                            {"sleep", notice.delay.count() / 1000.0},
                            {"err", notice.error}});
    });
    orders->set_audit_callback([&context](const delta::OrderAudit& audit) {
        if (audit.kind == delta::OrderAudit::Kind::Action) {
            context.log.action(audit.name, audit.context);
        } else {
            context.log.event(audit.name, audit.context);
        }
    });

    replicator::DecisionEngine engine{config.decision_settings(), context.dedup, context.tracker,
                                      context.ledger, context.queue, context.log};
    replicator::EventRouter router{context.log,
                                   [&engine](const replicator::AccountEvent& event) { engine.handle(event); }};

    const auto ws_options = config.ws_options();
    replicator::ConnectionManager connection{
        config.connection_settings(),
        [ws_options]() -> std::unique_ptr<delta::WsSession> {
            return std::make_unique<delta::WsClient>(ws_options);
        },
        router, context.log, context.shutdown};

    replicator::ExecutionWorker worker{context.queue, *orders, context.ledger, context.log, context.shutdown};

    install_shutdown_handler();
    std::atomic<bool> watching{true};
    std::thread signal_watcher([&] {
        while (watching.load()) {
            if (const int sig = g_signal.load()) {
                std::cout << "\n[Shutdown] Received signal " << sig << ", stopping gracefully" << std::endl;
                context.log.action("signal", {{"sig", sig}});
                context.shutdown.request("signal");
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::cout << "[Main] Starting Delta multiplier bot | multiplier=" << config.multiplier
              << " | DRY_RUN=" << (config.dry_run ? "true" : "false")
              << " | order_type=" << config.order_type << std::endl;
    context.log.event("startup", {{"multiplier", config.multiplier},
                                  {"dry_run", config.dry_run},
                                  {"order_type", config.order_type},
                                  {"allow_symbols", config.allow_symbols}});

    worker.start();
    try {
        connection.run();
    } catch (const std::exception& ex) {
        std::cerr << "[Main] Connection loop failed: " << ex.what() << std::endl;
        context.log.event("error", {{"error", ex.what()}});
    }

    context.shutdown.request("finally");
    const bool worker_stopped = worker.join_for(std::chrono::duration<double>(config.shutdown_timeout_s));
    context.log.action("shutdown_done", {{"reason", context.shutdown.reason()}, {"worker_stopped", worker_stopped}});

    watching = false;
    signal_watcher.join();
    std::cout << "[Main] Shutdown complete" << std::endl;
    if (!worker_stopped) {
        // The detached worker still references objects on this frame; exit
        // without unwinding it.
        std::exit(0);
    }
    return 0;
}
