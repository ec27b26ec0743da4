#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <vector>

#include "control/loop.hpp"
#include "core/config.hpp"
#include "core/interrupt.hpp"
#include "core/log.hpp"
#include "ipc/mqtt_connection.hpp"
#include "ipc/schema.hpp"
#include "ipc/status_rep.hpp"
#include "ipc/zmq_transport.hpp"

// Shutdown request shared with the signal handler
static Interrupt shutdown_requested;

void signal_handler(int) {
    shutdown_requested.request_from_signal();
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto& a : args) {
        if (a == "--help" || a == "-h") {
            std::cout << usage();
            return 0;
        }
    }

    // Install signal handlers for clean shutdown
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        AppConfig cfg = parse_args(args);

        LogLevel level = LogLevel::INFO;
        if (Log::parse_level(cfg.log_level, level)) {
            Log::set_level(level);
        }

        Log::info("main", "Field node simulator - starting up");
        Log::info("main", cfg.to_string());

        std::unique_ptr<ITransport> transport;
        if (cfg.broker.backend == Backend::Zmq) {
            transport = std::make_unique<ZmqTransport>(cfg.broker.zmq_endpoint);
        } else {
            transport = std::make_unique<MqttConnection>(cfg.broker);
        }

        std::unique_ptr<SnapshotSchema> schema = make_schema(cfg.schedule.schema);
        PublishLoop loop(cfg.schedule, *schema, shutdown_requested);

        std::unique_ptr<StatusRep> status;
        if (!cfg.schedule.status_endpoint.empty()) {
            status = std::make_unique<StatusRep>(cfg.schedule.status_endpoint);
            if (!status->is_bound()) {
                Log::error("main", "failed to bind status responder");
                return 1;
            }
            Log::info("main", "status responder bound to " + status->get_bind_address());
            loop.status = status.get();
        }

        Log::info("main", "Press Ctrl+C to stop");
        ExitStatus result = loop.run(*transport);

        if (result == ExitStatus::ConnectFailed) {
            Log::error("main", "Shutdown after connection failure.");
            return 1;
        }
        Log::info("main", "Shutdown complete.");

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
