#include "../src/core/config.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

/**
 * @brief Test configuration defaults, JSON files and command-line overrides
 *
 * Tests include:
 * 1. Defaults
 * 2. JSON document applied on top of defaults
 * 3. Command-line options override the file
 * 4. Invalid values are rejected with ConfigError
 * 5. Out-of-range integers never wrap into valid values
 */
static bool rejects_json(const std::string& text) {
    try {
        AppConfig cfg;
        apply_json(cfg, text);
        cfg.validate();
    } catch (const ConfigError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

static bool rejects(const std::vector<std::string>& args) {
    try {
        parse_args(args);
    } catch (const ConfigError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    std::cout << "Testing configuration..." << std::endl;

    // Test 1: Defaults
    {
        std::cout << "Test 1: defaults" << std::endl;

        AppConfig cfg = parse_args({});
        assert(cfg.broker.backend == Backend::Mqtt);
        assert(cfg.broker.host == "test.mosquitto.org");
        assert(cfg.broker.port == 1883);
        assert(cfg.broker.transport == TransportKind::Plain);
        assert(cfg.broker.endpoint() == "mqtt://test.mosquitto.org:1883");
        assert(cfg.schedule.topic == "d02/telemetry");
        assert(cfg.schedule.command_topic == "d02/cmd");
        assert(cfg.schedule.qos == 0);
        assert(cfg.schedule.interval == std::chrono::milliseconds(5000));
        assert(cfg.schedule.schema == SchemaKind::Rich);
        assert(cfg.schedule.mode == DeviceMode::AUTO);
        assert(cfg.schedule.max_ticks == 0);
        assert(cfg.log_level == "info");

        std::cout << "  Defaults test passed" << std::endl;
    }

    // Test 2: JSON document
    {
        std::cout << "Test 2: JSON configuration" << std::endl;

        AppConfig cfg;
        apply_json(cfg, R"({
            "broker": {"host": "broker.local", "port": 8883, "transport": "tls",
                       "username": "node", "password": "secret", "keepalive_s": 30,
                       "reconnect_attempts": 5},
            "schedule": {"interval_ms": 1000, "topic": "farm/a", "qos": 1,
                         "schema": "flat", "mode": "SCHEDULE", "seed": 9},
            "log_level": "debug"
        })");
        cfg.validate();
        assert(cfg.broker.host == "broker.local");
        assert(cfg.broker.port == 8883);
        assert(cfg.broker.transport == TransportKind::Tls);
        assert(cfg.broker.endpoint() == "mqtts://broker.local:8883");
        assert(cfg.broker.username == "node");
        assert(cfg.broker.keepalive_s == 30);
        assert(cfg.broker.reconnect_attempts == 5);
        assert(cfg.broker.client_id == "field-node-sim");
        assert(cfg.schedule.interval == std::chrono::milliseconds(1000));
        assert(cfg.schedule.topic == "farm/a");
        assert(cfg.schedule.qos == 1);
        assert(cfg.schedule.schema == SchemaKind::Flat);
        assert(cfg.schedule.mode == DeviceMode::SCHEDULE);
        assert(cfg.schedule.seed == 9);
        assert(cfg.log_level == "debug");

        // Password never appears in the summary
        assert(cfg.to_string().find("secret") == std::string::npos);

        bool threw = false;
        try {
            apply_json(cfg, R"({"schedule": {"qos": "high"}})");
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            apply_json(cfg, "not json");
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "  JSON configuration test passed" << std::endl;
    }

    // Test 3: Options win over the file regardless of order
    {
        std::cout << "Test 3: command-line overrides" << std::endl;

        const std::string path = "test_config_override.json";
        {
            std::ofstream out(path);
            out << R"({"broker": {"host": "from-file", "port": 1884},
                       "schedule": {"topic": "file/topic", "interval_ms": 250}})";
        }

        AppConfig cfg = parse_args({"--host", "from-cli", "--config", path, "--qos", "2",
                                    "--schema", "flat", "--ticks", "100"});
        assert(cfg.broker.host == "from-cli");
        assert(cfg.broker.port == 1884);
        assert(cfg.schedule.topic == "file/topic");
        assert(cfg.schedule.interval == std::chrono::milliseconds(250));
        assert(cfg.schedule.qos == 2);
        assert(cfg.schedule.schema == SchemaKind::Flat);
        assert(cfg.schedule.max_ticks == 100);
        std::remove(path.c_str());

        AppConfig zmq = parse_args({"--backend", "zmq", "--zmq-endpoint", "tcp://127.0.0.1:6000",
                                    "--host", ""});
        assert(zmq.broker.backend == Backend::Zmq);
        assert(zmq.broker.endpoint() == "tcp://127.0.0.1:6000");

        AppConfig ws = parse_args({"--transport", "websocket", "--port", "8080", "--ws-path", "/ws"});
        assert(ws.broker.endpoint() == "ws://test.mosquitto.org:8080/ws");

        std::cout << "  Override test passed" << std::endl;
    }

    // Test 4: Invalid input
    {
        std::cout << "Test 4: invalid configuration" << std::endl;

        assert(rejects({"--qos", "3"}));
        assert(rejects({"--qos", "one"}));
        assert(rejects({"--interval-ms", "0"}));
        assert(rejects({"--port", "70000"}));
        assert(rejects({"--topic", ""}));
        assert(rejects({"--schema", "nested"}));
        assert(rejects({"--mode", "TURBO"}));
        assert(rejects({"--transport", "quic"}));
        assert(rejects({"--seed", "-4"}));
        assert(rejects({"--log-level", "verbose"}));
        assert(rejects({"--bogus", "1"}));
        assert(rejects({"--host"}));
        assert(rejects({"--config", "/nonexistent/field-node.json"}));

        std::cout << "  Invalid configuration test passed" << std::endl;
    }

    // Test 5: Integers outside int range are errors, not wrapped values
    {
        std::cout << "Test 5: out-of-range integers" << std::endl;

        assert(rejects({"--qos", "4294967297"}));
        assert(rejects({"--port", "4294969179"}));
        assert(rejects({"--interval-ms", "4294967296"}));
        assert(rejects({"--port", "99999999999999999999"}));

        assert(rejects_json(R"({"schedule": {"max_ticks": -5}})"));
        assert(rejects_json(R"({"schedule": {"seed": -1}})"));
        assert(rejects_json(R"({"schedule": {"qos": 4294967297}})"));
        assert(rejects_json(R"({"schedule": {"interval_ms": 1.5}})"));
        assert(rejects_json(R"({"broker": {"port": 4294969179}})"));
        assert(rejects_json(R"({"broker": {"port": -4294965413}})"));
        assert(rejects_json(R"({"broker": {"connect_timeout_ms": 0}})"));
        assert(rejects_json(R"({"broker": {"connect_timeout_ms": -100}})"));

        AppConfig cfg;
        apply_json(cfg, R"({"schedule": {"max_ticks": 18446744073709551615, "seed": 0}})");
        cfg.validate();
        assert(cfg.schedule.max_ticks == 18446744073709551615ULL);
        assert(cfg.schedule.seed == 0);

        std::cout << "  Out-of-range test passed" << std::endl;
    }

    std::cout << "\n✅ All configuration tests passed!" << std::endl;
    return 0;
}
