#pragma once
#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../ipc/schema.hpp"
#include "log.hpp"
#include "telemetry.hpp"

/**
 * @brief Invalid or unreadable configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Which transport library carries the payloads
 */
enum class Backend {
    Mqtt,   ///< MQTT broker via libmosquitto
    Zmq     ///< Local ZeroMQ PUB socket, no broker
};

/**
 * @brief How the MQTT session reaches the broker
 */
enum class TransportKind {
    Plain,
    Tls,
    WebSocket
};

inline const char* transport_name(TransportKind kind) {
    switch (kind) {
        case TransportKind::Plain:     return "plain";
        case TransportKind::Tls:       return "tls";
        case TransportKind::WebSocket: return "websocket";
    }
    return "plain";
}

/**
 * @brief Broker endpoint, credentials and session policy
 */
struct BrokerConfig {
    Backend backend{Backend::Mqtt};
    std::string host{"test.mosquitto.org"};
    int port{1883};
    TransportKind transport{TransportKind::Plain};
    std::string ws_path{"/mqtt"};
    std::string username;
    std::string password;
    std::string client_id{"field-node-sim"};
    std::string ca_file;                ///< Empty: system trust store
    bool tls_insecure{false};           ///< Skip server hostname verification
    int keepalive_s{60};
    std::chrono::milliseconds connect_timeout{5000};
    int connect_attempts{3};            ///< Initial connect budget
    std::chrono::seconds reconnect_delay_min{1};
    std::chrono::seconds reconnect_delay_max{120};
    int reconnect_attempts{0};          ///< 0 = retry forever
    std::string zmq_endpoint{"tcp://127.0.0.1:5556"};

    std::string endpoint() const {
        if (backend == Backend::Zmq) {
            return zmq_endpoint;
        }
        std::ostringstream oss;
        oss << (transport == TransportKind::Tls ? "mqtts://" :
                transport == TransportKind::WebSocket ? "ws://" : "mqtt://")
            << host << ":" << port;
        if (transport == TransportKind::WebSocket) {
            oss << ws_path;
        }
        return oss.str();
    }
};

/**
 * @brief Publish cadence and payload shape
 */
struct ScheduleConfig {
    std::chrono::milliseconds interval{5000};
    std::string topic{"d02/telemetry"};
    std::string command_topic{"d02/cmd"};   ///< Used by the command publisher, not by the loop
    int qos{0};
    SchemaKind schema{SchemaKind::Rich};
    DeviceMode mode{DeviceMode::AUTO};
    std::uint64_t seed{1};
    std::uint64_t max_ticks{0};             ///< 0 = run until interrupted
    std::string status_endpoint;            ///< Empty: no status responder
};

/**
 * @brief Complete simulator configuration, built once at startup
 */
struct AppConfig {
    BrokerConfig broker;
    ScheduleConfig schedule;
    std::string log_level{"info"};

    /**
     * @brief Check cross-field constraints
     * @throws ConfigError on the first violation
     */
    void validate() const {
        if (schedule.interval.count() <= 0) {
            throw ConfigError("publish interval must be positive");
        }
        if (schedule.qos < 0 || schedule.qos > 2) {
            throw ConfigError("qos must be 0, 1 or 2");
        }
        if (schedule.topic.empty()) {
            throw ConfigError("telemetry topic must not be empty");
        }
        if (broker.backend == Backend::Mqtt) {
            if (broker.host.empty()) {
                throw ConfigError("broker host must not be empty");
            }
            if (broker.port <= 0 || broker.port > 65535) {
                throw ConfigError("broker port out of range: " + std::to_string(broker.port));
            }
            if (broker.keepalive_s < 5) {
                throw ConfigError("keepalive must be at least 5 seconds");
            }
        }
        LogLevel level;
        if (!Log::parse_level(log_level, level)) {
            throw ConfigError("unknown log level: " + log_level);
        }
        if (broker.connect_timeout.count() <= 0) {
            throw ConfigError("connect timeout must be positive");
        }
        if (broker.connect_attempts < 1) {
            throw ConfigError("connect_attempts must be at least 1");
        }
        if (broker.reconnect_attempts < 0) {
            throw ConfigError("reconnect_attempts must not be negative");
        }
        if (broker.reconnect_delay_min.count() < 1 ||
            broker.reconnect_delay_max < broker.reconnect_delay_min) {
            throw ConfigError("reconnect delays must satisfy 1 <= min <= max");
        }
    }

    /**
     * @brief Human-readable summary (password masked)
     */
    std::string to_string() const {
        std::ostringstream oss;
        oss << "endpoint=" << broker.endpoint()
            << " topic=" << schedule.topic
            << " qos=" << schedule.qos
            << " interval=" << schedule.interval.count() << "ms"
            << " schema=" << schema_name(schedule.schema)
            << " mode=" << mode_name(schedule.mode)
            << " user=" << (broker.username.empty() ? "-" : broker.username);
        return oss.str();
    }
};

namespace config_detail {

inline Backend parse_backend(const std::string& s) {
    if (s == "mqtt") return Backend::Mqtt;
    if (s == "zmq") return Backend::Zmq;
    throw ConfigError("unknown backend: " + s);
}

inline TransportKind parse_transport(const std::string& s) {
    if (s == "plain" || s == "tcp") return TransportKind::Plain;
    if (s == "tls" || s == "ssl") return TransportKind::Tls;
    if (s == "websocket" || s == "websockets" || s == "ws") return TransportKind::WebSocket;
    throw ConfigError("unknown transport: " + s);
}

inline SchemaKind to_schema(const std::string& s) {
    SchemaKind kind;
    if (!parse_schema(s, kind)) throw ConfigError("unknown schema: " + s);
    return kind;
}

inline DeviceMode to_mode(const std::string& s) {
    DeviceMode mode;
    if (!parse_mode(s, mode)) throw ConfigError("unknown mode: " + s);
    return mode;
}

inline long long to_integer(const std::string& key, const std::string& value) {
    try {
        std::size_t used = 0;
        long long v = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError("option " + key + " expects an integer, got '" + value + "'");
    }
}

inline int to_int(const std::string& key, const std::string& value) {
    long long v = to_integer(key, value);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigError("option " + key + " out of range: " + value);
    }
    return static_cast<int>(v);
}

inline std::uint64_t to_unsigned(const std::string& key, const std::string& value) {
    long long v = to_integer(key, value);
    if (v < 0) throw ConfigError("option " + key + " must not be negative");
    return static_cast<std::uint64_t>(v);
}

/// Integer member of a JSON object, range-checked to int; missing keeps fallback
inline int json_int(const nlohmann::json& obj, const char* key, int fallback) {
    if (!obj.contains(key)) return fallback;
    const auto& v = obj.at(key);
    if (!v.is_number_integer()) {
        throw ConfigError(std::string("'") + key + "' expects an integer");
    }
    if (v.is_number_unsigned()) {
        if (v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw ConfigError(std::string("'") + key + "' out of range");
        }
        return static_cast<int>(v.get<std::uint64_t>());
    }
    std::int64_t n = v.get<std::int64_t>();
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        throw ConfigError(std::string("'") + key + "' out of range");
    }
    return static_cast<int>(n);
}

/// Non-negative integer member of a JSON object; missing keeps fallback
inline std::uint64_t json_unsigned(const nlohmann::json& obj, const char* key, std::uint64_t fallback) {
    if (!obj.contains(key)) return fallback;
    const auto& v = obj.at(key);
    if (!v.is_number_unsigned()) {
        throw ConfigError(std::string("'") + key + "' expects a non-negative integer");
    }
    return v.get<std::uint64_t>();
}

} // namespace config_detail

/**
 * @brief Apply a JSON configuration document on top of cfg
 *
 * Recognized layout:
 * {"broker": {"backend","host","port","transport","ws_path","username",
 *             "password","client_id","ca_file","tls_insecure","keepalive_s",
 *             "connect_timeout_ms","connect_attempts","reconnect_delay_min_s",
 *             "reconnect_delay_max_s","reconnect_attempts","zmq_endpoint"},
 *  "schedule": {"interval_ms","topic","command_topic","qos","schema","mode",
 *               "seed","max_ticks","status_endpoint"},
 *  "log_level": "info"}
 * Missing keys keep their current value.
 */
inline void apply_json(AppConfig& cfg, const std::string& text) {
    using namespace config_detail;
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ConfigError("configuration is not a JSON object");
    }

    try {
        if (j.contains("broker")) {
            const auto& b = j.at("broker");
            auto& out = cfg.broker;
            if (b.contains("backend")) out.backend = parse_backend(b.at("backend").get<std::string>());
            out.host = b.value("host", out.host);
            out.port = json_int(b, "port", out.port);
            if (b.contains("transport")) out.transport = parse_transport(b.at("transport").get<std::string>());
            out.ws_path = b.value("ws_path", out.ws_path);
            out.username = b.value("username", out.username);
            out.password = b.value("password", out.password);
            out.client_id = b.value("client_id", out.client_id);
            out.ca_file = b.value("ca_file", out.ca_file);
            out.tls_insecure = b.value("tls_insecure", out.tls_insecure);
            out.keepalive_s = json_int(b, "keepalive_s", out.keepalive_s);
            out.connect_timeout = std::chrono::milliseconds(
                json_int(b, "connect_timeout_ms", static_cast<int>(out.connect_timeout.count())));
            out.connect_attempts = json_int(b, "connect_attempts", out.connect_attempts);
            out.reconnect_delay_min = std::chrono::seconds(
                json_int(b, "reconnect_delay_min_s", static_cast<int>(out.reconnect_delay_min.count())));
            out.reconnect_delay_max = std::chrono::seconds(
                json_int(b, "reconnect_delay_max_s", static_cast<int>(out.reconnect_delay_max.count())));
            out.reconnect_attempts = json_int(b, "reconnect_attempts", out.reconnect_attempts);
            out.zmq_endpoint = b.value("zmq_endpoint", out.zmq_endpoint);
        }
        if (j.contains("schedule")) {
            const auto& s = j.at("schedule");
            auto& out = cfg.schedule;
            out.interval = std::chrono::milliseconds(
                json_int(s, "interval_ms", static_cast<int>(out.interval.count())));
            out.topic = s.value("topic", out.topic);
            out.command_topic = s.value("command_topic", out.command_topic);
            out.qos = json_int(s, "qos", out.qos);
            if (s.contains("schema")) out.schema = to_schema(s.at("schema").get<std::string>());
            if (s.contains("mode")) out.mode = to_mode(s.at("mode").get<std::string>());
            out.seed = json_unsigned(s, "seed", out.seed);
            out.max_ticks = json_unsigned(s, "max_ticks", out.max_ticks);
            out.status_endpoint = s.value("status_endpoint", out.status_endpoint);
        }
        cfg.log_level = j.value("log_level", cfg.log_level);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("bad configuration value: ") + e.what());
    }
}

inline void load_file(AppConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    apply_json(cfg, buffer.str());
}

inline const char* usage() {
    return
        "usage: field-node-sim [options]\n"
        "  --config PATH          JSON configuration file (applied first)\n"
        "  --backend mqtt|zmq     transport library (default mqtt)\n"
        "  --host HOST            broker host\n"
        "  --port N               broker port\n"
        "  --transport KIND       plain | tls | websocket\n"
        "  --ws-path PATH         websocket path\n"
        "  --user NAME            broker username\n"
        "  --password SECRET      broker password\n"
        "  --client-id ID         MQTT client id\n"
        "  --ca-file PATH         CA bundle for tls\n"
        "  --topic TOPIC          telemetry topic\n"
        "  --qos 0|1|2            publish QoS\n"
        "  --interval-ms N        publish interval\n"
        "  --schema rich|flat     payload layout\n"
        "  --mode AUTO|MANUAL|SCHEDULE\n"
        "  --seed N               random seed\n"
        "  --ticks N              stop after N ticks (0 = forever)\n"
        "  --zmq-endpoint EP      ZeroMQ PUB bind address\n"
        "  --status-endpoint EP   ZeroMQ REP status address\n"
        "  --log-level LEVEL      error | warn | info | debug\n";
}

/**
 * @brief Build the configuration from command-line arguments
 *
 * --config is applied before any other option regardless of its position,
 * so explicit options always override the file.
 * @throws ConfigError on unknown options, missing values or invalid values
 */
inline AppConfig parse_args(const std::vector<std::string>& args) {
    using namespace config_detail;
    AppConfig cfg;

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw ConfigError("--config expects a value");
            load_file(cfg, args[i + 1]);
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& key = args[i];
        if (i + 1 >= args.size()) {
            throw ConfigError("option " + key + " expects a value");
        }
        const std::string& value = args[++i];

        if (key == "--config") continue;
        else if (key == "--backend") cfg.broker.backend = parse_backend(value);
        else if (key == "--host") cfg.broker.host = value;
        else if (key == "--port") cfg.broker.port = to_int(key, value);
        else if (key == "--transport") cfg.broker.transport = parse_transport(value);
        else if (key == "--ws-path") cfg.broker.ws_path = value;
        else if (key == "--user") cfg.broker.username = value;
        else if (key == "--password") cfg.broker.password = value;
        else if (key == "--client-id") cfg.broker.client_id = value;
        else if (key == "--ca-file") cfg.broker.ca_file = value;
        else if (key == "--topic") cfg.schedule.topic = value;
        else if (key == "--qos") cfg.schedule.qos = to_int(key, value);
        else if (key == "--interval-ms") cfg.schedule.interval = std::chrono::milliseconds(to_int(key, value));
        else if (key == "--schema") cfg.schedule.schema = to_schema(value);
        else if (key == "--mode") cfg.schedule.mode = to_mode(value);
        else if (key == "--seed") cfg.schedule.seed = to_unsigned(key, value);
        else if (key == "--ticks") cfg.schedule.max_ticks = to_unsigned(key, value);
        else if (key == "--zmq-endpoint") cfg.broker.zmq_endpoint = value;
        else if (key == "--status-endpoint") cfg.schedule.status_endpoint = value;
        else if (key == "--log-level") cfg.log_level = value;
        else throw ConfigError("unknown option: " + key);
    }

    cfg.validate();
    return cfg;
}
