#pragma once
#include <mosquitto.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "../core/config.hpp"
#include "../core/log.hpp"
#include "transport.hpp"

/**
 * @brief Process-wide libmosquitto init/cleanup
 */
struct MosquittoLibrary {
    MosquittoLibrary() { mosquitto_lib_init(); }
    ~MosquittoLibrary() { mosquitto_lib_cleanup(); }

    static MosquittoLibrary& instance() {
        static MosquittoLibrary lib;
        return lib;
    }
};

/**
 * @brief Map a libmosquitto return code from connect/loop to a connection error
 * @param rc MOSQ_ERR_* value
 * @param err errno captured right after the failing call
 */
inline ConnectionError classify_connect_error(int rc, int err) {
    switch (rc) {
        case MOSQ_ERR_TLS:
            return ConnectionError::TLSHandshakeFailed;
        case MOSQ_ERR_CONN_REFUSED:
        case MOSQ_ERR_AUTH:
            return ConnectionError::AuthRejected;
        case MOSQ_ERR_ERRNO:
            if (err == ETIMEDOUT) return ConnectionError::Timeout;
            return ConnectionError::NetworkUnreachable;
        case MOSQ_ERR_NOT_SUPPORTED:
            return ConnectionError::Unsupported;
        default:
            return ConnectionError::NetworkUnreachable;
    }
}

/**
 * @brief Map a CONNACK return code (MQTT 3.1.1) to a connection error
 */
inline ConnectionError classify_connack(int connack_rc) {
    switch (connack_rc) {
        case 3:   // server unavailable
            return ConnectionError::NetworkUnreachable;
        case 1:   // unacceptable protocol version
        case 2:   // identifier rejected
        case 4:   // bad user name or password
        case 5:   // not authorised
        default:
            return ConnectionError::AuthRejected;
    }
}

/**
 * @brief Map a libmosquitto publish return code to a publish error
 */
inline PublishError classify_publish_error(int rc, int err) {
    switch (rc) {
        case MOSQ_ERR_NO_CONN:
        case MOSQ_ERR_CONN_LOST:
            return PublishError::NotConnected;
        case MOSQ_ERR_ERRNO:
            if (err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT) {
                return PublishError::Timeout;
            }
            return PublishError::BrokerRejected;
        default:
            return PublishError::BrokerRejected;
    }
}

/**
 * @brief MQTT connection manager over libmosquitto
 *
 * Owns one mosquitto client and one background network thread. The
 * thread services keep-alive and incoming acknowledgements and, when the
 * link drops, reconnects with exponential backoff whose floor is the
 * keep-alive interval. Session state changes go through next_state() and
 * are published through an atomic, so the publish loop can poll state()
 * from its own thread.
 *
 * QoS >= 1 publishes are fire-and-return-a-handle: publish() returns once
 * the message is queued, carrying the broker message id. Acknowledgements
 * are counted asynchronously in acked().
 */
class MqttConnection : public ITransport {
public:
    explicit MqttConnection(const BrokerConfig& cfg) : cfg_(cfg) {
        MosquittoLibrary::instance();
        mosq_ = mosquitto_new(cfg_.client_id.empty() ? nullptr : cfg_.client_id.c_str(), true, this);
        if (!mosq_) {
            throw std::runtime_error(std::string("mosquitto_new failed: ") + std::strerror(errno));
        }
        mosquitto_threaded_set(mosq_, true);
        mosquitto_connect_callback_set(mosq_, &MqttConnection::on_connect_cb);
        mosquitto_disconnect_callback_set(mosq_, &MqttConnection::on_disconnect_cb);
        mosquitto_publish_callback_set(mosq_, &MqttConnection::on_publish_cb);
    }

    ~MqttConnection() override {
        disconnect();
        mosquitto_destroy(mosq_);
    }

    MqttConnection(const MqttConnection&) = delete;
    MqttConnection& operator=(const MqttConnection&) = delete;

    ConnectResult connect(const Interrupt& interrupt) override {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (state() != ConnectionState::Disconnected) {
            return ConnectResult::failure(ConnectionError::Unsupported, "session already active", 0);
        }
        if (cfg_.transport == TransportKind::WebSocket) {
            return ConnectResult::failure(ConnectionError::Unsupported,
                "websocket transport is not provided by the libmosquitto client", 0);
        }

        if (worker_.joinable()) {
            // network task already ended after exhausting its retry budget
            worker_.join();
        }

        ConnectResult setup = configure_session();
        if (!setup.ok) {
            return setup;
        }

        ConnectResult last;
        for (int attempt = 1; attempt <= cfg_.connect_attempts; ++attempt) {
            Log::info("mqtt", "connecting to " + cfg_.endpoint() +
                      " (attempt " + std::to_string(attempt) + "/" +
                      std::to_string(cfg_.connect_attempts) + ")");
            last = attempt_once(interrupt);
            last.attempts = attempt;
            if (last.ok) {
                Log::info("mqtt", "connected to " + cfg_.endpoint());
                stop_.store(false);
                exhausted_.store(false);
                worker_ = std::thread([this]() { network_task(); });
                return last;
            }
            Log::warn("mqtt", std::string("connect failed: ") +
                      connection_error_name(last.error) + " (" + last.reason + ")");
            if (interrupt.requested()) {
                break;
            }
            if (attempt < cfg_.connect_attempts) {
                auto delay = reconnect_delay(attempt);
                Log::info("mqtt", "retrying in " + std::to_string(delay.count()) + "s");
                if (!interrupt.wait_for(delay)) {
                    break;
                }
            }
        }
        return last;
    }

    PublishResult publish(const std::string& topic, const std::string& payload, int qos) override {
        ConnectionState s = state();
        if (s != ConnectionState::Connected) {
            return PublishResult::failure(PublishError::NotConnected,
                                          std::string("session is ") + state_name(s));
        }
        int mid = 0;
        int rc = mosquitto_publish(mosq_, &mid, topic.c_str(),
                                   static_cast<int>(payload.size()), payload.data(), qos, false);
        int err = errno;
        if (rc != MOSQ_ERR_SUCCESS) {
            return PublishResult::failure(classify_publish_error(rc, err), mosquitto_strerror(rc));
        }
        return PublishResult::success(mid);
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        bool active = worker_.joinable() || state() != ConnectionState::Disconnected;

        {
            std::lock_guard<std::mutex> stop_lock(stop_mutex_);
            stop_.store(true);
        }
        stop_cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }

        // Single-threaded from here: queue DISCONNECT and flush it.
        int rc = mosquitto_disconnect(mosq_);
        if (rc == MOSQ_ERR_SUCCESS) {
            int flush_rc = mosquitto_loop(mosq_, 100, 1);
            if (flush_rc != MOSQ_ERR_SUCCESS && flush_rc != MOSQ_ERR_NO_CONN) {
                Log::debug("mqtt", std::string("disconnect flush: ") + mosquitto_strerror(flush_rc));
            }
        }
        apply(ConnectionEvent::DisconnectRequested);
        if (active) {
            Log::info("mqtt", "disconnected from " + cfg_.endpoint());
        }
    }

    ConnectionState state() const override {
        return state_.load();
    }

    bool exhausted() const override {
        return exhausted_.load();
    }

    std::uint64_t acked() const override {
        return acked_.load();
    }

    std::uint64_t reconnects() const override {
        return reconnects_.load();
    }

    std::string describe() const override {
        return "mqtt " + cfg_.endpoint() + " client_id=" + cfg_.client_id;
    }

    /**
     * @brief Backoff before retry n (1-based)
     *
     * Never shorter than the keep-alive interval, doubles per retry and is
     * capped at reconnect_delay_max (or the floor, if that is larger).
     */
    std::chrono::seconds reconnect_delay(int n) const {
        std::chrono::seconds floor = std::max(cfg_.reconnect_delay_min,
                                              std::chrono::seconds(cfg_.keepalive_s));
        std::chrono::seconds cap = std::max(cfg_.reconnect_delay_max, floor);
        std::chrono::seconds d = floor;
        for (int i = 1; i < n && d < cap; ++i) {
            d *= 2;
        }
        return std::min(d, cap);
    }

private:
    BrokerConfig cfg_;
    struct mosquitto* mosq_{nullptr};
    bool session_configured_{false};

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<int> connack_rc_{-1};
    std::atomic<bool> exhausted_{false};
    std::atomic<std::uint64_t> acked_{0};
    std::atomic<std::uint64_t> reconnects_{0};

    std::mutex lifecycle_mutex_;
    std::thread worker_;
    std::atomic<bool> stop_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::mutex transition_mutex_;

    /**
     * @brief Apply one event to the state machine
     * @return State before the transition
     */
    ConnectionState apply(ConnectionEvent event) {
        std::lock_guard<std::mutex> lock(transition_mutex_);
        ConnectionState before = state_.load();
        ConnectionState after = next_state(before, event);
        state_.store(after);
        if (after != before) {
            Log::debug("mqtt", std::string("state ") + state_name(before) + " -> " + state_name(after));
        }
        return before;
    }

    ConnectResult configure_session() {
        if (session_configured_) {
            return ConnectResult::success(0);
        }
        if (!cfg_.username.empty()) {
            int rc = mosquitto_username_pw_set(mosq_, cfg_.username.c_str(),
                                               cfg_.password.empty() ? nullptr : cfg_.password.c_str());
            if (rc != MOSQ_ERR_SUCCESS) {
                return ConnectResult::failure(ConnectionError::AuthRejected,
                    std::string("credentials rejected by client: ") + mosquitto_strerror(rc), 0);
            }
        }
        if (cfg_.transport == TransportKind::Tls) {
            const char* cafile = cfg_.ca_file.empty() ? nullptr : cfg_.ca_file.c_str();
            const char* capath = cfg_.ca_file.empty() ? "/etc/ssl/certs" : nullptr;
            int rc = mosquitto_tls_set(mosq_, cafile, capath, nullptr, nullptr, nullptr);
            if (rc == MOSQ_ERR_SUCCESS) {
                rc = mosquitto_tls_insecure_set(mosq_, cfg_.tls_insecure);
            }
            if (rc != MOSQ_ERR_SUCCESS) {
                return ConnectResult::failure(ConnectionError::TLSHandshakeFailed,
                    std::string("tls setup: ") + mosquitto_strerror(rc), 0);
            }
        }
        session_configured_ = true;
        return ConnectResult::success(0);
    }

    /**
     * @brief One connect attempt, driving the socket until CONNACK
     */
    ConnectResult attempt_once(const Interrupt& interrupt) {
        connack_rc_.store(-1);
        apply(ConnectionEvent::ConnectRequested);

        int rc = mosquitto_connect_async(mosq_, cfg_.host.c_str(), cfg_.port, cfg_.keepalive_s);
        int err = errno;
        if (rc != MOSQ_ERR_SUCCESS) {
            apply(ConnectionEvent::LinkLost);
            return ConnectResult::failure(classify_connect_error(rc, err), describe_rc(rc, err));
        }

        auto deadline = std::chrono::steady_clock::now() + cfg_.connect_timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (interrupt.requested()) {
                abandon_attempt();
                return ConnectResult::failure(ConnectionError::Timeout, "interrupted");
            }
            rc = mosquitto_loop(mosq_, 50, 1);
            err = errno;

            int ack = connack_rc_.load();
            if (ack == 0) {
                return ConnectResult::success(1);
            }
            if (ack > 0) {
                abandon_attempt();
                return ConnectResult::failure(classify_connack(ack), mosquitto_connack_string(ack));
            }
            if (rc != MOSQ_ERR_SUCCESS) {
                abandon_attempt();
                return ConnectResult::failure(classify_connect_error(rc, err), describe_rc(rc, err));
            }
        }
        abandon_attempt();
        return ConnectResult::failure(ConnectionError::Timeout,
            "no CONNACK within " + std::to_string(cfg_.connect_timeout.count()) + "ms");
    }

    void abandon_attempt() {
        int rc = mosquitto_disconnect(mosq_);
        if (rc != MOSQ_ERR_SUCCESS && rc != MOSQ_ERR_NO_CONN) {
            Log::debug("mqtt", std::string("abandon attempt: ") + mosquitto_strerror(rc));
        }
        apply(ConnectionEvent::LinkLost);
    }

    static std::string describe_rc(int rc, int err) {
        if (rc == MOSQ_ERR_ERRNO) {
            return std::strerror(err);
        }
        return mosquitto_strerror(rc);
    }

    /**
     * @brief Background network task: keep-alive, acks and reconnection
     */
    void network_task() {
        int failures = 0;
        while (!stop_.load()) {
            int rc = mosquitto_loop(mosq_, 100, 1);
            int err = errno;
            if (rc == MOSQ_ERR_SUCCESS) {
                if (state() == ConnectionState::Connected) {
                    failures = 0;
                }
                continue;
            }
            if (stop_.load()) {
                break;
            }

            if (state() == ConnectionState::Connected) {
                apply(ConnectionEvent::LinkLost);
                Log::warn("mqtt", "link lost: " + describe_rc(rc, err) + ", reconnecting");
            }

            ++failures;
            if (cfg_.reconnect_attempts > 0 && failures > cfg_.reconnect_attempts) {
                apply(ConnectionEvent::RetryBudgetExhausted);
                exhausted_.store(true);
                Log::error("mqtt", "giving up after " + std::to_string(cfg_.reconnect_attempts) +
                           " reconnect attempts");
                break;
            }

            auto delay = reconnect_delay(failures);
            {
                std::unique_lock<std::mutex> lock(stop_mutex_);
                if (stop_cv_.wait_for(lock, delay, [this]() { return stop_.load(); })) {
                    break;
                }
            }

            Log::info("mqtt", "reconnect attempt " + std::to_string(failures) + " to " + cfg_.endpoint());
            rc = mosquitto_reconnect_async(mosq_);
            err = errno;
            if (rc != MOSQ_ERR_SUCCESS) {
                Log::warn("mqtt", "reconnect failed: " + describe_rc(rc, err));
            }
        }
    }

    void handle_connect(int rc) {
        connack_rc_.store(rc);
        if (rc == 0) {
            ConnectionState before = apply(ConnectionEvent::ConnectAccepted);
            if (before == ConnectionState::Reconnecting) {
                reconnects_.fetch_add(1);
                Log::info("mqtt", "reconnected to " + cfg_.endpoint());
            }
        } else {
            apply(ConnectionEvent::ConnectRefused);
            Log::warn("mqtt", std::string("broker refused connection: ") + mosquitto_connack_string(rc));
        }
    }

    static void on_connect_cb(struct mosquitto*, void* obj, int rc) {
        static_cast<MqttConnection*>(obj)->handle_connect(rc);
    }

    static void on_disconnect_cb(struct mosquitto*, void* obj, int rc) {
        auto* self = static_cast<MqttConnection*>(obj);
        if (rc != 0 && !self->stop_.load()) {
            Log::debug("mqtt", std::string("socket closed: ") + mosquitto_strerror(rc));
        }
    }

    static void on_publish_cb(struct mosquitto*, void* obj, int) {
        static_cast<MqttConnection*>(obj)->acked_.fetch_add(1);
    }
};
