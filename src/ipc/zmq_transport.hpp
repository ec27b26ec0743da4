#pragma once
#include <zmq.h>

#include <atomic>
#include <cerrno>
#include <mutex>
#include <string>
#include <utility>

#include "../core/log.hpp"
#include "transport.hpp"

/**
 * @brief ZeroMQ telemetry publisher
 *
 * Brokerless transport for bench setups: binds a PUB socket and sends each
 * payload as two frames, the topic followed by the JSON body. Subscribers
 * filter on the topic frame. PUB sockets are at-most-once, so the QoS
 * argument is accepted and ignored, and no message id is returned.
 */
class ZmqTransport : public ITransport {
public:
    explicit ZmqTransport(std::string endpoint) : endpoint_(std::move(endpoint)) {}

    ~ZmqTransport() override {
        disconnect();
    }

    ZmqTransport(const ZmqTransport&) = delete;
    ZmqTransport& operator=(const ZmqTransport&) = delete;

    ConnectResult connect(const Interrupt& interrupt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() == ConnectionState::Connected) {
            return ConnectResult::failure(ConnectionError::Unsupported, "already bound", 0);
        }
        if (interrupt.requested()) {
            return ConnectResult::failure(ConnectionError::Timeout, "interrupted", 0);
        }
        state_.store(next_state(state_.load(), ConnectionEvent::ConnectRequested));

        ctx_ = zmq_ctx_new();
        pub_ = ctx_ ? zmq_socket(ctx_, ZMQ_PUB) : nullptr;
        if (!pub_) {
            std::string why = zmq_strerror(zmq_errno());
            release();
            state_.store(next_state(state_.load(), ConnectionEvent::ConnectRefused));
            return ConnectResult::failure(ConnectionError::NetworkUnreachable, why);
        }

        int linger = 0;
        if (zmq_setsockopt(pub_, ZMQ_LINGER, &linger, sizeof(linger)) != 0) {
            Log::warn("zmq", std::string("cannot set linger: ") + zmq_strerror(zmq_errno()));
        }

        if (zmq_bind(pub_, endpoint_.c_str()) != 0) {
            std::string why = "bind " + endpoint_ + ": " + zmq_strerror(zmq_errno());
            release();
            state_.store(next_state(state_.load(), ConnectionEvent::ConnectRefused));
            return ConnectResult::failure(ConnectionError::NetworkUnreachable, why);
        }

        state_.store(next_state(state_.load(), ConnectionEvent::ConnectAccepted));
        Log::info("zmq", "telemetry publisher bound to " + endpoint_);
        return ConnectResult::success(1);
    }

    PublishResult publish(const std::string& topic, const std::string& payload, int) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() != ConnectionState::Connected) {
            return PublishResult::failure(PublishError::NotConnected, "publisher not bound");
        }
        if (zmq_send(pub_, topic.data(), topic.size(), ZMQ_SNDMORE | ZMQ_DONTWAIT) < 0 ||
            zmq_send(pub_, payload.data(), payload.size(), ZMQ_DONTWAIT) < 0) {
            int err = zmq_errno();
            return PublishResult::failure(err == EAGAIN ? PublishError::Timeout : PublishError::BrokerRejected,
                                          zmq_strerror(err));
        }
        sent_.fetch_add(1);
        return PublishResult::success();
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        bool was_bound = pub_ != nullptr;
        release();
        state_.store(next_state(state_.load(), ConnectionEvent::DisconnectRequested));
        if (was_bound) {
            Log::info("zmq", "telemetry publisher closed");
        }
    }

    ConnectionState state() const override {
        return state_.load();
    }

    std::uint64_t acked() const override {
        return sent_.load();
    }

    std::string describe() const override {
        return "zmq pub " + endpoint_;
    }

    const std::string& get_bind_address() const {
        return endpoint_;
    }

private:
    std::string endpoint_;
    void* ctx_{nullptr};   ///< ZeroMQ context
    void* pub_{nullptr};   ///< ZeroMQ PUB socket
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<std::uint64_t> sent_{0};
    std::mutex mutex_;

    void release() {
        if (pub_) {
            zmq_close(pub_);
            pub_ = nullptr;
        }
        if (ctx_) {
            zmq_ctx_term(ctx_);
            ctx_ = nullptr;
        }
    }
};
