#pragma once
#include <cstdint>
#include <string>

#include "../core/interrupt.hpp"

/**
 * @brief Broker session state, owned by the connection manager
 */
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

inline const char* state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Reconnecting: return "Reconnecting";
    }
    return "Disconnected";
}

/**
 * @brief Network events that drive the session state machine
 */
enum class ConnectionEvent {
    ConnectRequested,
    ConnectAccepted,
    ConnectRefused,
    LinkLost,
    RetryBudgetExhausted,
    DisconnectRequested
};

/**
 * @brief Session state transition table
 *
 *   Disconnected --ConnectRequested-------> Connecting
 *   Connecting   --ConnectAccepted--------> Connected
 *   Connecting   --ConnectRefused---------> Disconnected
 *   Connecting   --LinkLost---------------> Disconnected
 *   Connected    --LinkLost---------------> Reconnecting
 *   Reconnecting --ConnectAccepted--------> Connected
 *   Reconnecting --ConnectRefused---------> Reconnecting
 *   Reconnecting --RetryBudgetExhausted---> Disconnected
 *   any          --DisconnectRequested----> Disconnected
 *
 * Pairs not listed leave the state unchanged.
 */
struct ConnectionTransition {
    ConnectionState from;
    ConnectionEvent event;
    ConnectionState to;
};

inline ConnectionState next_state(ConnectionState from, ConnectionEvent event) {
    using S = ConnectionState;
    using E = ConnectionEvent;
    static const ConnectionTransition table[] = {
        {S::Disconnected, E::ConnectRequested,     S::Connecting},
        {S::Connecting,   E::ConnectAccepted,      S::Connected},
        {S::Connecting,   E::ConnectRefused,       S::Disconnected},
        {S::Connecting,   E::LinkLost,             S::Disconnected},
        {S::Connected,    E::LinkLost,             S::Reconnecting},
        {S::Reconnecting, E::ConnectAccepted,      S::Connected},
        {S::Reconnecting, E::ConnectRefused,       S::Reconnecting},
        {S::Reconnecting, E::RetryBudgetExhausted, S::Disconnected},
    };

    if (event == E::DisconnectRequested) {
        return S::Disconnected;
    }
    for (const auto& row : table) {
        if (row.from == from && row.event == event) {
            return row.to;
        }
    }
    return from;
}

/**
 * @brief Why a connect attempt failed
 */
enum class ConnectionError {
    None,
    Timeout,
    AuthRejected,
    NetworkUnreachable,
    TLSHandshakeFailed,
    Unsupported
};

inline const char* connection_error_name(ConnectionError e) {
    switch (e) {
        case ConnectionError::None:               return "None";
        case ConnectionError::Timeout:            return "Timeout";
        case ConnectionError::AuthRejected:       return "AuthRejected";
        case ConnectionError::NetworkUnreachable: return "NetworkUnreachable";
        case ConnectionError::TLSHandshakeFailed: return "TLSHandshakeFailed";
        case ConnectionError::Unsupported:        return "Unsupported";
    }
    return "None";
}

/**
 * @brief Why a publish failed
 */
enum class PublishError {
    None,
    NotConnected,
    BrokerRejected,
    Timeout
};

inline const char* publish_error_name(PublishError e) {
    switch (e) {
        case PublishError::None:           return "None";
        case PublishError::NotConnected:   return "NotConnected";
        case PublishError::BrokerRejected: return "BrokerRejected";
        case PublishError::Timeout:        return "Timeout";
    }
    return "None";
}

struct ConnectResult {
    bool ok{false};
    ConnectionError error{ConnectionError::None};
    std::string reason;
    int attempts{0};

    static ConnectResult success(int attempts) {
        return ConnectResult{true, ConnectionError::None, "", attempts};
    }

    static ConnectResult failure(ConnectionError e, const std::string& why, int attempts = 1) {
        return ConnectResult{false, e, why, attempts};
    }
};

struct PublishResult {
    bool ok{false};
    int mid{-1};        ///< Broker message id, -1 when the transport has none
    PublishError error{PublishError::None};
    std::string reason;

    static PublishResult success(int mid = -1) {
        return PublishResult{true, mid, PublishError::None, ""};
    }

    static PublishResult failure(PublishError e, const std::string& why) {
        return PublishResult{false, -1, e, why};
    }
};

/**
 * @brief Connection manager seam used by the publish loop
 *
 * Implementations own the session and any background network task.
 * publish() never blocks waiting for a connection: when the session is
 * not Connected it returns NotConnected immediately. disconnect() is
 * idempotent and must release every resource; destructors call it.
 */
struct ITransport {
    virtual ~ITransport() = default;

    /**
     * @brief Establish the session, retrying within the configured budget
     * @param interrupt Aborts the attempt and any backoff wait when requested
     */
    virtual ConnectResult connect(const Interrupt& interrupt) = 0;

    virtual PublishResult publish(const std::string& topic, const std::string& payload, int qos) = 0;

    virtual void disconnect() = 0;

    /// Thread-safe read of the current session state
    virtual ConnectionState state() const = 0;

    /// True once reconnection gave up; the session will not recover by itself
    virtual bool exhausted() const { return false; }

    /// Completed publishes: written for QoS 0, acknowledged by the broker for QoS >= 1
    virtual std::uint64_t acked() const { return 0; }

    /// Sessions re-established after a lost link
    virtual std::uint64_t reconnects() const { return 0; }

    virtual std::string describe() const = 0;
};
