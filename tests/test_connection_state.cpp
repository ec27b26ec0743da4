#include "../src/ipc/transport.hpp"
#include <cassert>
#include <iostream>
#include <string>

/**
 * @brief Test the broker session state machine
 *
 * Tests include:
 * 1. Normal connect path
 * 2. Refused and failed connects
 * 3. Link loss and recovery
 * 4. Retry budget exhaustion
 * 5. DisconnectRequested from every state
 * 6. Unlisted pairs leave the state unchanged
 * 7. Result helpers and names
 */
int main() {
    using S = ConnectionState;
    using E = ConnectionEvent;

    std::cout << "Testing connection state machine..." << std::endl;

    // Test 1: Disconnected -> Connecting -> Connected
    {
        std::cout << "Test 1: connect path" << std::endl;

        S s = S::Disconnected;
        s = next_state(s, E::ConnectRequested);
        assert(s == S::Connecting);
        s = next_state(s, E::ConnectAccepted);
        assert(s == S::Connected);

        std::cout << "  Connect path test passed" << std::endl;
    }

    // Test 2: A failed attempt returns to Disconnected
    {
        std::cout << "Test 2: refused and failed connects" << std::endl;

        assert(next_state(S::Connecting, E::ConnectRefused) == S::Disconnected);
        assert(next_state(S::Connecting, E::LinkLost) == S::Disconnected);

        std::cout << "  Failed connect test passed" << std::endl;
    }

    // Test 3: Connected -> Reconnecting -> Connected
    {
        std::cout << "Test 3: link loss and recovery" << std::endl;

        S s = next_state(S::Connected, E::LinkLost);
        assert(s == S::Reconnecting);
        s = next_state(s, E::ConnectRefused);
        assert(s == S::Reconnecting);
        s = next_state(s, E::LinkLost);
        assert(s == S::Reconnecting);
        s = next_state(s, E::ConnectAccepted);
        assert(s == S::Connected);

        std::cout << "  Recovery test passed" << std::endl;
    }

    // Test 4: Reconnecting gives up
    {
        std::cout << "Test 4: retry budget exhausted" << std::endl;

        assert(next_state(S::Reconnecting, E::RetryBudgetExhausted) == S::Disconnected);
        assert(next_state(S::Connected, E::RetryBudgetExhausted) == S::Connected);

        std::cout << "  Exhaustion test passed" << std::endl;
    }

    // Test 5: Explicit disconnect always wins
    {
        std::cout << "Test 5: disconnect from every state" << std::endl;

        for (S s : {S::Disconnected, S::Connecting, S::Connected, S::Reconnecting}) {
            assert(next_state(s, E::DisconnectRequested) == S::Disconnected);
        }

        std::cout << "  Disconnect test passed" << std::endl;
    }

    // Test 6: Events that do not apply are ignored
    {
        std::cout << "Test 6: unlisted transitions" << std::endl;

        assert(next_state(S::Disconnected, E::ConnectAccepted) == S::Disconnected);
        assert(next_state(S::Disconnected, E::LinkLost) == S::Disconnected);
        assert(next_state(S::Connected, E::ConnectRequested) == S::Connected);
        assert(next_state(S::Connected, E::ConnectAccepted) == S::Connected);
        assert(next_state(S::Connecting, E::ConnectRequested) == S::Connecting);
        assert(next_state(S::Reconnecting, E::ConnectRequested) == S::Reconnecting);

        std::cout << "  Unlisted transition test passed" << std::endl;
    }

    // Test 7: Result helpers and display names
    {
        std::cout << "Test 7: results and names" << std::endl;

        ConnectResult ok = ConnectResult::success(2);
        assert(ok.ok && ok.error == ConnectionError::None && ok.attempts == 2);
        ConnectResult bad = ConnectResult::failure(ConnectionError::TLSHandshakeFailed, "bad cert", 3);
        assert(!bad.ok && bad.error == ConnectionError::TLSHandshakeFailed);
        assert(bad.reason == "bad cert" && bad.attempts == 3);

        PublishResult sent = PublishResult::success(17);
        assert(sent.ok && sent.mid == 17);
        PublishResult lost = PublishResult::failure(PublishError::NotConnected, "down");
        assert(!lost.ok && lost.mid == -1 && lost.error == PublishError::NotConnected);

        assert(std::string(state_name(S::Reconnecting)) == "Reconnecting");
        assert(std::string(connection_error_name(ConnectionError::AuthRejected)) == "AuthRejected");
        assert(std::string(publish_error_name(PublishError::BrokerRejected)) == "BrokerRejected");

        std::cout << "  Result helper test passed" << std::endl;
    }

    std::cout << "\n✅ All connection state tests passed!" << std::endl;
    return 0;
}
