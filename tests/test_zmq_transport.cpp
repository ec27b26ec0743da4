#include "../src/ipc/zmq_transport.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <zmq.h>

/**
 * @brief Test ZmqTransport against a local SUB socket
 *
 * Tests basic publisher lifecycle and that a subscriber receives the
 * topic frame followed by the payload frame.
 */
int main() {
    using namespace std::chrono;

    std::cout << "Testing ZmqTransport..." << std::endl;
    Log::set_level(LogLevel::ERROR);

    const std::string endpoint = "tcp://127.0.0.1:5656";

    // Test 1: Publishing before bind fails fast
    {
        std::cout << "Test 1: publish before connect" << std::endl;

        ZmqTransport pub(endpoint);
        assert(pub.state() == ConnectionState::Disconnected);
        PublishResult r = pub.publish("d02/telemetry", "{}", 0);
        assert(!r.ok && r.error == PublishError::NotConnected);

        std::cout << "  Publish before connect test passed" << std::endl;
    }

    // Test 2: Subscriber receives topic and payload frames
    {
        std::cout << "Test 2: two-frame delivery" << std::endl;

        ZmqTransport pub(endpoint);
        Interrupt interrupt;
        ConnectResult cr = pub.connect(interrupt);
        assert(cr.ok);
        assert(pub.state() == ConnectionState::Connected);

        void* ctx = zmq_ctx_new();
        void* sub = zmq_socket(ctx, ZMQ_SUB);
        assert(zmq_connect(sub, endpoint.c_str()) == 0);
        assert(zmq_setsockopt(sub, ZMQ_SUBSCRIBE, "d02/telemetry", 13) == 0);
        int timeout = 100;
        assert(zmq_setsockopt(sub, ZMQ_RCVTIMEO, &timeout, sizeof(timeout)) == 0);

        const std::string payload = R"({"ts":0,"mode":"AUTO"})";
        bool received = false;
        // PUB drops messages until the subscription has propagated
        for (int i = 0; i < 50 && !received; i++) {
            assert(pub.publish("d02/telemetry", payload, 0).ok);
            pub.publish("other/topic", "ignored", 0);

            char topic[64];
            int n = zmq_recv(sub, topic, sizeof(topic), 0);
            if (n < 0) continue;
            assert(std::string(topic, n) == "d02/telemetry");

            int more = 0;
            size_t more_size = sizeof(more);
            assert(zmq_getsockopt(sub, ZMQ_RCVMORE, &more, &more_size) == 0);
            assert(more == 1);

            char body[256];
            n = zmq_recv(sub, body, sizeof(body), 0);
            assert(n > 0);
            assert(std::string(body, n) == payload);
            received = true;
        }
        assert(received);
        assert(pub.acked() >= 1);

        zmq_close(sub);
        zmq_ctx_term(ctx);
        std::cout << "  Delivery test passed" << std::endl;

        pub.disconnect();
        pub.disconnect();
        assert(pub.state() == ConnectionState::Disconnected);
        assert(pub.publish("d02/telemetry", payload, 0).error == PublishError::NotConnected);
    }

    // Test 3: The address can be rebound after a clean disconnect
    {
        std::cout << "Test 3: repeated bind and release" << std::endl;

        for (int i = 0; i < 3; i++) {
            ZmqTransport pub(endpoint);
            Interrupt interrupt;
            assert(pub.connect(interrupt).ok);
            assert(pub.publish("d02/telemetry", std::to_string(i), 0).ok);
        }

        std::cout << "  Rebind test passed" << std::endl;
    }

    // Test 4: A second publisher on the same address is refused
    {
        std::cout << "Test 4: address in use" << std::endl;

        ZmqTransport first(endpoint);
        ZmqTransport second(endpoint);
        Interrupt interrupt;
        assert(first.connect(interrupt).ok);
        ConnectResult r = second.connect(interrupt);
        assert(!r.ok);
        assert(r.error == ConnectionError::NetworkUnreachable);
        assert(second.state() == ConnectionState::Disconnected);

        std::cout << "  Address in use test passed" << std::endl;
    }

    std::cout << "\n✅ All ZmqTransport tests passed!" << std::endl;
    return 0;
}
