#include "../src/control/loop.hpp"
#include "../src/ipc/status_rep.hpp"
#include "fake_transport.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <zmq.h>
#include <nlohmann/json.hpp>

/**
 * @brief Test StatusRep request/reply with a REQ client
 *
 * The publish loop runs against a fake transport while a client asks for
 * status and then stops it over the status endpoint.
 */
static std::string request(void* req, const std::string& cmd) {
    int rc = zmq_send(req, cmd.data(), cmd.size(), 0);
    assert(rc >= 0);
    char buf[1024];
    int n = zmq_recv(req, buf, sizeof(buf), 0);
    assert(n > 0);
    return std::string(buf, n);
}

int main() {
    using namespace std::chrono;

    std::cout << "Testing StatusRep functionality..." << std::endl;
    Log::set_level(LogLevel::ERROR);

    const std::string endpoint = "tcp://127.0.0.1:5657";

    // Test 1: Construction, polling with nothing pending, destruction
    {
        std::cout << "Test 1: lifecycle" << std::endl;

        StatusRep rep(endpoint);
        assert(rep.is_bound());
        assert(rep.get_bind_address() == endpoint);
        bool served = rep.poll_once([](const std::string&) { return std::string("{}"); });
        assert(!served);

        StatusRep clash(endpoint);
        assert(!clash.is_bound());

        std::cout << "  Lifecycle test passed" << std::endl;
    }

    // Test 2: get_status and stop against a running loop
    {
        std::cout << "Test 2: status round trip" << std::endl;

        StatusRep rep(endpoint);
        assert(rep.is_bound());

        ScheduleConfig cfg;
        cfg.interval = milliseconds(10);
        cfg.topic = "d02/telemetry";
        Interrupt interrupt;
        RichSchema rich;
        PublishLoop loop(cfg, rich, interrupt);
        loop.status = &rep;
        FakeTransport transport;

        ExitStatus result = ExitStatus::ConnectFailed;
        std::thread runner([&]() { result = loop.run(transport); });

        void* ctx = zmq_ctx_new();
        void* req = zmq_socket(ctx, ZMQ_REQ);
        int timeout = 5000;
        assert(zmq_setsockopt(req, ZMQ_RCVTIMEO, &timeout, sizeof(timeout)) == 0);
        assert(zmq_connect(req, endpoint.c_str()) == 0);

        std::this_thread::sleep_for(milliseconds(100));
        auto status = nlohmann::json::parse(request(req, R"({"cmd":"get_status"})"));
        std::cout << "  Status: " << status.dump() << std::endl;
        assert(status["ok"] == true);
        assert(status["tick"].get<std::uint64_t>() >= 1);
        assert(status["state"] == "Connected");
        assert(status["topic"] == "d02/telemetry");
        assert(status["schema"] == "rich");

        assert(request(req, R"({"cmd":"unknown"})") == "{\"ok\":false}");
        assert(request(req, R"({"cmd":"stop"})") == "{\"ok\":true}");

        runner.join();
        assert(result == ExitStatus::Graceful);
        assert(transport.disconnect_calls == 1);

        zmq_close(req);
        zmq_ctx_term(ctx);

        std::cout << "  Round trip test passed" << std::endl;
    }

    std::cout << "\n✅ All StatusRep tests passed!" << std::endl;
    return 0;
}
