#pragma once
#include <zmq.h>

#include <algorithm>
#include <string>

#include "../core/log.hpp"

/**
 * @brief ZeroMQ status responder
 *
 * Answers JSON requests from local tooling while the simulator runs.
 * The publish loop polls it once per tick without blocking.
 *
 * Supported commands:
 * - {"cmd":"get_status"}
 * - {"cmd":"stop"}
 */
struct StatusRep {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* rep{nullptr};  ///< ZeroMQ REP socket
  std::string address;
  bool bound{false};

  /**
   * @brief Constructor - creates and binds responder socket
   * @param endpoint ZeroMQ bind address, e.g. "tcp://127.0.0.1:5555"
   */
  explicit StatusRep(const std::string& endpoint) : address(endpoint) {
    ctx = zmq_ctx_new();
    rep = zmq_socket(ctx, ZMQ_REP);
    int linger = 0;
    if (zmq_setsockopt(rep, ZMQ_LINGER, &linger, sizeof(linger)) != 0 ||
        zmq_bind(rep, endpoint.c_str()) != 0) {
      Log::error("status", "cannot bind " + endpoint + ": " + zmq_strerror(zmq_errno()));
      return;
    }
    bound = true;
  }

  /**
   * @brief Destructor - cleanup ZeroMQ resources
   */
  ~StatusRep() {
    if (rep) zmq_close(rep);
    if (ctx) zmq_ctx_term(ctx);
  }

  StatusRep(const StatusRep&) = delete;
  StatusRep& operator=(const StatusRep&) = delete;

  bool is_bound() const { return bound; }

  const std::string& get_bind_address() const { return address; }

  /**
   * @brief Serve at most one pending request without blocking
   * @param handler Maps a request string to its reply
   * @return true if a request was served
   */
  template<class Handler>
  bool poll_once(Handler&& handler) {
    if (!bound) return false;
    zmq_pollitem_t items[] = {{rep, 0, ZMQ_POLLIN, 0}};
    if (zmq_poll(items, 1, 0) <= 0 || !(items[0].revents & ZMQ_POLLIN)) {
      return false;
    }
    char buf[1024];
    int n = zmq_recv(rep, buf, sizeof(buf), ZMQ_DONTWAIT);
    if (n < 0) {
      Log::warn("status", std::string("recv failed: ") + zmq_strerror(zmq_errno()));
      return false;
    }
    std::string request(buf, buf + std::min<int>(n, sizeof(buf)));
    std::string reply = handler(request);
    if (zmq_send(rep, reply.data(), reply.size(), 0) < 0) {
      Log::warn("status", std::string("reply failed: ") + zmq_strerror(zmq_errno()));
    }
    return true;
  }
};
