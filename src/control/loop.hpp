#pragma once
#include "../core/clock.hpp"
#include "../core/config.hpp"
#include "../core/interrupt.hpp"
#include "../core/log.hpp"
#include "../core/telemetry.hpp"
#include "../hw/field_node.hpp"
#include "../ipc/schema.hpp"
#include "../ipc/status_rep.hpp"
#include "../ipc/transport.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief How the publish loop ended
 */
enum class ExitStatus {
  Graceful,       ///< Interrupt, stop command or tick limit
  ConnectFailed   ///< Initial connect or reconnection budget exhausted
};

/**
 * @brief Running counters of the publish loop
 */
struct LoopStats {
  std::uint64_t ticks{0};
  std::uint64_t sent{0};
  std::uint64_t failed{0};
  std::uint64_t acked{0};
  std::uint64_t reconnects{0};
};

/**
 * @brief Fixed-cadence telemetry publish loop
 *
 * Single-threaded cooperative scheduler. Each tick it generates a snapshot,
 * encodes it with the configured schema, publishes it and records the
 * outcome, then sleeps until anchor + (k+1) * interval.
 * - Publish failures are logged and counted, never fatal
 * - Interrupts are checked at the top of each tick and during the sleep
 * - The transport is disconnected exactly once on every exit path
 */
struct PublishLoop {
  ScheduleConfig cfg;                 ///< Cadence, topic, QoS
  FieldNode node;                     ///< Telemetry model
  const SnapshotSchema& schema;       ///< Payload encoder
  Interrupt& interrupt;               ///< Shutdown request
  StatusRep* status{nullptr};         ///< Optional status responder
  std::uint64_t progress_every{10};   ///< Ticks between progress lines

  std::atomic<std::uint64_t> tick{0};    ///< Next tick to publish
  std::atomic<std::uint64_t> sent{0};    ///< Successful publishes
  std::atomic<std::uint64_t> failed{0};  ///< Failed publishes

  /// Observer called after every publish with the tick's scheduled start
  std::function<void(std::uint64_t, PeriodicClock::clock::time_point, const PublishResult&)> on_tick;

  /**
   * @brief Constructor
   * @param c Schedule configuration
   * @param s Wire schema
   * @param i Shutdown request shared with the signal handler
   */
  PublishLoop(const ScheduleConfig& c, const SnapshotSchema& s, Interrupt& i)
    : cfg(c), node(c.seed, c.mode), schema(s), interrupt(i) {}

  /**
   * @brief Connect, publish until told to stop, disconnect
   * @param transport Connection manager to publish through
   * @return Graceful on interrupt/stop/tick limit, ConnectFailed if the
   *         session could not be established or was lost for good
   */
  ExitStatus run(ITransport& transport) {
    Log::info("loop", "connecting via " + transport.describe());
    ConnectResult cr = transport.connect(interrupt);
    if (!cr.ok) {
      transport.disconnect();
      if (interrupt.requested()) {
        Log::info("loop", "interrupted before the session was established");
        return ExitStatus::Graceful;
      }
      Log::error("loop", std::string("could not connect after ") + std::to_string(cr.attempts) +
                 " attempt(s): " + connection_error_name(cr.error) + " (" + cr.reason + ")");
      return ExitStatus::ConnectFailed;
    }

    Log::info("loop", "publishing to '" + cfg.topic + "' every " +
              std::to_string(cfg.interval.count()) + "ms (qos " + std::to_string(cfg.qos) +
              ", " + schema.name() + " schema)");

    PeriodicClock clk(std::chrono::duration_cast<std::chrono::nanoseconds>(cfg.interval));
    ExitStatus result = ExitStatus::Graceful;

    while (true) {
      if (interrupt.requested()) {
        Log::info("loop", "shutdown requested");
        break;
      }
      if (transport.exhausted()) {
        Log::error("loop", "connection lost and retry budget exhausted");
        result = ExitStatus::ConnectFailed;
        break;
      }

      std::uint64_t t = tick.load();
      TelemetrySnapshot snapshot = node.generate(t);
      std::string payload = schema.encode(snapshot);
      PublishResult r = transport.publish(cfg.topic, payload, cfg.qos);

      if (r.ok) {
        sent.fetch_add(1);
        Log::info("loop", "[" + std::to_string(sent.load()) + "] " + snapshot.to_string() +
                  (r.mid >= 0 ? " mid=" + std::to_string(r.mid) : ""));
        Log::debug("loop", payload);
      } else {
        failed.fetch_add(1);
        Log::warn("loop", "publish failed at tick " + std::to_string(t) + ": " +
                  publish_error_name(r.error) + " (" + r.reason + ")");
      }

      if (on_tick) {
        on_tick(t, clk.deadline(clk.ticks), r);
      }
      if (status) {
        status->poll_once([&](const std::string& req) { return handle_cmd(req, transport); });
      }

      tick.fetch_add(1);
      if (progress_every > 0 && tick.load() % progress_every == 0) {
        Log::info("loop", "progress: " + std::to_string(tick.load()) + " ticks, " +
                  std::to_string(sent.load()) + " sent, " + std::to_string(failed.load()) +
                  " failed, session " + state_name(transport.state()));
      }
      if (cfg.max_ticks > 0 && tick.load() >= cfg.max_ticks) {
        Log::info("loop", "tick limit reached");
        break;
      }

      if (!clk.wait_next(interrupt)) {
        Log::info("loop", "shutdown requested");
        break;
      }
    }

    transport.disconnect();
    LoopStats st = get_stats(transport);
    Log::info("loop", "final: " + std::to_string(st.ticks) + " ticks, " +
              std::to_string(st.sent) + " sent, " + std::to_string(st.failed) + " failed, " +
              std::to_string(st.acked) + " completed, " + std::to_string(st.reconnects) + " reconnects");
    return result;
  }

  LoopStats get_stats(const ITransport& transport) const {
    LoopStats st;
    st.ticks = tick.load();
    st.sent = sent.load();
    st.failed = failed.load();
    st.acked = transport.acked();
    st.reconnects = transport.reconnects();
    return st;
  }

  /**
   * @brief Handle a status request
   * @param s JSON command string
   * @param transport Session to report on
   * @return JSON response string
   */
  std::string handle_cmd(const std::string& s, const ITransport& transport) {
    auto j = json::parse(s, nullptr, false);
    if (!j.is_object() || !j.contains("cmd") || !j["cmd"].is_string()) return "{\"ok\":false}";

    std::string cmd = j["cmd"].get<std::string>();
    if (cmd == "get_status") {
      LoopStats st = get_stats(transport);
      json status_json = {
        {"ok", true},
        {"tick", st.ticks},
        {"sent", st.sent},
        {"failed", st.failed},
        {"acked", st.acked},
        {"reconnects", st.reconnects},
        {"state", state_name(transport.state())},
        {"topic", cfg.topic},
        {"schema", schema.name()}
      };
      return status_json.dump();
    } else if (cmd == "stop") {
      Log::info("loop", "stop requested over status endpoint");
      interrupt.request();
      return "{\"ok\":true}";
    }
    return "{\"ok\":false}";
  }
};
