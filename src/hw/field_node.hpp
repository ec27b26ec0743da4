#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

#include "../core/telemetry.hpp"
#include "../ipc/schema.hpp"
#include "sim_noise.hpp"

/**
 * @brief Simulated agricultural field node
 *
 * Maps a tick counter to a telemetry snapshot. generate() is a pure
 * function of (seed, mode, tick): it performs no I/O, keeps no state
 * between calls and is total over the whole tick range.
 *
 * Model:
 * - air temperature follows a 240-tick diurnal sine with bounded jitter
 * - humidity is weakly anti-correlated with temperature
 * - soil moisture is forced into the watered band during the first
 *   20 ticks of every 100-tick irrigation window and decays afterwards
 * - tank level drains linearly over a 120-tick refill cycle
 * - pumps are independent per-tick draws with no hysteresis
 * - DS18B20 probe 0 is not on the bus and always reads -127.00
 */
struct FieldNode {
    static constexpr std::uint64_t kDiurnalPeriod = 240;
    static constexpr std::uint64_t kIrrigationWindow = 100;
    static constexpr std::uint64_t kIrrigationWet = 20;
    static constexpr std::uint64_t kRefillCycle = 120;
    static constexpr std::size_t kDisconnectedProbe = 0;

    static constexpr int kWateredMin = 75;
    static constexpr int kWateredMax = 90;
    static constexpr int kDryFloor = 20;

    static constexpr double kIrrigationPumpRate = 0.10;
    static constexpr double kSuctionPumpRate = 0.05;

    std::uint64_t seed;
    DeviceMode mode;

    explicit FieldNode(std::uint64_t s = 1, DeviceMode m = DeviceMode::AUTO)
        : seed(s), mode(m) {}

    static double round_to(double v, double scale) {
        return std::round(v * scale) / scale;
    }

    static bool in_irrigation_window(std::uint64_t tick) {
        return tick % kIrrigationWindow < kIrrigationWet;
    }

    /**
     * @brief Build the snapshot for one tick
     */
    TelemetrySnapshot generate(std::uint64_t tick) const {
        NoiseSimulator noise = NoiseSimulator::for_tick(seed, tick);
        TelemetrySnapshot s;
        s.ts = tick;
        s.mode = mode;

        // Air (BME280)
        double phase = 2.0 * M_PI * static_cast<double>(tick % kDiurnalPeriod) /
                       static_cast<double>(kDiurnalPeriod);
        double air_t = 25.0 + 3.0 * std::sin(phase) + noise.jitter(1.0);
        air_t = round_to(std::clamp(air_t, 15.0, 40.0), 100.0);
        s.bme.t = air_t;

        double p_phase = std::fmod(static_cast<double>(tick) * 0.01, 2.0 * M_PI);
        int pressure = static_cast<int>(std::lround(1000.0 + 5.0 * std::sin(p_phase))) +
                       noise.uniform_int(-2, 2);
        s.bme.p = std::clamp(pressure, 700, 1100);

        double hum = 80.0 - 2.0 * (air_t - 25.0) + noise.jitter(10.0);
        s.bme.h = round_to(std::clamp(hum, 30.0, 90.0), 10.0);

        // Soil temperature (DS18B20 bus)
        for (std::size_t i = 0; i < s.ds18b20.size(); ++i) {
            if (i == kDisconnectedProbe) {
                s.ds18b20[i] = kProbeDisconnected;
                continue;
            }
            double soil_t = air_t - 2.0 + noise.jitter(2.0);
            s.ds18b20[i] = round_to(std::clamp(soil_t, -40.0, 85.0), 100.0);
        }

        // Soil moisture
        std::uint64_t cycle_pos = tick % kIrrigationWindow;
        bool watered = in_irrigation_window(tick);
        for (auto& m : s.soil) {
            int v;
            if (watered) {
                v = noise.uniform_int(kWateredMin, kWateredMax);
            } else {
                v = 80 - static_cast<int>(cycle_pos) + noise.uniform_int(-5, 5);
                v = std::max(kDryFloor, v);
            }
            m = std::clamp(v, 0, 100);
        }

        // Water tank
        double drained = 85.0 * static_cast<double>(tick % kRefillCycle) /
                         static_cast<double>(kRefillCycle);
        for (auto& w : s.water) {
            double level = 90.0 - drained + noise.jitter(2.0);
            w = round_to(std::clamp(level, 0.0, 100.0), 10.0);
        }

        // Actuators
        s.pump[0] = noise.chance(kIrrigationPumpRate) ? 1 : 0;
        s.pump[1] = noise.chance(kSuctionPumpRate) ? 1 : 0;

        if (mode == DeviceMode::AUTO) {
            s.valve.fill(watered ? 1 : 0);
        } else {
            s.valve.fill(0);
            s.valve[0] = s.pump[0];
        }
        return s;
    }

    /**
     * @brief Build the snapshot for one tick and encode it
     * @param tick Tick counter
     * @param schema Wire schema to encode with
     * @return Encoded payload
     */
    std::string generate(std::uint64_t tick, const SnapshotSchema& schema) const {
        return schema.encode(generate(tick));
    }
};
