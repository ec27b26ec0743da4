#pragma once
#include <array>
#include <cstdint>
#include <cstdio>
#include <string>

/**
 * @brief Operating mode reported by the field node
 */
enum class DeviceMode {
    AUTO,
    MANUAL,
    SCHEDULE
};

inline const char* mode_name(DeviceMode mode) {
    switch (mode) {
        case DeviceMode::AUTO:     return "AUTO";
        case DeviceMode::MANUAL:   return "MANUAL";
        case DeviceMode::SCHEDULE: return "SCHEDULE";
    }
    return "AUTO";
}

/**
 * @brief Parse a wire mode name
 * @return false if the name is not one of AUTO, MANUAL, SCHEDULE
 */
inline bool parse_mode(const std::string& name, DeviceMode& out) {
    if (name == "AUTO")     { out = DeviceMode::AUTO;     return true; }
    if (name == "MANUAL")   { out = DeviceMode::MANUAL;   return true; }
    if (name == "SCHEDULE") { out = DeviceMode::SCHEDULE; return true; }
    return false;
}

/// Reading reported by a DS18B20 probe that is not on the bus
constexpr double kProbeDisconnected = -127.0;

/**
 * @brief BME280 air sensor reading
 */
struct BmeReading {
    double t{0.0};  ///< Air temperature in degC, 2 dp
    int p{0};       ///< Pressure in hPa
    double h{0.0};  ///< Relative humidity in %, 1 dp

    bool operator==(const BmeReading& o) const {
        return t == o.t && p == o.p && h == o.h;
    }
};

/**
 * @brief One point-in-time bundle of sensor and actuator readings
 *
 * Array sizes follow the device topology and never change at runtime.
 * Floating point fields are already rounded to their wire precision.
 */
struct TelemetrySnapshot {
    static constexpr std::size_t kSoilProbes = 3;
    static constexpr std::size_t kMoistureProbes = 3;
    static constexpr std::size_t kWaterGauges = 2;
    static constexpr std::size_t kValves = 3;
    static constexpr std::size_t kPumps = 2;

    std::uint64_t ts{0};
    DeviceMode mode{DeviceMode::AUTO};
    BmeReading bme;
    std::array<double, kSoilProbes> ds18b20{};  ///< Soil temperature, degC, 2 dp
    std::array<int, kMoistureProbes> soil{};    ///< Soil moisture, 0-100 %
    std::array<double, kWaterGauges> water{};   ///< Tank level, %, 1 dp
    std::array<int, kValves> valve{};           ///< 0 closed, 1 open
    std::array<int, kPumps> pump{};             ///< 0 off, 1 on (irrigation, suction)

    bool operator==(const TelemetrySnapshot& o) const {
        return ts == o.ts && mode == o.mode && bme == o.bme &&
               ds18b20 == o.ds18b20 && soil == o.soil && water == o.water &&
               valve == o.valve && pump == o.pump;
    }

    bool operator!=(const TelemetrySnapshot& o) const {
        return !(*this == o);
    }

    /**
     * @brief Format snapshot as a one-line human-readable summary
     */
    std::string to_string() const {
        char buffer[256];
        std::snprintf(buffer, sizeof(buffer),
            "ts=%llu mode=%s air=%.2fC/%dhPa/%.1f%% soil=[%d,%d,%d] "
            "water=[%.1f,%.1f] pump=[%d,%d]",
            static_cast<unsigned long long>(ts), mode_name(mode),
            bme.t, bme.p, bme.h, soil[0], soil[1], soil[2],
            water[0], water[1], pump[0], pump[1]);
        return std::string(buffer);
    }
};

/**
 * @brief Simplified flat telemetry record (integer readings only)
 */
struct FlatSnapshot {
    int pressure{0};
    int soil_temp{0};
    int soil_humidity{0};
    int water_level{0};
    int air_temp{0};
    int air_humidity{0};
    std::string timestamp;   ///< Tick counter as a decimal string

    bool operator==(const FlatSnapshot& o) const {
        return pressure == o.pressure && soil_temp == o.soil_temp &&
               soil_humidity == o.soil_humidity && water_level == o.water_level &&
               air_temp == o.air_temp && air_humidity == o.air_humidity &&
               timestamp == o.timestamp;
    }
};
