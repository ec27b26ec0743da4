#pragma once
#include <cmath>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "../core/telemetry.hpp"

/**
 * @brief Wire schemas for telemetry payloads
 *
 * Two incompatible payload layouts exist for the same field node:
 *
 * Rich (nested, stable key order):
 * {"ts":175938,"mode":"AUTO","bme":{"t":25.31,"p":1001,"h":62.4},
 *  "ds18b20":[-127.0,23.1,22.87],"soil":[80,82,77],"water":[61.2,60.8],
 *  "valve":[1,1,1],"pump":[0,0]}
 *
 * Flat (integers plus a string counter):
 * {"pressure":1001,"soilTemp":23,"soilHumidity":80,"waterLevel":61,
 *  "airTemp":25,"airHumidity":62,"timestamp":"175938"}
 */
enum class SchemaKind {
    Rich,
    Flat
};

inline const char* schema_name(SchemaKind kind) {
    return kind == SchemaKind::Flat ? "flat" : "rich";
}

inline bool parse_schema(const std::string& name, SchemaKind& out) {
    if (name == "rich") { out = SchemaKind::Rich; return true; }
    if (name == "flat") { out = SchemaKind::Flat; return true; }
    return false;
}

/**
 * @brief Strategy that turns a snapshot into a payload
 */
class SnapshotSchema {
public:
    virtual ~SnapshotSchema() = default;
    virtual SchemaKind kind() const = 0;
    virtual std::string encode(const TelemetrySnapshot& s) const = 0;

    const char* name() const { return schema_name(kind()); }
};

/**
 * @brief Nested schema carrying every sensor and actuator
 */
class RichSchema : public SnapshotSchema {
public:
    SchemaKind kind() const override { return SchemaKind::Rich; }

    std::string encode(const TelemetrySnapshot& s) const override {
        nlohmann::ordered_json j;
        j["ts"] = s.ts;
        j["mode"] = mode_name(s.mode);
        j["bme"] = nlohmann::ordered_json{{"t", s.bme.t}, {"p", s.bme.p}, {"h", s.bme.h}};
        j["ds18b20"] = s.ds18b20;
        j["soil"] = s.soil;
        j["water"] = s.water;
        j["valve"] = s.valve;
        j["pump"] = s.pump;
        return j.dump();
    }

    /**
     * @brief Decode a rich payload
     * @param payload JSON text
     * @param out Decoded snapshot, untouched on failure
     * @return false if the payload is malformed or has the wrong shape
     */
    static bool decode(const std::string& payload, TelemetrySnapshot& out) {
        auto j = nlohmann::json::parse(payload, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return false;

        try {
            TelemetrySnapshot s;
            if (!j.at("ts").is_number_unsigned()) return false;
            s.ts = j.at("ts").get<std::uint64_t>();
            if (!parse_mode(j.at("mode").get<std::string>(), s.mode)) return false;

            const auto& bme = j.at("bme");
            if (!bme.is_object()) return false;
            s.bme.t = bme.at("t").get<double>();
            s.bme.p = bme.at("p").get<int>();
            s.bme.h = bme.at("h").get<double>();

            if (!read_array(j.at("ds18b20"), s.ds18b20)) return false;
            if (!read_array(j.at("soil"), s.soil)) return false;
            if (!read_array(j.at("water"), s.water)) return false;
            if (!read_array(j.at("valve"), s.valve)) return false;
            if (!read_array(j.at("pump"), s.pump)) return false;
            out = s;
            return true;
        } catch (const nlohmann::json::exception&) {
            return false;
        }
    }

private:
    template<typename T, std::size_t N>
    static bool read_array(const nlohmann::json& j, std::array<T, N>& out) {
        if (!j.is_array() || j.size() != N) return false;
        for (std::size_t i = 0; i < N; ++i) {
            out[i] = j[i].get<T>();
        }
        return true;
    }
};

/**
 * @brief Flat schema with integer readings and a string timestamp
 */
class FlatSchema : public SnapshotSchema {
public:
    SchemaKind kind() const override { return SchemaKind::Flat; }

    std::string encode(const TelemetrySnapshot& s) const override {
        return encode_record(flatten(s));
    }

    /**
     * @brief Project a full snapshot onto the flat record
     *
     * soilTemp comes from the first probe that is on the bus, or stays at
     * the disconnected sentinel when none is.
     */
    static FlatSnapshot flatten(const TelemetrySnapshot& s) {
        FlatSnapshot f;
        f.pressure = s.bme.p;
        f.air_temp = static_cast<int>(std::lround(s.bme.t));
        f.air_humidity = static_cast<int>(std::lround(s.bme.h));
        f.soil_temp = static_cast<int>(kProbeDisconnected);
        for (double probe : s.ds18b20) {
            if (probe != kProbeDisconnected) {
                f.soil_temp = static_cast<int>(std::lround(probe));
                break;
            }
        }
        f.soil_humidity = s.soil[0];
        f.water_level = static_cast<int>(std::lround(s.water[0]));
        f.timestamp = std::to_string(s.ts);
        return f;
    }

    static std::string encode_record(const FlatSnapshot& f) {
        nlohmann::ordered_json j;
        j["pressure"] = f.pressure;
        j["soilTemp"] = f.soil_temp;
        j["soilHumidity"] = f.soil_humidity;
        j["waterLevel"] = f.water_level;
        j["airTemp"] = f.air_temp;
        j["airHumidity"] = f.air_humidity;
        j["timestamp"] = f.timestamp;
        return j.dump();
    }

    /**
     * @brief Decode a flat payload
     * @return false if the payload is malformed or a key is missing
     */
    static bool decode(const std::string& payload, FlatSnapshot& out) {
        auto j = nlohmann::json::parse(payload, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return false;

        try {
            FlatSnapshot f;
            f.pressure = j.at("pressure").get<int>();
            f.soil_temp = j.at("soilTemp").get<int>();
            f.soil_humidity = j.at("soilHumidity").get<int>();
            f.water_level = j.at("waterLevel").get<int>();
            f.air_temp = j.at("airTemp").get<int>();
            f.air_humidity = j.at("airHumidity").get<int>();
            if (!j.at("timestamp").is_string()) return false;
            f.timestamp = j.at("timestamp").get<std::string>();
            out = f;
            return true;
        } catch (const nlohmann::json::exception&) {
            return false;
        }
    }
};

inline std::unique_ptr<SnapshotSchema> make_schema(SchemaKind kind) {
    if (kind == SchemaKind::Flat) {
        return std::make_unique<FlatSchema>();
    }
    return std::make_unique<RichSchema>();
}
