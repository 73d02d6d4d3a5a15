#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "PayloadDecoder.h"

namespace silverbp {

enum class SensorKey { Systolic, Diastolic, Pulse, SignalStrength, Timestamp };

using SensorValue = std::variant<int32_t, LocalDateTime>;

struct SensorReading {
    SensorKey key = SensorKey::Systolic;
    std::string unit;
    SensorValue value = int32_t{0};
    std::string name;
};

const char* sensorKeyLabel(SensorKey key);

namespace units {
constexpr const char* kPressureMmHg = "mmHg";
constexpr const char* kBeatsPerMinute = "bpm";
constexpr const char* kSignalStrengthDbm = "dBm";
constexpr const char* kNone = "";
}  // namespace units

class MeasurementSink {
public:
    // Append, or overwrite in place when @p key was already recorded.
    void record(SensorKey key, const std::string& unit, const SensorValue& value, const std::string& name);

    // Timestamp (when valid), systolic, diastolic and pulse from one decoded record.
    void recordMeasurement(const MeasurementRecord& measurement);

    void recordSignalStrength(int32_t rssi);

    [[nodiscard]] std::vector<SensorReading> snapshot() const { return readings_; }
    [[nodiscard]] std::optional<SensorReading> find(SensorKey key) const;
    [[nodiscard]] bool hasMeasurement() const;
    [[nodiscard]] size_t size() const { return readings_.size(); }

private:
    std::vector<SensorReading> readings_;
};

}  // namespace silverbp
