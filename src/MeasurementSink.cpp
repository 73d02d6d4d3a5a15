#include "MeasurementSink.h"

#include <algorithm>

namespace silverbp {

const char* sensorKeyLabel(SensorKey key) {
    switch (key) {
        case SensorKey::Systolic: return "systolic";
        case SensorKey::Diastolic: return "diastolic";
        case SensorKey::Pulse: return "pulse";
        case SensorKey::SignalStrength: return "signal_strength";
        case SensorKey::Timestamp: return "timestamp";
    }
    return "unknown";
}

void MeasurementSink::record(SensorKey key, const std::string& unit, const SensorValue& value, const std::string& name) {
    auto it = std::find_if(readings_.begin(), readings_.end(),
                           [key](const SensorReading& reading) { return reading.key == key; });
    if (it != readings_.end()) {
        it->unit = unit;
        it->value = value;
        it->name = name;
        return;
    }
    readings_.push_back({key, unit, value, name});
}

void MeasurementSink::recordMeasurement(const MeasurementRecord& measurement) {
    if (measurement.measuredAt.has_value()) {
        record(SensorKey::Timestamp, units::kNone, *measurement.measuredAt, "Measured Date");
    }
    record(SensorKey::Systolic, units::kPressureMmHg, static_cast<int32_t>(measurement.systolic), "Systolic");
    record(SensorKey::Diastolic, units::kPressureMmHg, static_cast<int32_t>(measurement.diastolic), "Diastolic");
    record(SensorKey::Pulse, units::kBeatsPerMinute, static_cast<int32_t>(measurement.pulse), "Pulse");
}

void MeasurementSink::recordSignalStrength(int32_t rssi) {
    record(SensorKey::SignalStrength, units::kSignalStrengthDbm, rssi, "Signal Strength");
}

std::optional<SensorReading> MeasurementSink::find(SensorKey key) const {
    for (const auto& reading : readings_) {
        if (reading.key == key) {
            return reading;
        }
    }
    return std::nullopt;
}

bool MeasurementSink::hasMeasurement() const {
    return find(SensorKey::Systolic).has_value() ||
           find(SensorKey::Diastolic).has_value() ||
           find(SensorKey::Pulse).has_value();
}

}  // namespace silverbp
