#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace silverbp {

enum class DecodeStatus { Ok, MalformedPayload };
enum class TimestampStatus { Valid, InvalidTimestamp };

// Wall-clock minute as stamped by the cuff, tagged with the gateway's UTC offset.
struct LocalDateTime {
    uint16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;
    uint8_t hour = 0;
    uint8_t minute = 0;
    int32_t utcOffsetSeconds = 0;
};

bool operator==(const LocalDateTime& lhs, const LocalDateTime& rhs);
bool operator!=(const LocalDateTime& lhs, const LocalDateTime& rhs);

struct MeasurementRecord {
    uint16_t systolic = 0;
    uint16_t diastolic = 0;
    uint16_t arterial = 0;
    uint16_t pulse = 0;
    uint16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t userSlot = 0;
    TimestampStatus timestampStatus = TimestampStatus::InvalidTimestamp;
    std::optional<LocalDateTime> measuredAt;
};

/**
 * @brief Decode one measurement notification.
 *
 * Buffers shorter than BP_MIN_PAYLOAD_LENGTH yield MalformedPayload and leave
 * @p out untouched. An impossible calendar date only clears
 * MeasurementRecord::measuredAt; the pressure and pulse fields are still set.
 */
DecodeStatus decodeMeasurement(const uint8_t* data, size_t length, int32_t utcOffsetSeconds, MeasurementRecord& out);

// Same as above, annotated with the host's current local UTC offset.
DecodeStatus decodeMeasurement(const uint8_t* data, size_t length, MeasurementRecord& out);

bool isValidCalendarMinute(uint16_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute);
int32_t hostUtcOffsetSeconds();

const char* decodeStatusLabel(DecodeStatus status);

}  // namespace silverbp
