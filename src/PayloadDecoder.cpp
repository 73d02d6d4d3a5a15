#include "PayloadDecoder.h"

#include "Config.h"
#include <ctime>

namespace silverbp {

namespace {

uint16_t readLe16(const uint8_t* data, size_t offset) {
    return static_cast<uint16_t>(data[offset] + data[offset + 1] * 256U);
}

bool isLeapYear(uint16_t year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

uint8_t daysInMonth(uint16_t year, uint8_t month) {
    static constexpr uint8_t kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

}  // namespace

bool operator==(const LocalDateTime& lhs, const LocalDateTime& rhs) {
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day &&
           lhs.hour == rhs.hour && lhs.minute == rhs.minute &&
           lhs.utcOffsetSeconds == rhs.utcOffsetSeconds;
}

bool operator!=(const LocalDateTime& lhs, const LocalDateTime& rhs) {
    return !(lhs == rhs);
}

bool isValidCalendarMinute(uint16_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute) {
    // The cuff clock is four-digit; anything outside that range is an unset RTC.
    if (year < 1000 || year > 9999) {
        return false;
    }
    if (month < 1 || month > 12) {
        return false;
    }
    if (day < 1 || day > daysInMonth(year, month)) {
        return false;
    }
    return hour <= 23 && minute <= 59;
}

int32_t hostUtcOffsetSeconds() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    std::tm utc{};
    if (localtime_r(&now, &local) == nullptr || gmtime_r(&now, &utc) == nullptr) {
        return 0;
    }

    int32_t dayDelta = 0;
    if (local.tm_year != utc.tm_year) {
        dayDelta = (local.tm_year > utc.tm_year) ? 1 : -1;
    } else {
        dayDelta = local.tm_yday - utc.tm_yday;
    }

    return dayDelta * 86400 +
           (local.tm_hour - utc.tm_hour) * 3600 +
           (local.tm_min - utc.tm_min) * 60 +
           (local.tm_sec - utc.tm_sec);
}

DecodeStatus decodeMeasurement(const uint8_t* data, size_t length, int32_t utcOffsetSeconds, MeasurementRecord& out) {
    if (data == nullptr || length < BP_MIN_PAYLOAD_LENGTH) {
        return DecodeStatus::MalformedPayload;
    }

    MeasurementRecord record;
    record.systolic = readLe16(data, 1);
    record.diastolic = readLe16(data, 3);
    record.arterial = readLe16(data, 5);
    record.year = readLe16(data, 7);
    record.month = data[9];
    record.day = data[10];
    record.hour = data[11];
    record.minute = data[12];
    record.pulse = readLe16(data, 14);
    record.userSlot = data[16];

    if (isValidCalendarMinute(record.year, record.month, record.day, record.hour, record.minute)) {
        LocalDateTime stamp;
        stamp.year = record.year;
        stamp.month = record.month;
        stamp.day = record.day;
        stamp.hour = record.hour;
        stamp.minute = record.minute;
        stamp.utcOffsetSeconds = utcOffsetSeconds;
        record.measuredAt = stamp;
        record.timestampStatus = TimestampStatus::Valid;
    } else {
        record.measuredAt.reset();
        record.timestampStatus = TimestampStatus::InvalidTimestamp;
    }

    out = record;
    return DecodeStatus::Ok;
}

DecodeStatus decodeMeasurement(const uint8_t* data, size_t length, MeasurementRecord& out) {
    return decodeMeasurement(data, length, hostUtcOffsetSeconds(), out);
}

const char* decodeStatusLabel(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::Ok: return "ok";
        case DecodeStatus::MalformedPayload: return "malformed-payload";
    }
    return "unknown";
}

}  // namespace silverbp
