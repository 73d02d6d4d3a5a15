#include "EventCodec.h"

#include <pb_decode.h>
#include <pb_encode.h>

namespace silverbp {

namespace {

void setError(std::string* error, const char* message) {
    if (error) {
        *error = message ? message : "unknown";
    }
}

}  // namespace

bool encodeWithLength(const pb_msgdesc_t* fields, const void* src, FrameBuffer& buffer, size_t& totalLen,
                      std::string* error) {
    pb_ostream_t stream = pb_ostream_from_buffer(buffer.data() + kLengthPrefixBytes, kProtoBufferSize);
    if (!pb_encode(&stream, fields, src)) {
        setError(error, PB_GET_ERROR(&stream));
        return false;
    }
    const size_t payloadLen = stream.bytes_written;
    if (payloadLen > 0xFFFF) {
        setError(error, "payload too large");
        return false;
    }
    buffer[0] = static_cast<uint8_t>(payloadLen & 0xFF);
    buffer[1] = static_cast<uint8_t>((payloadLen >> 8) & 0xFF);
    totalLen = payloadLen + kLengthPrefixBytes;
    return true;
}

bool encodeEvent(const silverbp_gateway_DeviceEvent& event, FrameBuffer& buffer, size_t& totalLen,
                 std::string* error) {
    return encodeWithLength(silverbp_gateway_DeviceEvent_fields, &event, buffer, totalLen, error);
}

bool decodeCommandFrame(const uint8_t* data, size_t len, silverbp_gateway_GatewayCommand& out,
                        std::string* error) {
    if (data == nullptr || len < kLengthPrefixBytes) {
        setError(error, "command too short");
        return false;
    }

    const uint16_t expected = static_cast<uint16_t>(data[0]) | (static_cast<uint16_t>(data[1]) << 8);
    const size_t available = len - kLengthPrefixBytes;
    if (expected != available) {
        setError(error, "length mismatch");
        return false;
    }

    silverbp_gateway_GatewayCommand cmd = silverbp_gateway_GatewayCommand_init_default;
    pb_istream_t stream = pb_istream_from_buffer(data + kLengthPrefixBytes, available);
    if (!pb_decode(&stream, silverbp_gateway_GatewayCommand_fields, &cmd)) {
        setError(error, PB_GET_ERROR(&stream));
        return false;
    }
    out = cmd;
    return true;
}

const char* deviceEventLabel(pb_size_t which) {
    switch (which) {
        case silverbp_gateway_DeviceEvent_status_tag: return "status";
        case silverbp_gateway_DeviceEvent_reading_tag: return "reading";
        case silverbp_gateway_DeviceEvent_boot_tag: return "boot";
        default: return "unknown";
    }
}

}  // namespace silverbp
