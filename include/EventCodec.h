#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <pb.h>

#include "proto/gateway.pb.h"

namespace silverbp {

constexpr size_t kProtoBufferSize = 512;
constexpr size_t kLengthPrefixBytes = 2;

using FrameBuffer = std::array<uint8_t, kLengthPrefixBytes + kProtoBufferSize>;

// Frame = 2-byte little-endian payload length followed by the encoded message.
bool encodeWithLength(const pb_msgdesc_t* fields, const void* src, FrameBuffer& buffer, size_t& totalLen,
                      std::string* error = nullptr);

bool encodeEvent(const silverbp_gateway_DeviceEvent& event, FrameBuffer& buffer, size_t& totalLen,
                 std::string* error = nullptr);

// Rejects frames whose prefix does not match the bytes that follow it.
bool decodeCommandFrame(const uint8_t* data, size_t len, silverbp_gateway_GatewayCommand& out,
                        std::string* error = nullptr);

const char* deviceEventLabel(pb_size_t which);

}  // namespace silverbp
