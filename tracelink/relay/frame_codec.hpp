// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>

#include <boost/system/error_code.hpp>

#include <tracelink/relay/collect_item.hpp>

namespace tracelink {

/**************************************************************************************************
 Frame layout: [u32 little-endian payload length][payload = serialized CollectItem]
**************************************************************************************************/

inline constexpr std::size_t kFrameHeaderSize = 4;
inline constexpr std::size_t kDefaultMaxFrameSize = 16 * 1024 * 1024;

using FrameHeader = std::array<uint8_t, kFrameHeaderSize>;

FrameHeader encode_frame_length(uint32_t length);
uint32_t decode_frame_length(const FrameHeader& header);

// Serializes one item into a complete frame (header + payload).
std::string encode_frame(const CollectItem& item);

// Parses a frame payload. Returns std::nullopt when the bytes are not a CollectItem or carry no item.
std::optional<CollectItem> parse_frame_payload(std::span<const uint8_t> payload);

/**************************************************************************************************
 Receive outcomes
**************************************************************************************************/

// The peer closed the stream. Expected at the end of every producer's lifetime.
struct EndOfStream {};

enum class DecodeErrorKind {
    Malformed,  // payload did not parse
    Oversize,   // declared length above the configured maximum; payload was skipped
    Transport,  // socket error other than end-of-stream
};

std::string_view to_string(DecodeErrorKind kind);

struct DecodeError {
    DecodeErrorKind kind;
    std::string message;
    boost::system::error_code transport_error;
};

using ReceiveResult = std::variant<CollectItem, EndOfStream, DecodeError>;

// Socket errors meaning the peer is gone rather than a fault worth reporting.
bool is_end_of_stream(const boost::system::error_code& ec);

}  // namespace tracelink
