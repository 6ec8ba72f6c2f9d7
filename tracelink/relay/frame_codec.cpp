// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <limits>

#include <boost/asio/error.hpp>

#include <tracelink/common/assert.hpp>
#include <tracelink/relay/frame_codec.hpp>

namespace tracelink {

FrameHeader encode_frame_length(uint32_t length) {
    return FrameHeader{
        static_cast<uint8_t>(length & 0xff),
        static_cast<uint8_t>((length >> 8) & 0xff),
        static_cast<uint8_t>((length >> 16) & 0xff),
        static_cast<uint8_t>((length >> 24) & 0xff),
    };
}

uint32_t decode_frame_length(const FrameHeader& header) {
    return static_cast<uint32_t>(header[0]) | (static_cast<uint32_t>(header[1]) << 8) |
           (static_cast<uint32_t>(header[2]) << 16) | (static_cast<uint32_t>(header[3]) << 24);
}

std::string encode_frame(const CollectItem& item) {
    std::string payload;
    TL_FATAL(item.SerializeToString(&payload), "Failed to serialize {} item", item_kind(item));
    TL_FATAL(
        payload.size() <= std::numeric_limits<uint32_t>::max(),
        "Serialized {} item is {} bytes, too large for a frame",
        item_kind(item),
        payload.size());

    FrameHeader header = encode_frame_length(static_cast<uint32_t>(payload.size()));
    std::string frame;
    frame.reserve(kFrameHeaderSize + payload.size());
    frame.append(reinterpret_cast<const char*>(header.data()), header.size());
    frame.append(payload);
    return frame;
}

std::optional<CollectItem> parse_frame_payload(std::span<const uint8_t> payload) {
    if (payload.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    CollectItem item;
    if (!item.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
        return std::nullopt;
    }
    if (item.item_case() == CollectItem::ITEM_NOT_SET) {
        return std::nullopt;
    }
    return item;
}

std::string_view to_string(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::Malformed: return "Malformed";
        case DecodeErrorKind::Oversize: return "Oversize";
        case DecodeErrorKind::Transport: return "Transport";
    }
    return "Unknown";
}

bool is_end_of_stream(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::connection_aborted || ec == boost::asio::error::broken_pipe ||
           ec == boost::asio::error::operation_aborted || ec == boost::asio::error::bad_descriptor ||
           ec == boost::asio::error::not_connected;
}

}  // namespace tracelink
