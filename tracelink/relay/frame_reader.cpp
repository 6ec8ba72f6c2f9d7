// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>

#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include <fmt/format.h>

#include <tracelink/relay/frame_reader.hpp>

namespace tracelink {

namespace {
constexpr std::size_t kDiscardChunkSize = 64 * 1024;
}

FrameReader::FrameReader(boost::asio::local::stream_protocol::socket& socket, std::size_t max_frame_size) :
    socket_(socket), max_frame_size_(max_frame_size) {}

void FrameReader::async_receive(Handler handler) {
    boost::asio::async_read(
        socket_,
        boost::asio::buffer(header_),
        [this, handler = std::move(handler)](const boost::system::error_code& ec, std::size_t) mutable {
            on_header(ec, std::move(handler));
        });
}

void FrameReader::on_header(const boost::system::error_code& ec, Handler handler) {
    if (ec) {
        handler(transport_result(ec));
        return;
    }

    uint32_t length = decode_frame_length(header_);
    if (length > max_frame_size_) {
        discard(length, length, std::move(handler));
        return;
    }
    if (length == 0) {
        handler(DecodeError{DecodeErrorKind::Malformed, "zero-length frame", {}});
        return;
    }

    payload_.resize(length);
    boost::asio::async_read(
        socket_,
        boost::asio::buffer(payload_),
        [this, handler = std::move(handler)](const boost::system::error_code& ec, std::size_t) mutable {
            on_payload(ec, std::move(handler));
        });
}

void FrameReader::on_payload(const boost::system::error_code& ec, Handler handler) {
    if (ec) {
        handler(transport_result(ec));
        return;
    }

    std::optional<CollectItem> item = parse_frame_payload(payload_);
    if (!item) {
        handler(DecodeError{
            DecodeErrorKind::Malformed, fmt::format("{}-byte payload is not a collect item", payload_.size()), {}});
        return;
    }
    handler(std::move(*item));
}

void FrameReader::discard(std::size_t remaining, std::size_t declared_length, Handler handler) {
    if (remaining == 0) {
        handler(DecodeError{
            DecodeErrorKind::Oversize,
            fmt::format("frame of {} bytes exceeds limit of {} bytes", declared_length, max_frame_size_),
            {}});
        return;
    }

    payload_.resize(std::min(remaining, kDiscardChunkSize));
    boost::asio::async_read(
        socket_,
        boost::asio::buffer(payload_),
        [this, remaining, declared_length, handler = std::move(handler)](
            const boost::system::error_code& ec, std::size_t bytes_read) mutable {
            if (ec) {
                handler(transport_result(ec));
                return;
            }
            discard(remaining - bytes_read, declared_length, std::move(handler));
        });
}

ReceiveResult FrameReader::transport_result(const boost::system::error_code& ec) {
    if (is_end_of_stream(ec)) {
        return EndOfStream{};
    }
    return DecodeError{DecodeErrorKind::Transport, ec.message(), ec};
}

SocketFrameSource::SocketFrameSource(boost::asio::local::stream_protocol::socket socket, std::size_t max_frame_size) :
    socket_(std::move(socket)), reader_(socket_, max_frame_size) {}

void SocketFrameSource::async_receive(Handler handler) { reader_.async_receive(std::move(handler)); }

}  // namespace tracelink
