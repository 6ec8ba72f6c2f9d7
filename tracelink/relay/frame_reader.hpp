// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include <boost/asio/local/stream_protocol.hpp>

#include <tracelink/relay/frame_codec.hpp>

namespace tracelink {

// Where a connection's receive loop gets its frames from. Each async_receive() completes its handler exactly once.
class FrameSource {
public:
    using Handler = std::function<void(ReceiveResult)>;

    virtual ~FrameSource() = default;
    virtual void async_receive(Handler handler) = 0;
};

// Reads one length-delimited frame at a time off a producer socket.
//
// Every async_receive() call completes its handler exactly once with one of:
//   - CollectItem  a frame was read and parsed,
//   - EndOfStream  the peer closed (also reported for reset/broken pipe, the peer is gone either way),
//   - DecodeError  the frame was unusable; for Malformed and Oversize the whole frame has been consumed, so the
//                  next call starts on a frame boundary.
// Only one receive may be outstanding at a time. The socket must outlive the reader.
class FrameReader {
public:
    using Handler = FrameSource::Handler;

    FrameReader(boost::asio::local::stream_protocol::socket& socket, std::size_t max_frame_size);

    void async_receive(Handler handler);

private:
    void on_header(const boost::system::error_code& ec, Handler handler);
    void on_payload(const boost::system::error_code& ec, Handler handler);
    void discard(std::size_t remaining, std::size_t declared_length, Handler handler);

    static ReceiveResult transport_result(const boost::system::error_code& ec);

    boost::asio::local::stream_protocol::socket& socket_;
    const std::size_t max_frame_size_;
    FrameHeader header_{};
    std::vector<uint8_t> payload_;
};

// Owns a producer socket and reads frames off it.
class SocketFrameSource : public FrameSource {
public:
    SocketFrameSource(boost::asio::local::stream_protocol::socket socket, std::size_t max_frame_size);

    void async_receive(Handler handler) override;

private:
    boost::asio::local::stream_protocol::socket socket_;
    FrameReader reader_;
};

}  // namespace tracelink
