// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <tt-logger/tt-logger.hpp>

#include <tracelink/common/assert.hpp>
#include <tracelink/relay/channel_sender.hpp>
#include <tracelink/relay/frame_codec.hpp>

namespace tracelink {

ChannelSender::ChannelSender(const std::filesystem::path& socket_path) : socket_(io_context_) {
    boost::system::error_code ec;
    socket_.connect(boost::asio::local::stream_protocol::endpoint(socket_path.string()), ec);
    if (ec) {
        TL_THROW("Failed to connect to {}: {}", socket_path.string(), ec.message());
    }
}

ChannelSender::~ChannelSender() { close(); }

void ChannelSender::send(const CollectItem& item) { send_raw(encode_frame(item)); }

void ChannelSender::send_raw(const std::string& bytes) {
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(bytes), ec);
    if (ec) {
        TL_THROW("Failed to write {} bytes to daemon: {}", bytes.size(), ec.message());
    }
}

void ChannelSender::close() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::local::stream_protocol::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
        log_debug(tt::LogAlways, "[IPC] Closing producer socket: {}", ec.message());
    }
}

}  // namespace tracelink
