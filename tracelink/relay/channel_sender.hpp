// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <tracelink/relay/collect_item.hpp>

namespace tracelink {

// Producer side of the IPC channel: a blocking client that writes framed collect items to the daemon socket.
// The connection is closed when the sender is destroyed.
class ChannelSender {
public:
    // Throws std::runtime_error if the daemon socket cannot be reached.
    explicit ChannelSender(const std::filesystem::path& socket_path);
    ~ChannelSender();

    ChannelSender(const ChannelSender&) = delete;
    ChannelSender& operator=(const ChannelSender&) = delete;

    // Throws std::runtime_error if the write fails (e.g. the daemon went away).
    void send(const CollectItem& item);

    // Writes bytes as-is, without framing. Lets callers emit deliberately broken frames.
    void send_raw(const std::string& bytes);

    void close();

private:
    boost::asio::io_context io_context_;
    boost::asio::local::stream_protocol::socket socket_;
};

}  // namespace tracelink
