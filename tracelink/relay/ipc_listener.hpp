// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <tracelink/relay/collect_item.hpp>
#include <tracelink/relay/relay_queue.hpp>

namespace tracelink {

// Accept loop on the daemon's Unix domain socket. Each accepted producer gets its own Connection running an
// independent receive loop on the shared executor. Accept errors are logged and retried; they never end the loop.
class IpcListener : public std::enable_shared_from_this<IpcListener> {
public:
    // Delay before accepting again after a failed accept.
    static constexpr auto kAcceptRetryDelay = std::chrono::milliseconds(100);

    // Removes a stale socket file at `socket_path`, binds, listens and widens the socket's permissions so any local
    // producer can connect. Throws std::runtime_error if the socket cannot be bound.
    static std::shared_ptr<IpcListener> bind(
        const boost::asio::any_io_executor& executor,
        const std::filesystem::path& socket_path,
        std::size_t max_frame_size,
        RelayQueue<CollectItem>& queue);

    void start();

    // Closes the acceptor. Connections already accepted keep running until their peers hang up or the queue closes.
    void stop();

    const std::filesystem::path& socket_path() const { return socket_path_; }
    uint64_t connections_accepted() const { return connections_accepted_.load(); }
    uint64_t accept_failures() const { return accept_failures_.load(); }

    // Use bind().
    IpcListener(
        const boost::asio::any_io_executor& executor,
        std::filesystem::path socket_path,
        std::size_t max_frame_size,
        RelayQueue<CollectItem>& queue);

private:
    void accept_next();
    void on_accept(const boost::system::error_code& ec, boost::asio::local::stream_protocol::socket socket);

    boost::asio::any_io_executor executor_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    boost::asio::local::stream_protocol::acceptor acceptor_;
    boost::asio::steady_timer retry_timer_;
    const std::filesystem::path socket_path_;
    const std::size_t max_frame_size_;
    RelayQueue<CollectItem>& queue_;
    bool stopped_ = false;
    std::atomic<uint64_t> connections_accepted_ = 0;
    std::atomic<uint64_t> accept_failures_ = 0;
};

}  // namespace tracelink
