// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read.hpp>

#include <tracelink/relay/channel_sender.hpp>
#include <tracelink/relay/frame_codec.hpp>
#include "test_utils.hpp"

namespace tracelink {
namespace {

TEST(ChannelSenderTest, NoDaemon_ConstructorThrows) {
    test::TempDir dir;
    EXPECT_THROW(ChannelSender sender(dir / "absent.sock"), std::runtime_error);
}

TEST(ChannelSenderTest, WritesLengthPrefixedFrames) {
    test::TempDir dir;
    boost::asio::io_context io_context;
    boost::asio::local::stream_protocol::acceptor acceptor(
        io_context, boost::asio::local::stream_protocol::endpoint((dir / "peer.sock").string()));

    CollectItem item = test::make_log_item("payload");
    std::string expected = encode_frame(item);
    {
        ChannelSender sender(dir / "peer.sock");
        sender.send(item);
    }

    boost::asio::local::stream_protocol::socket peer(io_context);
    acceptor.accept(peer);
    std::string received(expected.size(), '\0');
    boost::asio::read(peer, boost::asio::buffer(received));
    EXPECT_EQ(received, expected);

    // The sender shut the connection down on destruction.
    char extra = 0;
    boost::system::error_code ec;
    boost::asio::read(peer, boost::asio::buffer(&extra, 1), ec);
    EXPECT_TRUE(is_end_of_stream(ec));
}

}  // namespace
}  // namespace tracelink
