#include "ipc/FrameChannel.hpp"
#include "ipc/WireCodec.hpp"
#include "processUtils.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>
#include <vector>

using namespace SysTask::Ipc;

class FrameChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        int sv[2];
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv), 0);
        channel = std::make_shared<FrameChannel>(sv[0], loop);
        peer = sv[1];
    }

    void TearDown() override {
        ProcessUtils::close_fd(peer);
    }

    void write_raw(const std::vector<uint8_t>& bytes) {
        ASSERT_EQ(::write(peer, bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }

    static std::vector<uint8_t> header(uint32_t length) {
        return {static_cast<uint8_t>(length & 0xFF), static_cast<uint8_t>((length >> 8) & 0xFF),
                static_cast<uint8_t>((length >> 16) & 0xFF), static_cast<uint8_t>((length >> 24) & 0xFF)};
    }

    std::shared_ptr<runtime::CoroIoContext> loop = std::make_shared<runtime::CoroIoContext>();
    std::shared_ptr<FrameChannel> channel;
    int peer{-1};
};

TEST_F(FrameChannelTest, ReassemblesFrameFromPartialWrites) {
    std::error_code ec;
    auto frame = channel->try_read_frame(ec);
    EXPECT_FALSE(frame.has_value());
    EXPECT_FALSE(ec);

    write_raw({0x05, 0x00});
    frame = channel->try_read_frame(ec);
    EXPECT_FALSE(frame.has_value());
    EXPECT_FALSE(ec);

    write_raw({0x00, 0x00, 'h', 'e'});
    frame = channel->try_read_frame(ec);
    EXPECT_FALSE(frame.has_value());

    write_raw({'l', 'l', 'o'});
    frame = channel->try_read_frame(ec);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(std::string(frame->begin(), frame->end()), "hello");
    EXPECT_EQ(channel->bytes_received(), 9u);
}

TEST_F(FrameChannelTest, TwoFramesInOneWrite) {
    std::vector<uint8_t> bytes = header(2);
    bytes.insert(bytes.end(), {'a', 'b'});
    auto second = header(1);
    bytes.insert(bytes.end(), second.begin(), second.end());
    bytes.push_back('c');
    write_raw(bytes);

    std::error_code ec;
    auto first = channel->try_read_frame(ec);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->size(), 2u);
    auto next = channel->try_read_frame(ec);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ((*next)[0], 'c');
}

TEST_F(FrameChannelTest, OversizeFrameIsProtocolError) {
    write_raw(header(static_cast<uint32_t>(FrameChannel::max_frame_size + 1)));
    std::error_code ec;
    auto frame = channel->try_read_frame(ec);
    EXPECT_FALSE(frame.has_value());
    EXPECT_EQ(ec, std::errc::message_size);
}

TEST_F(FrameChannelTest, PeerCloseReportsResetAfterBufferedFrames) {
    auto bytes = header(1);
    bytes.push_back('x');
    write_raw(bytes);
    ProcessUtils::close_fd(peer);

    std::error_code ec;
    auto frame = channel->try_read_frame(ec);
    ASSERT_TRUE(frame.has_value());
    frame = channel->try_read_frame(ec);
    EXPECT_FALSE(frame.has_value());
    EXPECT_EQ(ec, std::errc::connection_reset);
}

TEST_F(FrameChannelTest, SentMessageArrivesLengthPrefixed) {
    std::error_code ec;
    ASSERT_TRUE(channel->send(TaskErrorMessage{"task-9-1", "nope", 3}, ec)) << ec.message();

    uint8_t head[4];
    ASSERT_EQ(::read(peer, head, sizeof(head)), 4);
    uint32_t length = head[0] | (head[1] << 8) | (head[2] << 16) | (static_cast<uint32_t>(head[3]) << 24);
    std::vector<uint8_t> body(length);
    ASSERT_EQ(::read(peer, body.data(), body.size()), static_cast<ssize_t>(length));

    auto decoded = WireCodec::decode(body);
    auto* error = std::get_if<TaskErrorMessage>(&decoded);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->task_id, "task-9-1");
    EXPECT_EQ(error->code, 3);
}

TEST_F(FrameChannelTest, SendAfterPeerCloseFailsWithoutSignal) {
    ProcessUtils::close_fd(peer);
    std::error_code ec;
    std::vector<uint8_t> body(16, 0x42);
    EXPECT_FALSE(channel->send_frame(body, ec));
    EXPECT_TRUE(static_cast<bool>(ec));
}

TEST_F(FrameChannelTest, ClosedChannelReportsBadDescriptor) {
    channel->close();
    EXPECT_FALSE(channel->is_open());
    std::error_code ec;
    EXPECT_FALSE(channel->try_read_frame(ec).has_value());
    EXPECT_EQ(ec, std::errc::bad_file_descriptor);
}
