/**
 * \file ipc/FrameChannel.hpp
 * \brief Length-prefixed frame transport over a connected stream socket.
 * \details Each frame is a 4-byte little-endian body length followed by the body.
 * Reads and writes are non-blocking; partial writes are queued and flushed by a
 * background pending operation on the owning `CoroIoContext`.
 */
#pragma once

#include "TaskMessage.hpp"
#include "runtime/CoroIoContext.hpp"
#include "logger.hpp"

#include <coroutine>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace SysTask::Ipc {

/**
 * \brief Message-oriented wrapper around one end of a socketpair.
 * \details Owns the file descriptor. All methods are expected to be called on the
 * loop thread of the context passed at construction.
 * \invariant At most one `async_read_frame` in flight per channel.
 */
class FrameChannel : public std::enable_shared_from_this<FrameChannel> {
public:
    static constexpr size_t header_size = 4;
    static constexpr size_t max_frame_size = 16u * 1024u * 1024u;

    /**
     * \brief Take ownership of `fd` and switch it to non-blocking mode.
     * \throws std::system_error if the descriptor cannot be configured.
     */
    FrameChannel(int fd, std::shared_ptr<runtime::CoroIoContext> context, std::shared_ptr<Logger> logger = nullptr);
    ~FrameChannel();

    FrameChannel(const FrameChannel&) = delete;
    FrameChannel& operator=(const FrameChannel&) = delete;

    /**
     * \brief Queue one frame and write as much as the socket accepts now.
     * \return false with `ec` set if the channel is closed, the body is too large,
     * or the peer is gone.
     */
    bool send_frame(std::span<const uint8_t> body, std::error_code& ec);

    /** \brief Encode and send a message. \throws CodecError on unencodable values */
    bool send(const Message& message, std::error_code& ec);

    /**
     * \brief Non-blocking read of one complete frame body.
     * \return a body when one is complete; `std::nullopt` when more bytes are needed
     * or on error (`ec` set). EOF reports `std::errc::connection_reset` once buffered
     * frames are consumed; oversize frames report `std::errc::message_size`.
     */
    std::optional<std::vector<uint8_t>> try_read_frame(std::error_code& ec);

    /** \brief Awaitable yielding the next frame body. \throws std::system_error */
    auto async_read_frame() {
        struct ReadFrameAwaitable {
            std::shared_ptr<FrameChannel> channel;
            std::optional<std::vector<uint8_t>> frame{};
            std::error_code error{};
            bool await_ready() {
                frame = channel->try_read_frame(error);
                return frame.has_value() || static_cast<bool>(error);
            }
            void await_suspend(std::coroutine_handle<> handle) {
                channel->context_->register_pending(runtime::CoroIoContext::PendingOpCategory::Read, [this]() {
                    frame = channel->try_read_frame(error);
                    return frame.has_value() || static_cast<bool>(error);
                }, handle);
            }
            std::vector<uint8_t> await_resume() {
                if (error) {
                    throw std::system_error(error, "FrameChannel read failed");
                }
                return std::move(*frame);
            }
        };
        return ReadFrameAwaitable{shared_from_this()};
    }

    void close();
    bool is_open() const { return fd_ >= 0; }
    int native_handle() const { return fd_; }
    size_t pending_output_bytes() const { return out_buf_.size() - out_offset_; }

    std::uint64_t bytes_sent() const { return bytes_sent_; }
    std::uint64_t bytes_received() const { return bytes_received_; }

private:
    /** \brief Write queued bytes; returns true when nothing remains or on error. */
    bool flush_(std::error_code& ec);
    void schedule_flush_();
    void fill_input_(std::error_code& ec);

    int fd_{-1};
    std::shared_ptr<runtime::CoroIoContext> context_;
    std::shared_ptr<Logger> logger_;

    std::vector<uint8_t> in_buf_;
    std::vector<uint8_t> out_buf_;
    size_t out_offset_{0};
    bool flush_scheduled_{false};
    bool eof_{false};
    std::error_code write_error_{};

    std::uint64_t bytes_sent_{0};
    std::uint64_t bytes_received_{0};
};

} // namespace SysTask::Ipc
