#include "FrameChannel.hpp"
#include "WireCodec.hpp"
#include "processUtils.hpp"

#include <cerrno>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/types.h>

namespace SysTask::Ipc {

namespace {

void put_u32_le(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

uint32_t get_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

FrameChannel::FrameChannel(int fd, std::shared_ptr<runtime::CoroIoContext> context, std::shared_ptr<Logger> logger)
    : fd_(fd), context_(std::move(context)), logger_(std::move(logger)) {
    if (!context_) {
        ProcessUtils::close_fd(fd_);
        throw std::invalid_argument("FrameChannel: context cannot be null");
    }
    std::error_code ec;
    if (!ProcessUtils::set_nonblocking(fd_, ec)) {
        ProcessUtils::close_fd(fd_);
        throw std::system_error(ec, "FrameChannel: cannot make descriptor non-blocking");
    }
}

FrameChannel::~FrameChannel() { close(); }

void FrameChannel::close() {
    ProcessUtils::close_fd(fd_);
    out_buf_.clear();
    out_offset_ = 0;
}

bool FrameChannel::send(const Message& message, std::error_code& ec) {
    auto body = WireCodec::encode(message);
    return send_frame(body, ec);
}

bool FrameChannel::send_frame(std::span<const uint8_t> body, std::error_code& ec) {
    ec.clear();
    if (fd_ < 0) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }
    if (write_error_) {
        ec = write_error_;
        return false;
    }
    if (body.size() > max_frame_size) {
        ec = std::make_error_code(std::errc::message_size);
        return false;
    }
    // Compact before growing
    if (out_offset_ > 0 && out_offset_ == out_buf_.size()) {
        out_buf_.clear();
        out_offset_ = 0;
    }
    put_u32_le(out_buf_, static_cast<uint32_t>(body.size()));
    out_buf_.insert(out_buf_.end(), body.begin(), body.end());

    flush_(ec);
    if (ec) return false;
    if (pending_output_bytes() > 0) schedule_flush_();
    return true;
}

bool FrameChannel::flush_(std::error_code& ec) {
    while (fd_ >= 0 && out_offset_ < out_buf_.size()) {
        ssize_t n = ::send(fd_, out_buf_.data() + out_offset_, out_buf_.size() - out_offset_, MSG_NOSIGNAL);
        if (n > 0) {
            out_offset_ += static_cast<size_t>(n);
            bytes_sent_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return false;
        ec = std::error_code(n < 0 ? errno : EPIPE, std::generic_category());
        write_error_ = ec;
        return true;
    }
    if (out_offset_ == out_buf_.size()) {
        out_buf_.clear();
        out_offset_ = 0;
    }
    return true;
}

void FrameChannel::schedule_flush_() {
    if (flush_scheduled_) return;
    flush_scheduled_ = true;
    std::weak_ptr<FrameChannel> weak = weak_from_this();
    context_->register_pending(runtime::CoroIoContext::PendingOpCategory::Write, [weak]() {
        auto self = weak.lock();
        if (!self) return true;
        std::error_code ec;
        bool finished = self->flush_(ec);
        if (ec && self->logger_) self->logger_->error("FrameChannel: write failed: " + ec.message());
        if (finished) self->flush_scheduled_ = false;
        return finished;
    }, std::coroutine_handle<>{});
}

void FrameChannel::fill_input_(std::error_code& ec) {
    uint8_t chunk[16 * 1024];
    while (fd_ >= 0 && !eof_) {
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n > 0) {
            in_buf_.insert(in_buf_.end(), chunk, chunk + n);
            bytes_received_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n == 0) {
            eof_ = true;
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        ec = std::error_code(errno, std::generic_category());
        return;
    }
}

std::optional<std::vector<uint8_t>> FrameChannel::try_read_frame(std::error_code& ec) {
    ec.clear();
    if (fd_ < 0) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return std::nullopt;
    }
    fill_input_(ec);
    if (ec) return std::nullopt;

    if (in_buf_.size() >= header_size) {
        uint32_t length = get_u32_le(in_buf_.data());
        if (length > max_frame_size) {
            ec = std::make_error_code(std::errc::message_size);
            return std::nullopt;
        }
        if (in_buf_.size() >= header_size + length) {
            std::vector<uint8_t> body(in_buf_.begin() + header_size, in_buf_.begin() + header_size + length);
            in_buf_.erase(in_buf_.begin(), in_buf_.begin() + header_size + length);
            return body;
        }
    }
    if (eof_) {
        ec = std::make_error_code(std::errc::connection_reset);
    }
    return std::nullopt;
}

} // namespace SysTask::Ipc
