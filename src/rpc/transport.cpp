/**
 * @file transport.cpp
 * @brief Line framing and descriptor I/O
 */

#include "remindd/rpc/transport.h"
#include "remindd/logger.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace remindd {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace

LineFramer::LineFramer(size_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {
}

void LineFramer::feed(const char* data, size_t len) {
    buffer_.append(data, len);
    if (buffered() > max_frame_bytes_ &&
        buffer_.find('\n', std::max(scan_from_, consumed_)) == std::string::npos) {
        throw TransportError("frame exceeds " + std::to_string(max_frame_bytes_) +
                             " bytes without a newline");
    }
}

std::optional<std::string> LineFramer::next() {
    while (true) {
        size_t start = std::max(scan_from_, consumed_);
        size_t nl = buffer_.find('\n', start);
        if (nl == std::string::npos) {
            scan_from_ = buffer_.size();
            compact();
            return std::nullopt;
        }

        std::string line = buffer_.substr(consumed_, nl - consumed_);
        consumed_ = nl + 1;
        scan_from_ = consumed_;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() > max_frame_bytes_) {
            throw TransportError("frame of " + std::to_string(line.size()) +
                                 " bytes exceeds limit of " + std::to_string(max_frame_bytes_));
        }
        if (is_blank(line)) {
            continue;
        }
        return line;
    }
}

std::optional<std::string> LineFramer::finish() {
    std::string tail = buffer_.substr(consumed_);
    buffer_.clear();
    consumed_ = 0;
    scan_from_ = 0;

    if (!tail.empty() && tail.back() == '\r') {
        tail.pop_back();
    }
    if (is_blank(tail)) {
        return std::nullopt;
    }
    return tail;
}

void LineFramer::compact() {
    if (consumed_ == 0) {
        return;
    }
    buffer_.erase(0, consumed_);
    scan_from_ = scan_from_ > consumed_ ? scan_from_ - consumed_ : 0;
    consumed_ = 0;
}

StdioTransport::StdioTransport(int input_fd, int output_fd, size_t max_frame_bytes)
    : input_fd_(input_fd), output_fd_(output_fd), framer_(max_frame_bytes) {
}

StdioTransport::ReadStatus StdioTransport::read_frame(std::string& frame, int timeout_ms) {
    if (auto next = framer_.next()) {
        frame = std::move(*next);
        return ReadStatus::FRAME;
    }

    if (!eof_) {
        struct pollfd pfd;
        pfd.fd = input_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                return ReadStatus::TIMEOUT;
            }
            throw TransportError("poll failed: " + std::string(strerror(errno)));
        }
        if (rc == 0) {
            return ReadStatus::TIMEOUT;
        }

        char buffer[READ_CHUNK_BYTES];
        ssize_t bytes = read(input_fd_, buffer, sizeof(buffer));
        if (bytes < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                return ReadStatus::TIMEOUT;
            }
            throw TransportError("read failed: " + std::string(strerror(errno)));
        }
        if (bytes == 0) {
            LOG_DEBUG("Transport", "End of input stream");
            eof_ = true;
        } else {
            framer_.feed(buffer, static_cast<size_t>(bytes));
            if (auto next = framer_.next()) {
                frame = std::move(*next);
                return ReadStatus::FRAME;
            }
            return ReadStatus::TIMEOUT;
        }
    }

    // Input closed: hand out whatever was left unterminated, then report the end
    if (auto tail = framer_.finish()) {
        LOG_DEBUG("Transport", "Flushing unterminated frame at end of input");
        frame = std::move(*tail);
        return ReadStatus::FRAME;
    }
    return ReadStatus::END_OF_STREAM;
}

bool StdioTransport::write_message(const std::string& payload) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    std::string line;
    line.reserve(payload.size() + 1);
    line.append(payload);
    line.push_back('\n');

    if (!write_all(line.data(), line.size())) {
        return false;
    }
    ++messages_written_;
    return true;
}

uint64_t StdioTransport::messages_written() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return messages_written_;
}

bool StdioTransport::write_all(const char* data, size_t len) {
    size_t written = 0;
    while (written < len) {
        ssize_t n = write(output_fd_, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                struct pollfd pfd;
                pfd.fd = output_fd_;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                if (poll(&pfd, 1, 100) < 0 && errno != EINTR) {
                    LOG_ERROR("Transport", "Poll for write failed: " + std::string(strerror(errno)));
                    return false;
                }
                continue;
            }
            LOG_ERROR("Transport", "Write failed: " + std::string(strerror(errno)));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace remindd
