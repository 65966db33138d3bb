/**
 * @file transport.h
 * @brief Newline-delimited framing over a pair of file descriptors
 */

#pragma once

#include <string>
#include <optional>
#include <mutex>
#include <stdexcept>
#include "remindd/common.h"

namespace remindd {

/**
 * @brief Connection-fatal transport failure
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Reassembles newline-delimited frames from arbitrary chunks
 *
 * CR before LF is stripped and blank lines are skipped. A line that grows
 * past max_frame_bytes without a newline raises TransportError.
 */
class LineFramer {
public:
    explicit LineFramer(size_t max_frame_bytes = MAX_FRAME_BYTES);

    void feed(const char* data, size_t len);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    /**
     * @brief Pop the next complete frame, if any
     */
    std::optional<std::string> next();

    /**
     * @brief Flush the unterminated tail at end of input
     */
    std::optional<std::string> finish();

    size_t buffered() const { return buffer_.size() - consumed_; }

private:
    size_t max_frame_bytes_;
    std::string buffer_;
    size_t consumed_ = 0;
    size_t scan_from_ = 0;

    void compact();
};

/**
 * @brief Line transport over an input and an output descriptor
 *
 * Reading happens on one thread. write_message() may be called from any
 * thread; a single writer lock keeps each message whole on the wire.
 */
class StdioTransport {
public:
    enum class ReadStatus {
        FRAME,
        TIMEOUT,
        END_OF_STREAM
    };

    StdioTransport(int input_fd, int output_fd, size_t max_frame_bytes = MAX_FRAME_BYTES);

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /**
     * @brief Wait up to timeout_ms for the next frame
     * @throws TransportError on read failure or an oversized frame
     */
    ReadStatus read_frame(std::string& frame, int timeout_ms);

    /**
     * @brief Write payload plus newline atomically with respect to other writers
     * @return false if the peer is gone
     */
    bool write_message(const std::string& payload);

    uint64_t messages_written() const;

private:
    int input_fd_;
    int output_fd_;
    LineFramer framer_;
    bool eof_ = false;

    mutable std::mutex write_mutex_;
    uint64_t messages_written_ = 0;

    bool write_all(const char* data, size_t len);
};

} // namespace remindd
