#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>

namespace openfang::runtime {

// Truncate to at most max_bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& text, size_t max_bytes);

/**
 * Size-capped capture of a sandboxed process's output.
 *
 * Writers append raw chunks; once the cap is reached the remainder is dropped,
 * the buffer is flagged truncated and append() reports the overflow so the
 * supervisor can stop the process. Readers stream by offset and may block
 * for new bytes.
 */
class OutputBuffer {
public:
    struct Chunk {
        std::string data;
        size_t next_offset = 0;
        bool closed = false;
        bool truncated = false;
    };

    explicit OutputBuffer(size_t capacity);

    // Returns false if this append hit the cap
    bool append(const char* data, size_t len);

    // Bytes from offset onward; waits up to `wait` when nothing new is available
    Chunk read_from(size_t offset, std::chrono::milliseconds wait) const;

    // No more writes; wakes blocked readers
    void close();

    std::string contents() const;
    bool truncated() const;
    bool closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::string data_;
    bool truncated_ = false;
    bool closed_ = false;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace openfang::runtime
