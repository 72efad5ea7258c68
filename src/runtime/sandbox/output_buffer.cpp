#include "runtime/sandbox/output_buffer.hpp"

namespace openfang::runtime {

namespace {

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool is_lead(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0xC0;
}

} // namespace

std::string truncate_utf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t end = max_bytes;
    while (end > 0 && is_continuation(text[end])) {
        --end;
    }
    return text.substr(0, end);
}

OutputBuffer::OutputBuffer(size_t capacity)
    : capacity_(capacity) {}

bool OutputBuffer::append(const char* data, size_t len) {
    if (len == 0) {
        return true;
    }

    bool fits = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || truncated_) {
            return !truncated_;
        }

        size_t room = capacity_ - data_.size();
        if (len <= room) {
            data_.append(data, len);
        } else {
            data_.append(data, room);
            // Drop a sequence split by the cut
            if (is_continuation(data[room])) {
                while (!data_.empty() && is_continuation(data_.back())) {
                    data_.pop_back();
                }
                if (!data_.empty() && is_lead(data_.back())) {
                    data_.pop_back();
                }
            }
            truncated_ = true;
            fits = false;
        }
    }
    cv_.notify_all();
    return fits;
}

OutputBuffer::Chunk OutputBuffer::read_from(size_t offset, std::chrono::milliseconds wait) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (wait.count() > 0) {
        cv_.wait_for(lock, wait, [&]() { return closed_ || data_.size() > offset; });
    }

    Chunk chunk;
    if (offset < data_.size()) {
        chunk.data = data_.substr(offset);
    }
    chunk.next_offset = offset < data_.size() ? data_.size() : offset;
    chunk.closed = closed_;
    chunk.truncated = truncated_;
    return chunk;
}

void OutputBuffer::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::string OutputBuffer::contents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

bool OutputBuffer::truncated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return truncated_;
}

bool OutputBuffer::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t OutputBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

} // namespace openfang::runtime
