#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace hoya::sandbox {

enum class Stream {
    kStdout,
    kStderr
};

// Request-scoped stdout/stderr buffers with a per-stream byte cap.
// A sink belongs to exactly one execution and has a single writer: the thread
// running the guest. The mutex only orders that writer against readers that
// inspect flags from the watchdog or the orchestrator.
class CaptureSink {
public:
    explicit CaptureSink(std::size_t max_bytes_per_stream);

    // Appends up to the remaining capacity; overflow is dropped and flagged.
    void Write(Stream stream, std::string_view data);

    // Returns the captured text (invalid UTF-8 replaced) and empties the buffer.
    // The truncation flag survives a drain.
    std::string Drain(Stream stream);

    bool Truncated(Stream stream) const;
    std::size_t Size(Stream stream) const;
    std::size_t Capacity() const { return capacity_; }

private:
    struct Buffer {
        std::string data;
        bool truncated = false;
    };

    Buffer& Select(Stream stream);
    const Buffer& Select(Stream stream) const;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    Buffer stdout_;
    Buffer stderr_;
};

}  // namespace hoya::sandbox
