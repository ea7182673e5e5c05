#include "sandbox/capture_sink.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace hoya::sandbox {

CaptureSink::CaptureSink(std::size_t max_bytes_per_stream)
    : capacity_(max_bytes_per_stream) {}

void CaptureSink::Write(Stream stream, std::string_view data) {
    if (data.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& buffer = Select(stream);
    const auto used = std::min(buffer.data.size(), capacity_);
    const auto remaining = capacity_ - used;
    if (data.size() > remaining) {
        buffer.truncated = true;
        data = data.substr(0, remaining);
    }
    buffer.data.append(data.data(), data.size());
}

std::string CaptureSink::Drain(Stream stream) {
    std::string raw;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        raw.swap(Select(stream).data);
    }
    return hoya::utils::SanitizeUtf8(raw);
}

bool CaptureSink::Truncated(Stream stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Select(stream).truncated;
}

std::size_t CaptureSink::Size(Stream stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Select(stream).data.size();
}

CaptureSink::Buffer& CaptureSink::Select(Stream stream) {
    return stream == Stream::kStderr ? stderr_ : stdout_;
}

const CaptureSink::Buffer& CaptureSink::Select(Stream stream) const {
    return stream == Stream::kStderr ? stderr_ : stdout_;
}

}  // namespace hoya::sandbox
