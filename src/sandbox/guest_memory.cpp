#include "sandbox/guest_memory.hpp"

#include <cstring>

namespace hoya::sandbox {

GuestMemory::GuestMemory(std::uint8_t* base, std::size_t size)
    : base_(base), size_(base ? size : 0) {}

bool GuestMemory::Contains(std::uint32_t ptr, std::uint32_t len) const {
    const std::uint64_t end = static_cast<std::uint64_t>(ptr) + static_cast<std::uint64_t>(len);
    return end <= static_cast<std::uint64_t>(size_);
}

std::optional<std::string_view> GuestMemory::Read(std::uint32_t ptr, std::uint32_t len) const {
    if (!Contains(ptr, len)) {
        return std::nullopt;
    }
    if (len == 0) {
        return std::string_view();
    }
    return std::string_view(reinterpret_cast<const char*>(base_ + ptr), len);
}

bool GuestMemory::Write(std::uint32_t ptr, std::string_view bytes) {
    if (bytes.size() > UINT32_MAX || !Contains(ptr, static_cast<std::uint32_t>(bytes.size()))) {
        return false;
    }
    if (!bytes.empty()) {
        std::memcpy(base_ + ptr, bytes.data(), bytes.size());
    }
    return true;
}

std::string GuestMemory::Describe(std::uint32_t ptr, std::uint32_t len) const {
    return "ptr=" + std::to_string(ptr) + " len=" + std::to_string(len) +
           " memory=" + std::to_string(size_);
}

}  // namespace hoya::sandbox
