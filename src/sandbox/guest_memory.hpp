#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hoya::sandbox {

// Bounds-checked view over a guest's linear memory. Built fresh for every host
// call because memory.grow may move or resize the underlying buffer.
class GuestMemory {
public:
    GuestMemory(std::uint8_t* base, std::size_t size);

    bool Contains(std::uint32_t ptr, std::uint32_t len) const;

    // nullopt when [ptr, ptr + len) leaves the memory.
    std::optional<std::string_view> Read(std::uint32_t ptr, std::uint32_t len) const;

    // Copies bytes to ptr. Returns false, writing nothing, when out of bounds.
    bool Write(std::uint32_t ptr, std::string_view bytes);

    std::size_t Size() const { return size_; }

    // "ptr=16 len=70000 memory=65536", for error messages.
    std::string Describe(std::uint32_t ptr, std::uint32_t len) const;

private:
    std::uint8_t* base_;
    std::size_t size_;
};

}  // namespace hoya::sandbox
