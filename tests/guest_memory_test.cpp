#include "sandbox/guest_memory.hpp"

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

namespace hoya::sandbox {
namespace {

TEST(GuestMemoryTest, ReadsInsideBounds) {
    std::vector<std::uint8_t> buffer = {'h', 'e', 'l', 'l', 'o'};
    GuestMemory memory(buffer.data(), buffer.size());

    const auto all = memory.Read(0, 5);
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(*all, "hello");

    const auto tail = memory.Read(3, 2);
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(*tail, "lo");

    const auto empty = memory.Read(5, 0);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(GuestMemoryTest, RejectsOutOfBounds) {
    std::vector<std::uint8_t> buffer(16, 0);
    GuestMemory memory(buffer.data(), buffer.size());

    EXPECT_FALSE(memory.Read(10, 7).has_value());
    EXPECT_FALSE(memory.Read(17, 0).has_value());
    EXPECT_FALSE(memory.Contains(UINT32_MAX, 2));
    EXPECT_FALSE(memory.Contains(1, UINT32_MAX));
    EXPECT_TRUE(memory.Contains(0, 16));
}

TEST(GuestMemoryTest, WriteIsAllOrNothing) {
    std::vector<std::uint8_t> buffer(8, '.');
    GuestMemory memory(buffer.data(), buffer.size());

    EXPECT_TRUE(memory.Write(2, "abc"));
    EXPECT_EQ(std::string(buffer.begin(), buffer.end()), "..abc...");

    EXPECT_FALSE(memory.Write(6, "xyz"));
    EXPECT_EQ(std::string(buffer.begin(), buffer.end()), "..abc...");
}

TEST(GuestMemoryTest, DescribeNamesTheRange) {
    std::vector<std::uint8_t> buffer(32, 0);
    GuestMemory memory(buffer.data(), buffer.size());
    EXPECT_EQ(memory.Describe(16, 70000), "ptr=16 len=70000 memory=32");
}

}  // namespace
}  // namespace hoya::sandbox
