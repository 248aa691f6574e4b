#include "krbticket/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <gtest/gtest.h>
#include <limits>
#include <new>
#include <string>
#include <vector>

TEST(ZeroAllocator, VectorGrowsThroughReallocation)
{
    std::vector<char, krbticket::security::ZeroAllocator<char>> buffer{};
    for (char c{ 'a' }; c <= 'z'; ++c)
    {
        buffer.push_back(c);
    }
    buffer.resize(4096U, '.');

    ASSERT_EQ(buffer.size(), 4096U);
    EXPECT_EQ(buffer.front(), 'a');
    EXPECT_EQ(buffer[25], 'z');
    EXPECT_EQ(buffer.back(), '.');
}

TEST(ZeroAllocator, AllInstancesCompareEqual)
{
    const krbticket::security::ZeroAllocator<char> a{};
    const krbticket::security::ZeroAllocator<char> b{};
    const krbticket::security::ZeroAllocator<int> rebound{ a };

    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a == rebound);
    EXPECT_FALSE(a != b);
}

TEST(ZeroAllocator, AllocateZeroReturnsNull)
{
    krbticket::security::ZeroAllocator<int> alloc{};
    EXPECT_EQ(alloc.allocate(0U), nullptr);
}

TEST(ZeroAllocator, OversizedRequestThrows)
{
    krbticket::security::ZeroAllocator<std::uint64_t> alloc{};
    EXPECT_THROW({ [[maybe_unused]] auto* p{ alloc.allocate(std::numeric_limits<std::size_t>::max()) }; },
                 std::bad_array_new_length);
}

TEST(ZeroAllocator, DeallocateNullIsNoOp)
{
    krbticket::security::ZeroAllocator<int> alloc{};
    alloc.deallocate(nullptr, 8U);
    SUCCEED();
}

TEST(ZeroAllocator, HoldsNonTrivialElements)
{
    std::vector<std::string, krbticket::security::ZeroAllocator<std::string>> principals{};
    principals.emplace_back("alice@EXAMPLE.COM");
    principals.emplace_back("host/db01.example.com@EXAMPLE.COM");
    EXPECT_EQ(principals.size(), 2U);
}
