#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

#include "qrpass/security/MemoryWiper.hpp"

namespace
{

template <typename T>
concept CanSecureWipe = requires(T buffer) { qrpass::security::secureWipe(buffer); };

static_assert(CanSecureWipe<std::span<std::uint8_t>>);
static_assert(!CanSecureWipe<std::span<const std::uint8_t>>);

} // namespace

TEST(MemoryWiper, ZerosKeySizedByteArray)
{
    constexpr std::uint8_t nonZero{ 0x5AU };
    std::array<std::uint8_t, 32> key{};
    key.fill(nonZero);

    qrpass::security::secureWipe(std::span<std::uint8_t>{ key });

    for (const auto b : key)
    {
        EXPECT_EQ(b, 0U);
    }
}

TEST(MemoryWiper, StringOverloadClearsContents)
{
    std::string plain{ "الاسم: أحمد" };
    const char* storage{ plain.data() };
    const std::size_t oldSize{ plain.size() };

    qrpass::security::secureWipe(plain);

    EXPECT_TRUE(plain.empty());
    ASSERT_EQ(plain.data(), storage);
    for (std::size_t i{}; i < oldSize; ++i)
    {
        EXPECT_EQ(storage[i], '\0');
    }
}

TEST(MemoryWiper, PlaintextWipeClearsOnScopeExit)
{
    std::string plain{ "الرقم الوظيفي: 12345" };
    const char* storage{ plain.data() };
    const std::size_t oldSize{ plain.size() };
    {
        const qrpass::security::PlaintextWipe guard{ plain };
        EXPECT_EQ(plain.size(), oldSize);
    }

    EXPECT_TRUE(plain.empty());
    ASSERT_EQ(plain.data(), storage);
    for (std::size_t i{}; i < oldSize; ++i)
    {
        EXPECT_EQ(storage[i], '\0');
    }
}

TEST(MemoryWiper, PlaintextWipeRunsWhenScopeThrows)
{
    std::string plain{ "القسم: المالية" };
    EXPECT_THROW(
        {
            const qrpass::security::PlaintextWipe guard{ plain };
            throw std::runtime_error{ "encrypt failed" };
        },
        std::runtime_error);
    EXPECT_TRUE(plain.empty());
}

TEST(MemoryWiper, EmptyInputsAreNoOps)
{
    qrpass::security::secureWipe(std::span<std::byte>{});
    std::string empty{};
    qrpass::security::secureWipe(empty);
    EXPECT_TRUE(empty.empty());
}
