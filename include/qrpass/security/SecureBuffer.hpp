#ifndef INCLUDE_QRPASS_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_QRPASS_SECURITY_SECUREBUFFER_HPP

#include "qrpass/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace qrpass::security
{
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline std::string_view asStringView(const SecureBuffer& b) noexcept
{
    if (b.empty())
    {
        return {};
    }
    return std::string_view{ reinterpret_cast<const char*>(b.data()), b.size() };
}

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::string_view s)
{
    SecureBuffer out{};
    out.reserve(s.size());
    for (const char c : s)
    {
        out.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(c)));
    }
    return out;
}

inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
    SecureBuffer temp;
    b.swap(temp);
}

} // namespace qrpass::security

#endif // INCLUDE_QRPASS_SECURITY_SECUREBUFFER_HPP
