#ifndef INCLUDE_QRPASS_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_QRPASS_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace qrpass::security
{
// Constant-time for equal-length inputs.
[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return (diff == 0);
}

} // namespace qrpass::security

#endif // INCLUDE_QRPASS_SECURITY_SECUREEQUALS_HPP
