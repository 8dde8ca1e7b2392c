#ifndef INCLUDE_QRPASS_SECURITY_SECURERANDOM_HPP
#define INCLUDE_QRPASS_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace qrpass::security
{

// Fills `out` from the OS CSPRNG. Returns false if the OS source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Lower-case hex token of `byteCount` random bytes; empty on CSPRNG failure.
[[nodiscard]] std::string secureRandomToken(std::size_t byteCount);

} // namespace qrpass::security

#endif // INCLUDE_QRPASS_SECURITY_SECURERANDOM_HPP
