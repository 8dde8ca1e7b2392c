#ifndef INCLUDE_QRPASS_CRYPTO_BASE64_HPP
#define INCLUDE_QRPASS_CRYPTO_BASE64_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qrpass::crypto
{

// Standard alphabet (RFC 4648), '=' padded, no line breaks.
[[nodiscard]] std::string base64Encode(std::span<const std::uint8_t> bytes);

// Rejects anything that is not canonical padded base64 (bad length, foreign characters, misplaced '=').
[[nodiscard]] std::optional<std::vector<std::uint8_t>> base64Decode(std::string_view text);

} // namespace qrpass::crypto

#endif // INCLUDE_QRPASS_CRYPTO_BASE64_HPP
