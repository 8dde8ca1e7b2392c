#ifndef INCLUDE_QRPASS_CORE_CIPHERTEXTENVELOPE_HPP
#define INCLUDE_QRPASS_CORE_CIPHERTEXTENVELOPE_HPP

#include "qrpass/crypto/ICryptoProvider.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qrpass::core
{

// IV plus AES-256-CBC ciphertext. Text form: "<base64 iv>:<base64 ciphertext>".
struct CiphertextEnvelope final
{
    static constexpr char g_separator{ ':' };

    qrpass::crypto::AesIv iv{};
    std::vector<std::uint8_t> cipherText;

    [[nodiscard]] std::string toText() const;

    // Rejects anything but exactly two canonical base64 fields, a 16-byte IV and
    // a non-empty whole number of cipher blocks.
    [[nodiscard]] static std::optional<CiphertextEnvelope> fromText(std::string_view text);

    friend bool operator==(const CiphertextEnvelope&, const CiphertextEnvelope&) = default;
};

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_CIPHERTEXTENVELOPE_HPP
