#ifndef INCLUDE_QRPASS_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_QRPASS_CRYPTO_ICRYPTOPROVIDER_HPP

#include "qrpass/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace qrpass::crypto
{

constexpr std::size_t g_aesKeyBytes{ 32 };
constexpr std::size_t g_aesBlockBytes{ 16 };
constexpr std::size_t g_aesIvBytes{ g_aesBlockBytes };

using AesIv = std::array<std::uint8_t, g_aesIvBytes>;

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AES-256-CBC with PKCS#7 padding. The caller supplies the IV.
    // Contract violations (wrong key size, oversized input) throw std::invalid_argument.
    [[nodiscard]] virtual std::vector<std::uint8_t> aes256CbcEncrypt(std::span<const std::uint8_t> key,
                                                                     const AesIv& iv,
                                                                     std::span<const std::byte> plainText) = 0;

    // Returns std::nullopt when the ciphertext is not a whole number of blocks or the padding is invalid.
    [[nodiscard]] virtual std::optional<qrpass::security::SecureBuffer>
    aes256CbcDecrypt(std::span<const std::uint8_t> key, const AesIv& iv, std::span<const std::uint8_t> cipherText) = 0;
};

} // namespace qrpass::crypto

#endif // INCLUDE_QRPASS_CRYPTO_ICRYPTOPROVIDER_HPP
