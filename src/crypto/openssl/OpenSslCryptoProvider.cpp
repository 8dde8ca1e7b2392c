#include "qrpass/crypto/providers/OpenSslProviderFactory.hpp"
#include "qrpass/security/SecureBuffer.hpp"
#include "qrpass/security/SecureRandom.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace qrpass::crypto::providers
{
namespace
{

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

class OpenSslCryptoProvider final : public qrpass::crypto::ICryptoProvider
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return qrpass::security::secureRandomFill(out);
    }

    [[nodiscard]] std::vector<std::uint8_t> aes256CbcEncrypt(std::span<const std::uint8_t> key,
                                                             const qrpass::crypto::AesIv& iv,
                                                             std::span<const std::byte> plainText) override
    {
        requireExactSize(key, qrpass::crypto::g_aesKeyBytes, "aes256CbcEncrypt: key");
        constexpr std::size_t kMaxInput{ static_cast<std::size_t>(std::numeric_limits<int>::max()) -
                                         qrpass::crypto::g_aesBlockBytes };
        if (plainText.size() > kMaxInput)
        {
            throw std::invalid_argument("aes256CbcEncrypt: plainText too large");
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aes256CbcEncrypt: EVP_CIPHER_CTX_new failed");
        }

        // Padding is enabled by default on EVP cipher contexts (PKCS#7).
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1)
        {
            throw std::runtime_error("aes256CbcEncrypt: EVP_EncryptInit_ex failed");
        }

        const std::size_t padded{ (plainText.size() / qrpass::crypto::g_aesBlockBytes + 1U) *
                                  qrpass::crypto::g_aesBlockBytes };
        std::vector<std::uint8_t> cipherText(padded);

        int outLen{ 0 };
        const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
        if (EVP_EncryptUpdate(ctx.get(), cipherText.data(), &outLen, ptPtr, static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("aes256CbcEncrypt: encrypt update failed");
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > cipherText.size())
        {
            throw std::runtime_error("aes256CbcEncrypt: invalid output length");
        }

        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), cipherText.data() + outLen, &finalLen) != 1)
        {
            throw std::runtime_error("aes256CbcEncrypt: encrypt final failed");
        }
        const std::size_t totalBytes{ static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) };
        if (finalLen < 0 || totalBytes != cipherText.size())
        {
            throw std::runtime_error("aes256CbcEncrypt: invalid output length");
        }

        return cipherText;
    }

    [[nodiscard]] std::optional<qrpass::security::SecureBuffer>
    aes256CbcDecrypt(std::span<const std::uint8_t> key, const qrpass::crypto::AesIv& iv,
                     std::span<const std::uint8_t> cipherText) override
    {
        requireExactSize(key, qrpass::crypto::g_aesKeyBytes, "aes256CbcDecrypt: key");
        if (cipherText.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("aes256CbcDecrypt: cipherText too large");
        }
        if (cipherText.empty() || (cipherText.size() % qrpass::crypto::g_aesBlockBytes) != 0U)
        {
            return std::nullopt;
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aes256CbcDecrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1)
        {
            throw std::runtime_error("aes256CbcDecrypt: EVP_DecryptInit_ex failed");
        }

        // EVP_DecryptUpdate may write up to one extra block.
        qrpass::security::SecureBuffer plainText{};
        plainText.resize(cipherText.size() + qrpass::crypto::g_aesBlockBytes);

        int outLen{ 0 };
        if (EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, cipherText.data(),
                              static_cast<int>(cipherText.size())) != 1)
        {
            qrpass::security::secureRelease(plainText);
            return std::nullopt;
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > plainText.size())
        {
            qrpass::security::secureRelease(plainText);
            return std::nullopt;
        }

        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), plainText.data() + outLen, &finalLen) != 1)
        {
            qrpass::security::secureRelease(plainText);
            return std::nullopt;
        }
        const std::size_t totalBytes{ static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) };
        if (finalLen < 0 || totalBytes > cipherText.size())
        {
            qrpass::security::secureRelease(plainText);
            return std::nullopt;
        }
        plainText.resize(totalBytes);

        return plainText;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<qrpass::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace qrpass::crypto::providers
