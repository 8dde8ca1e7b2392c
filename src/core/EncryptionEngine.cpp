#include "qrpass/core/EncryptionEngine.hpp"
#include <span>
#include <stdexcept>

namespace qrpass::core
{

EncryptionEngine::EncryptionEngine(qrpass::crypto::ICryptoProvider& crypto) noexcept : m_crypto{ &crypto }
{
}

CiphertextEnvelope EncryptionEngine::encrypt(std::string_view plainText, const SymmetricKey& key)
{
    CiphertextEnvelope envelope{};
    if (!m_crypto->randomBytes(envelope.iv))
    {
        throw std::runtime_error("secure random generator failed");
    }

    const std::span<const char> chars{ plainText.data(), plainText.size() };
    envelope.cipherText = m_crypto->aes256CbcEncrypt(key.bytes(), envelope.iv, std::as_bytes(chars));
    return envelope;
}

std::optional<std::string> EncryptionEngine::decrypt(const CiphertextEnvelope& envelope, const SymmetricKey& key)
{
    auto plain{ m_crypto->aes256CbcDecrypt(key.bytes(), envelope.iv, envelope.cipherText) };
    if (!plain.has_value())
    {
        return std::nullopt;
    }

    std::string out{ qrpass::security::asStringView(*plain) };
    qrpass::security::secureRelease(*plain);
    return out;
}

} // namespace qrpass::core
