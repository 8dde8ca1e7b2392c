#ifndef INCLUDE_QRPASS_CORE_ENCRYPTIONENGINE_HPP
#define INCLUDE_QRPASS_CORE_ENCRYPTIONENGINE_HPP

#include "qrpass/core/CiphertextEnvelope.hpp"
#include "qrpass/core/SymmetricKey.hpp"
#include "qrpass/crypto/ICryptoProvider.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace qrpass::core
{

class EncryptionEngine final
{
public:
    explicit EncryptionEngine(qrpass::crypto::ICryptoProvider& crypto) noexcept;

    // Fresh random IV on every call, so equal inputs never yield equal envelopes.
    // Throws std::runtime_error if the random generator fails.
    [[nodiscard]] CiphertextEnvelope encrypt(std::string_view plainText, const SymmetricKey& key);

    // Inverse of encrypt(). std::nullopt on a wrong key or damaged ciphertext.
    [[nodiscard]] std::optional<std::string> decrypt(const CiphertextEnvelope& envelope, const SymmetricKey& key);

private:
    qrpass::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_ENCRYPTIONENGINE_HPP
