#ifndef INCLUDE_QRPASS_CORE_SYMMETRICKEY_HPP
#define INCLUDE_QRPASS_CORE_SYMMETRICKEY_HPP

#include "qrpass/crypto/ICryptoProvider.hpp"
#include "qrpass/security/SecureBuffer.hpp"
#include "qrpass/security/SecureEquals.hpp"
#include <cstddef>
#include <utility>

namespace qrpass::core
{

class EncryptionEngine;
class KeyStore;

// Opaque 256-bit key. Only KeyStore creates one and only EncryptionEngine reads its bytes.
class SymmetricKey final
{
public:
    static constexpr std::size_t g_sizeBytes{ qrpass::crypto::g_aesKeyBytes };

    SymmetricKey(const SymmetricKey&) = delete;
    SymmetricKey& operator=(const SymmetricKey&) = delete;
    SymmetricKey(SymmetricKey&& other) noexcept : m_bytes{}
    {
        m_bytes.swap(other.m_bytes);
    }
    SymmetricKey& operator=(SymmetricKey&& other) noexcept
    {
        if (this == &other)
        {
            return *this;
        }
        qrpass::security::secureRelease(m_bytes);
        m_bytes.swap(other.m_bytes);
        return *this;
    }
    ~SymmetricKey() noexcept
    {
        qrpass::security::secureRelease(m_bytes);
    }

    [[nodiscard]] bool sameKeyAs(const SymmetricKey& other) const noexcept
    {
        return qrpass::security::secureEquals(qrpass::security::asSpan(m_bytes),
                                              qrpass::security::asSpan(other.m_bytes));
    }

private:
    friend class EncryptionEngine;
    friend class KeyStore;

    explicit SymmetricKey(qrpass::security::SecureBuffer bytes) noexcept : m_bytes(std::move(bytes))
    {
    }

    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept
    {
        return qrpass::security::asSpan(m_bytes);
    }

    qrpass::security::SecureBuffer m_bytes;
};

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_SYMMETRICKEY_HPP
