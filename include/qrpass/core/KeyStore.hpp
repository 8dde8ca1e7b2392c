#ifndef INCLUDE_QRPASS_CORE_KEYSTORE_HPP
#define INCLUDE_QRPASS_CORE_KEYSTORE_HPP

#include "qrpass/core/SymmetricKey.hpp"
#include "qrpass/crypto/ICryptoProvider.hpp"
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace qrpass::core
{

enum class KeyOrigin : std::uint8_t
{
    Loaded,    // read from the key file
    Generated, // freshly generated and persisted
    Ephemeral, // freshly generated, persisting failed; valid for this process only
};

enum class KeyIoError : std::uint8_t
{
    ReadFailed,
    InvalidLength,
    WriteFailed,
};

// Outcome of the load-or-generate step. I/O errors are diagnostics, never fatal.
struct KeyStatus final
{
    KeyOrigin origin{ KeyOrigin::Ephemeral };
    std::optional<KeyIoError> readError;
    std::optional<KeyIoError> writeError;
    std::string detail;
};

[[nodiscard]] std::string_view describe(KeyOrigin origin) noexcept;
[[nodiscard]] std::string_view describe(KeyIoError error) noexcept;

class KeyStore final
{
public:
    KeyStore(qrpass::crypto::ICryptoProvider& crypto, std::filesystem::path keyFile);

    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;
    KeyStore(KeyStore&&) = delete;
    KeyStore& operator=(KeyStore&&) = delete;
    ~KeyStore() = default;

    // First call loads the key file (exactly 32 bytes) or generates and persists
    // a new key; every later call returns the same key. A read or write failure
    // falls back to an in-memory key and is reported through status().
    // Throws std::runtime_error only if the CSPRNG fails.
    [[nodiscard]] const SymmetricKey& getOrCreateKey();

    // Meaningful after the first getOrCreateKey().
    [[nodiscard]] KeyStatus status() const;

    [[nodiscard]] const std::filesystem::path& keyFile() const noexcept;

private:
    [[nodiscard]] SymmetricKey generateKey();
    [[nodiscard]] static std::optional<SymmetricKey> readKeyFile(const std::filesystem::path& path,
                                                                 KeyStatus& status);
    [[nodiscard]] std::optional<SymmetricKey> retireUnusableKeyFile() const;
    void persistNewKey(const SymmetricKey& key, KeyStatus& status, std::optional<SymmetricKey>& winner) const;

    qrpass::crypto::ICryptoProvider* m_crypto{ nullptr };
    std::filesystem::path m_keyFile;

    mutable std::mutex m_mutex;
    std::optional<SymmetricKey> m_key;
    KeyStatus m_status;
};

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_KEYSTORE_HPP
