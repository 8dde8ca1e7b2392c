#include "qrpass/core/KeyStore.hpp"
#include "AtomicFile.hpp"
#include "Logging.hpp"
#include <QString>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace qrpass::core
{
namespace
{

[[nodiscard]] QString toQString(const std::filesystem::path& path)
{
    return QString::fromStdString(path.string());
}

} // namespace

std::string_view describe(KeyOrigin origin) noexcept
{
    switch (origin)
    {
    case KeyOrigin::Loaded:
        return "loaded from key file";
    case KeyOrigin::Generated:
        return "generated and saved";
    case KeyOrigin::Ephemeral:
        return "generated for this session only (not saved)";
    }
    return "unknown";
}

std::string_view describe(KeyIoError error) noexcept
{
    switch (error)
    {
    case KeyIoError::ReadFailed:
        return "key file could not be read";
    case KeyIoError::InvalidLength:
        return "key file does not hold exactly 32 bytes";
    case KeyIoError::WriteFailed:
        return "key file could not be written";
    }
    return "key file error";
}

KeyStore::KeyStore(qrpass::crypto::ICryptoProvider& crypto, std::filesystem::path keyFile)
    : m_crypto{ &crypto }, m_keyFile{ std::move(keyFile) }
{
}

const std::filesystem::path& KeyStore::keyFile() const noexcept
{
    return m_keyFile;
}

KeyStatus KeyStore::status() const
{
    const std::scoped_lock lock{ m_mutex };
    return m_status;
}

SymmetricKey KeyStore::generateKey()
{
    qrpass::security::SecureBuffer bytes(SymmetricKey::g_sizeBytes);
    if (!m_crypto->randomBytes(std::span<std::uint8_t>{ bytes }))
    {
        qCCritical(lcKeyStore) << "random generator failed while creating the encryption key";
        throw std::runtime_error("secure random generator failed");
    }
    return SymmetricKey{ std::move(bytes) };
}

std::optional<SymmetricKey> KeyStore::readKeyFile(const std::filesystem::path& path, KeyStatus& status)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        status.readError = KeyIoError::ReadFailed;
        return std::nullopt;
    }

    // One byte beyond the key size is enough to tell an oversized file apart.
    qrpass::security::SecureBuffer bytes(SymmetricKey::g_sizeBytes + 1U);
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (in.bad())
    {
        qrpass::security::secureRelease(bytes);
        status.readError = KeyIoError::ReadFailed;
        return std::nullopt;
    }

    const auto got{ static_cast<std::size_t>(in.gcount()) };
    if (got != SymmetricKey::g_sizeBytes)
    {
        qrpass::security::secureRelease(bytes);
        status.readError = KeyIoError::InvalidLength;
        return std::nullopt;
    }

    qrpass::security::secureWipe(std::span<std::uint8_t>{ bytes }.subspan(got));
    bytes.resize(got);
    return SymmetricKey{ std::move(bytes) };
}

std::optional<SymmetricKey> KeyStore::retireUnusableKeyFile() const
{
    std::error_code ec{};
    if (!std::filesystem::is_regular_file(m_keyFile, ec))
    {
        return std::nullopt;
    }

    std::filesystem::path aside{};
    if (const std::error_code moveError{ detail::moveAside(m_keyFile, aside) })
    {
        // Already moved by a concurrent repair, or not movable at all. Either way
        // the exclusive create that follows decides the outcome.
        qCDebug(lcKeyStore) << "could not move key file aside:" << QString::fromStdString(moveError.message());
        return std::nullopt;
    }

    // Between our read and the move another store may have published a good key.
    KeyStatus asideStatus{};
    if (readKeyFile(aside, asideStatus).has_value())
    {
        std::error_code linkError{};
        std::filesystem::create_hard_link(aside, m_keyFile, linkError);
        if (linkError)
        {
            qCDebug(lcKeyStore) << "could not restore published key:" << QString::fromStdString(linkError.message());
        }
        std::filesystem::remove(aside, ec);

        KeyStatus restoredStatus{};
        return readKeyFile(m_keyFile, restoredStatus);
    }

    std::filesystem::remove(aside, ec);
    return std::nullopt;
}

void KeyStore::persistNewKey(const SymmetricKey& key, KeyStatus& status, std::optional<SymmetricKey>& winner) const
{
    const auto raw{ std::as_bytes(key.bytes()) };
    const std::error_code ec{ detail::createFileExclusively(m_keyFile, raw, detail::FileMode::OwnerOnly) };
    if (!ec)
    {
        status.origin = KeyOrigin::Generated;
        return;
    }

    if (ec == std::errc::file_exists)
    {
        // Another process published its key first; use that one.
        KeyStatus winnerStatus{};
        winner = readKeyFile(m_keyFile, winnerStatus);
        if (winner.has_value())
        {
            status.origin = KeyOrigin::Loaded;
            return;
        }
        status.readError = winnerStatus.readError;
    }

    status.origin = KeyOrigin::Ephemeral;
    status.writeError = KeyIoError::WriteFailed;
    status.detail = ec.message();
}

const SymmetricKey& KeyStore::getOrCreateKey()
{
    const std::scoped_lock lock{ m_mutex };
    if (m_key.has_value())
    {
        return *m_key;
    }

    KeyStatus status{};
    std::error_code existsError{};
    std::optional<SymmetricKey> fresh{};

    if (std::filesystem::exists(m_keyFile, existsError))
    {
        auto loaded{ readKeyFile(m_keyFile, status) };
        if (loaded.has_value())
        {
            status.origin = KeyOrigin::Loaded;
            qCDebug(lcKeyStore) << "loaded encryption key from" << toQString(m_keyFile);
            m_key = std::move(loaded);
            m_status = std::move(status);
            return *m_key;
        }
        qCWarning(lcKeyStore) << "discarding unusable key file" << toQString(m_keyFile) << ":"
                              << describe(*status.readError).data();

        // Generate before touching the file so a CSPRNG failure leaves it in place.
        fresh.emplace(generateKey());
        if (auto published{ retireUnusableKeyFile() })
        {
            qCInfo(lcKeyStore) << "key file was repaired concurrently, using" << toQString(m_keyFile);
            status.origin = KeyOrigin::Loaded;
            m_key = std::move(published);
            m_status = std::move(status);
            return *m_key;
        }
    }

    if (!fresh.has_value())
    {
        fresh.emplace(generateKey());
    }
    std::optional<SymmetricKey> winner{};
    persistNewKey(*fresh, status, winner);

    if (winner.has_value())
    {
        qCInfo(lcKeyStore) << "key file appeared concurrently, using" << toQString(m_keyFile);
        m_key = std::move(winner);
    }
    else
    {
        if (status.origin == KeyOrigin::Ephemeral)
        {
            qCWarning(lcKeyStore) << "could not save encryption key to" << toQString(m_keyFile) << ":"
                                  << QString::fromStdString(status.detail)
                                  << "; codes generated in this session cannot be decrypted later";
        }
        else
        {
            qCInfo(lcKeyStore) << "generated new encryption key at" << toQString(m_keyFile);
        }
        m_key = std::move(fresh);
    }

    m_status = std::move(status);
    return *m_key;
}

} // namespace qrpass::core
