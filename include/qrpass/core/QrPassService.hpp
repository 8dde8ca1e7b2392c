#ifndef INCLUDE_QRPASS_CORE_QRPASSSERVICE_HPP
#define INCLUDE_QRPASS_CORE_QRPASSSERVICE_HPP

#include "qrpass/core/AppSettings.hpp"
#include "qrpass/core/ArtifactWriter.hpp"
#include "qrpass/core/EmployeeRecord.hpp"
#include "qrpass/core/EncryptionEngine.hpp"
#include "qrpass/core/KeyStore.hpp"
#include "qrpass/core/PayloadCodec.hpp"
#include "qrpass/core/SettingsStore.hpp"
#include "qrpass/qr/QrImageEncoder.hpp"
#include "qrpass/qr/QrSymbol.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace qrpass::core
{

enum class GenerationStage : std::uint8_t
{
    Serialize,
    Encrypt,
    Encode,
};

[[nodiscard]] std::string_view describe(GenerationStage stage) noexcept;

struct GenerationError final
{
    GenerationStage stage{ GenerationStage::Serialize };
    std::string message;
};

template <class T> using GenerationResult = std::variant<T, GenerationError>;

struct QrArtifact final
{
    std::string employeeId;
    std::string envelopeText;
    qrpass::qr::QrSymbol symbol;
    qrpass::qr::RasterImage image;

    [[nodiscard]] int pixelSize() const noexcept
    {
        return image.pixelSize;
    }
};

// Called with true before a generation request starts and false once it ends,
// whatever the outcome.
using BusyCallback = std::function<void(bool)>;

struct GenerationOutcome final
{
    std::variant<QrArtifact, ValidationError, GenerationError> result;
    // Set only when auto-save was attempted.
    std::optional<ArtifactResult> autoSaved;

    [[nodiscard]] const QrArtifact* artifact() const noexcept
    {
        return std::get_if<QrArtifact>(&result);
    }
};

class QrPassService final
{
public:
    QrPassService(KeyStore& keys, SettingsStore& settings, EncryptionEngine& engine,
                  qrpass::qr::QrImageEncoder& encoder, ArtifactWriter& writer) noexcept;

    [[nodiscard]] ValidationResult<EmployeeRecord> validateInput(const EmployeeFields& fields) const;

    // serialize -> encrypt -> encode. Never throws; failures carry the stage they occurred in.
    [[nodiscard]] GenerationResult<QrArtifact> generateArtifact(const EmployeeRecord& record,
                                                                const AppSettings& settings);

    [[nodiscard]] ArtifactResult persistArtifact(const QrArtifact& artifact, const AppSettings& settings) const;

    // Validate, generate and, when auto-save is enabled, persist, using the current settings.
    [[nodiscard]] GenerationOutcome generate(const EmployeeFields& fields, const BusyCallback& busy = {});

    SettingsLoadReport loadSettings();
    [[nodiscard]] SettingsResult<AppSettings> saveSettings(const AppSettings& settings);
    [[nodiscard]] SettingsResult<AppSettings> resetSettings();
    [[nodiscard]] AppSettings currentSettings() const;

    [[nodiscard]] KeyStatus keyStatus() const;

private:
    KeyStore* m_keys{ nullptr };
    SettingsStore* m_settings{ nullptr };
    EncryptionEngine* m_engine{ nullptr };
    qrpass::qr::QrImageEncoder* m_encoder{ nullptr };
    ArtifactWriter* m_writer{ nullptr };
};

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_QRPASSSERVICE_HPP
