#include "qrpass/core/QrPassService.hpp"
#include "Logging.hpp"
#include "qrpass/security/MemoryWiper.hpp"
#include <QString>
#include <exception>
#include <utility>

namespace qrpass::core
{
namespace
{

class BusyGuard final
{
public:
    explicit BusyGuard(const BusyCallback& busy) : m_busy{ busy }
    {
        if (m_busy)
        {
            m_busy(true);
        }
    }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;
    BusyGuard(BusyGuard&&) = delete;
    BusyGuard& operator=(BusyGuard&&) = delete;

    ~BusyGuard() noexcept
    {
        if (!m_busy)
        {
            return;
        }
        try
        {
            m_busy(false);
        }
        catch (const std::exception& e)
        {
            qCWarning(lcPipeline) << "busy callback failed:" << e.what();
        }
    }

private:
    const BusyCallback& m_busy;
};

[[nodiscard]] GenerationError stageError(GenerationStage stage, std::string_view detail)
{
    std::string message{ describe(stage) };
    message += ": ";
    message += detail;
    qCWarning(lcPipeline) << QString::fromStdString(message);
    return GenerationError{ stage, std::move(message) };
}

[[nodiscard]] qrpass::qr::RenderOptions renderOptionsFor(const AppSettings& settings)
{
    qrpass::qr::RenderOptions options{};
    options.pixelSize = pixelSize(settings.qrSize);
    options.foreground = settings.qrColor;
    options.background = settings.qrBgColor;
    options.quality = qualityValue(settings.imageQuality);
    return options;
}

} // namespace

std::string_view describe(GenerationStage stage) noexcept
{
    switch (stage)
    {
    case GenerationStage::Serialize:
        return "serialization failed";
    case GenerationStage::Encrypt:
        return "encryption failed";
    case GenerationStage::Encode:
        return "QR encoding failed";
    }
    return "generation failed";
}

QrPassService::QrPassService(KeyStore& keys, SettingsStore& settings, EncryptionEngine& engine,
                             qrpass::qr::QrImageEncoder& encoder, ArtifactWriter& writer) noexcept
    : m_keys{ &keys }, m_settings{ &settings }, m_engine{ &engine }, m_encoder{ &encoder }, m_writer{ &writer }
{
}

ValidationResult<EmployeeRecord> QrPassService::validateInput(const EmployeeFields& fields) const
{
    return PayloadCodec::validate(fields);
}

GenerationResult<QrArtifact> QrPassService::generateArtifact(const EmployeeRecord& record,
                                                             const AppSettings& settings)
{
    std::string plainText{};
    const qrpass::security::PlaintextWipe wipePlainText{ plainText };
    try
    {
        plainText = PayloadCodec::serialize(record);
    }
    catch (const std::exception& e)
    {
        return stageError(GenerationStage::Serialize, e.what());
    }

    std::string envelopeText{};
    try
    {
        const SymmetricKey& key{ m_keys->getOrCreateKey() };
        envelopeText = m_engine->encrypt(plainText, key).toText();
    }
    catch (const std::exception& e)
    {
        return stageError(GenerationStage::Encrypt, e.what());
    }
    qrpass::security::secureWipe(plainText);

    try
    {
        auto encoded{ m_encoder->encode(envelopeText, renderOptionsFor(settings)) };
        if (const auto* colorError{ std::get_if<qrpass::qr::ColorFormatError>(&encoded) })
        {
            return stageError(GenerationStage::Encode, qrpass::qr::describe(*colorError));
        }

        auto& qr{ std::get<qrpass::qr::EncodedQr>(encoded) };
        QrArtifact artifact{};
        artifact.employeeId = record.employeeId;
        artifact.envelopeText = std::move(envelopeText);
        artifact.symbol = std::move(qr.symbol);
        artifact.image = std::move(qr.image);
        qCInfo(lcPipeline) << "generated QR version" << artifact.symbol.version << "for employee"
                           << QString::fromStdString(artifact.employeeId);
        return artifact;
    }
    catch (const std::exception& e)
    {
        return stageError(GenerationStage::Encode, e.what());
    }
}

ArtifactResult QrPassService::persistArtifact(const QrArtifact& artifact, const AppSettings& settings) const
{
    return m_writer->write(artifact.image, settings.savePath, artifact.employeeId);
}

GenerationOutcome QrPassService::generate(const EmployeeFields& fields, const BusyCallback& busy)
{
    const BusyGuard guard{ busy };
    GenerationOutcome outcome{};

    auto validated{ validateInput(fields) };
    if (const auto* error{ std::get_if<ValidationError>(&validated) })
    {
        outcome.result = *error;
        return outcome;
    }

    const AppSettings settings{ m_settings->current() };
    auto generated{ generateArtifact(std::get<EmployeeRecord>(validated), settings) };
    if (auto* error{ std::get_if<GenerationError>(&generated) })
    {
        outcome.result = std::move(*error);
        return outcome;
    }

    outcome.result = std::move(std::get<QrArtifact>(generated));
    if (settings.autoSave)
    {
        outcome.autoSaved = persistArtifact(std::get<QrArtifact>(outcome.result), settings);
    }
    return outcome;
}

SettingsLoadReport QrPassService::loadSettings()
{
    return m_settings->load();
}

SettingsResult<AppSettings> QrPassService::saveSettings(const AppSettings& settings)
{
    return m_settings->save(settings);
}

SettingsResult<AppSettings> QrPassService::resetSettings()
{
    return m_settings->reset();
}

AppSettings QrPassService::currentSettings() const
{
    return m_settings->current();
}

KeyStatus QrPassService::keyStatus() const
{
    return m_keys->status();
}

} // namespace qrpass::core
