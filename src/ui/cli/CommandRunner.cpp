#include "CommandRunner.hpp"

#include "qrpass/core/ArtifactWriter.hpp"
#include "qrpass/core/EncryptionEngine.hpp"
#include "qrpass/core/KeyStore.hpp"
#include "qrpass/core/SettingsStore.hpp"
#include "qrpass/qr/QrImageEncoder.hpp"

#include <CLI/CLI.hpp>
#include <QLoggingCategory>
#include <exception>
#include <variant>

namespace qrpass::ui::cli
{
namespace
{

constexpr const char* g_kDarkModule{ "\xE2\x96\x88\xE2\x96\x88" };
constexpr const char* g_kLightModule{ "  " };
constexpr int g_kPreviewBorder{ 2 };

void printArtifactResult(std::ostream& out, const qrpass::core::ArtifactResult& result, int& rc)
{
    if (const auto* path{ std::get_if<std::filesystem::path>(&result) })
    {
        out << "saved: " << path->string() << "\n";
        return;
    }
    out << "Error: could not save image: " << std::get<qrpass::core::ArtifactError>(result).message << "\n";
    rc = g_exitFailure;
}

} // namespace

CommandRunner::CommandRunner(qrpass::crypto::ICryptoProvider& crypto, std::ostream& out)
    : m_crypto(crypto), m_out(out)
{
}

int CommandRunner::run(const std::vector<std::string>& args)
{
    CLI::App app{ "Encrypted employee QR code generator" };
    app.require_subcommand(1);

    std::string keyFile{ g_defaultKeyFile };
    std::string settingsFile{ g_defaultSettingsFile };
    bool verbose{ false };
    app.add_option("--key-file", keyFile, "Path of the 32-byte encryption key file")->capture_default_str();
    app.add_option("--settings-file", settingsFile, "Path of the JSON settings file")->capture_default_str();
    app.add_flag("-v,--verbose", verbose, "Log debug and info messages to stderr");

    // GENERATE
    GenerateArgs gen{};
    auto* subGenerate = app.add_subcommand("generate", "Encrypt an employee record into a QR code");
    subGenerate->add_option("--name", gen.fields.name, "Employee name")->required();
    subGenerate->add_option("--id", gen.fields.employeeId, "Employee id (digits only)")->required();
    subGenerate->add_option("--department", gen.fields.department, "Department")->required();
    subGenerate->add_option("--notes", gen.fields.notes, "Additional information");
    subGenerate->add_flag("--save", gen.save, "Write the PNG to the configured save path");
    subGenerate->add_flag("--preview", gen.preview, "Print the symbol to the terminal");

    // SETTINGS
    auto* subSettings = app.add_subcommand("settings", "Show or change persisted settings");
    subSettings->require_subcommand(1);
    auto* subShow = subSettings->add_subcommand("show", "Print the current settings");
    auto* subReset = subSettings->add_subcommand("reset", "Restore and save the default settings");

    SettingsArgs set{};
    auto* subSet = subSettings->add_subcommand("set", "Validate and save new settings");
    const std::vector<CLI::Option*> setOptions{
        subSet->add_option("--save-path", set.savePath, "Absolute, writable directory for PNG files"),
        subSet->add_option("--auto-save", set.autoSave, "Save every generated code")
            ->check(CLI::IsMember({ "on", "off" })),
        subSet->add_option("--quality", set.quality, "very_high | high | medium | low"),
        subSet->add_option("--size", set.size, "small | medium | large | extra_large"),
        subSet->add_option("--color", set.color, "Foreground hex color, e.g. #000000"),
        subSet->add_option("--bg-color", set.bgColor, "Background hex color, e.g. #FFFFFF"),
        subSet->add_option("--language", set.language, "ar | en"),
    };

    // KEY
    auto* subKey = app.add_subcommand("key", "Inspect the encryption key");
    subKey->require_subcommand(1);
    auto* subKeyInfo = subKey->add_subcommand("info", "Show where the key came from");

    try
    {
        std::vector<const char*> argv;
        argv.reserve(args.size() + 1U);
        argv.push_back("qrpass-cli");
        for (const auto& arg : args)
        {
            argv.push_back(arg.c_str());
        }
        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
        return g_exitOk;
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
        return g_exitUsage;
    }

    if (verbose)
    {
        QLoggingCategory::setFilterRules(QStringLiteral("qrpass.*=true"));
    }

    try
    {
        qrpass::core::KeyStore keys{ m_crypto, keyFile };
        qrpass::core::SettingsStore settings{ settingsFile };
        qrpass::core::EncryptionEngine engine{ m_crypto };
        qrpass::qr::QrImageEncoder encoder{};
        qrpass::core::ArtifactWriter writer{};
        qrpass::core::QrPassService service{ keys, settings, engine, encoder, writer };

        const auto report{ service.loadSettings() };
        for (const auto& warning : report.warnings)
        {
            m_out << "warning: " << warning << "\n";
        }

        if (subGenerate->parsed())
        {
            return doGenerate(service, gen);
        }
        if (subShow->parsed())
        {
            return doSettingsShow(service);
        }
        if (subSet->parsed())
        {
            bool anyGiven{ false };
            for (const auto* opt : setOptions)
            {
                anyGiven = anyGiven || (opt->count() > 0U);
            }
            return doSettingsSet(service, set, anyGiven);
        }
        if (subReset->parsed())
        {
            return doSettingsReset(service);
        }
        if (subKeyInfo->parsed())
        {
            return doKeyInfo(keys);
        }
    }
    catch (const std::exception& e)
    {
        m_out << "Error: " << e.what() << "\n";
        return g_exitFailure;
    }

    m_out << app.help();
    return g_exitUsage;
}

int CommandRunner::doGenerate(qrpass::core::QrPassService& service, const GenerateArgs& args)
{
    const auto outcome{ service.generate(args.fields) };
    if (const auto* invalid{ std::get_if<qrpass::core::ValidationError>(&outcome.result) })
    {
        m_out << "Error: " << qrpass::core::describe(*invalid) << "\n";
        return g_exitFailure;
    }
    if (const auto* failed{ std::get_if<qrpass::core::GenerationError>(&outcome.result) })
    {
        m_out << "Error: " << failed->message << "\n";
        return g_exitFailure;
    }

    const auto& artifact{ *outcome.artifact() };
    m_out << "envelope: " << artifact.envelopeText << "\n";
    m_out << "qr version: " << artifact.symbol.version << " (" << artifact.symbol.width << "x"
          << artifact.symbol.width << " modules, " << artifact.pixelSize() << "x" << artifact.pixelSize() << " px)\n";
    if (args.preview)
    {
        printPreview(artifact.symbol);
    }

    int rc{ g_exitOk };
    if (outcome.autoSaved.has_value())
    {
        printArtifactResult(m_out, *outcome.autoSaved, rc);
    }
    else if (args.save)
    {
        printArtifactResult(m_out, service.persistArtifact(artifact, service.currentSettings()), rc);
    }

    printKeyWarning(service.keyStatus());
    return rc;
}

int CommandRunner::doSettingsShow(qrpass::core::QrPassService& service)
{
    printSettings(service.currentSettings());
    return g_exitOk;
}

int CommandRunner::doSettingsSet(qrpass::core::QrPassService& service, const SettingsArgs& args, bool anyGiven)
{
    if (!anyGiven)
    {
        m_out << "Nothing to change.\n";
        printSettings(service.currentSettings());
        return g_exitOk;
    }

    qrpass::core::AppSettings next{ service.currentSettings() };
    if (!args.savePath.empty())
    {
        next.savePath = args.savePath;
    }
    if (!args.autoSave.empty())
    {
        next.autoSave = (args.autoSave == "on");
    }
    if (!args.quality.empty())
    {
        const auto quality{ qrpass::core::parseImageQuality(args.quality) };
        if (!quality.has_value())
        {
            m_out << "Error: unknown image quality '" << args.quality << "' (very_high, high, medium, low)\n";
            return g_exitFailure;
        }
        next.imageQuality = *quality;
    }
    if (!args.size.empty())
    {
        const auto size{ qrpass::core::parseQrSize(args.size) };
        if (!size.has_value())
        {
            m_out << "Error: unknown QR size '" << args.size << "' (small, medium, large, extra_large)\n";
            return g_exitFailure;
        }
        next.qrSize = *size;
    }
    if (!args.color.empty())
    {
        next.qrColor = args.color;
    }
    if (!args.bgColor.empty())
    {
        next.qrBgColor = args.bgColor;
    }
    if (!args.language.empty())
    {
        next.language = args.language;
    }

    const auto result{ service.saveSettings(next) };
    if (const auto* error{ std::get_if<qrpass::core::SettingsError>(&result) })
    {
        m_out << "Error: " << qrpass::core::describe(*error) << "\n";
        return g_exitFailure;
    }
    m_out << "Settings saved.\n";
    printSettings(std::get<qrpass::core::AppSettings>(result));
    return g_exitOk;
}

int CommandRunner::doSettingsReset(qrpass::core::QrPassService& service)
{
    const auto result{ service.resetSettings() };
    if (const auto* error{ std::get_if<qrpass::core::SettingsError>(&result) })
    {
        m_out << "Error: " << qrpass::core::describe(*error) << " (defaults remain active for this run)\n";
        return g_exitFailure;
    }
    m_out << "Settings reset to defaults.\n";
    printSettings(std::get<qrpass::core::AppSettings>(result));
    return g_exitOk;
}

int CommandRunner::doKeyInfo(qrpass::core::KeyStore& keys)
{
    static_cast<void>(keys.getOrCreateKey());
    const auto status{ keys.status() };

    m_out << "key file: " << keys.keyFile().string() << "\n";
    m_out << "origin: " << qrpass::core::describe(status.origin) << "\n";
    if (status.readError.has_value())
    {
        m_out << "read error: " << qrpass::core::describe(*status.readError) << "\n";
    }
    if (status.writeError.has_value())
    {
        m_out << "write error: " << qrpass::core::describe(*status.writeError);
        if (!status.detail.empty())
        {
            m_out << " (" << status.detail << ")";
        }
        m_out << "\n";
    }
    return g_exitOk;
}

void CommandRunner::printSettings(const qrpass::core::AppSettings& settings)
{
    using qrpass::core::pixelSize;
    using qrpass::core::qualityValue;
    using qrpass::core::toIdentifier;
    using qrpass::core::toLabel;

    m_out << "save_path: " << settings.savePath.string() << "\n";
    m_out << "auto_save: " << (settings.autoSave ? "on" : "off") << "\n";
    m_out << "image_quality: " << toLabel(settings.imageQuality) << " (" << toIdentifier(settings.imageQuality)
          << ", " << qualityValue(settings.imageQuality) << ")\n";
    m_out << "qr_size: " << toLabel(settings.qrSize) << " (" << toIdentifier(settings.qrSize) << ", "
          << pixelSize(settings.qrSize) << " px)\n";
    m_out << "qr_color: " << settings.qrColor << "\n";
    m_out << "qr_bg_color: " << settings.qrBgColor << "\n";
    m_out << "language: " << settings.language << "\n";
}

void CommandRunner::printPreview(const qrpass::qr::QrSymbol& symbol)
{
    for (int y{ -g_kPreviewBorder }; y < symbol.width + g_kPreviewBorder; ++y)
    {
        for (int x{ -g_kPreviewBorder }; x < symbol.width + g_kPreviewBorder; ++x)
        {
            const bool inside{ x >= 0 && y >= 0 && x < symbol.width && y < symbol.width };
            m_out << ((inside && symbol.isDark(x, y)) ? g_kDarkModule : g_kLightModule);
        }
        m_out << "\n";
    }
}

void CommandRunner::printKeyWarning(const qrpass::core::KeyStatus& status)
{
    if (status.origin != qrpass::core::KeyOrigin::Ephemeral)
    {
        return;
    }
    m_out << "warning: " << qrpass::core::describe(qrpass::core::KeyIoError::WriteFailed);
    if (!status.detail.empty())
    {
        m_out << " (" << status.detail << ")";
    }
    m_out << "; codes generated in this run cannot be decrypted after restart\n";
}

} // namespace qrpass::ui::cli
