#ifndef QRPASS_UI_CLI_COMMANDRUNNER_HPP
#define QRPASS_UI_CLI_COMMANDRUNNER_HPP

#include "qrpass/core/QrPassService.hpp"
#include "qrpass/crypto/ICryptoProvider.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace qrpass::ui::cli
{

inline constexpr int g_exitOk{ 0 };
inline constexpr int g_exitFailure{ 1 };
inline constexpr int g_exitUsage{ 2 };

inline constexpr const char* g_defaultKeyFile{ "encryption_key.bin" };
inline constexpr const char* g_defaultSettingsFile{ "settings.json" };

// One-shot command dispatcher: parses the arguments, wires the stores and the
// pipeline for the selected files and runs a single subcommand.
class CommandRunner final
{
public:
    CommandRunner(qrpass::crypto::ICryptoProvider& crypto, std::ostream& out);

    // `args` excludes the program name.
    [[nodiscard]] int run(const std::vector<std::string>& args);

private:
    struct GenerateArgs
    {
        qrpass::core::EmployeeFields fields;
        bool save{ false };
        bool preview{ false };
    };

    struct SettingsArgs
    {
        std::string savePath;
        std::string autoSave;
        std::string quality;
        std::string size;
        std::string color;
        std::string bgColor;
        std::string language;
    };

    int doGenerate(qrpass::core::QrPassService& service, const GenerateArgs& args);
    int doSettingsShow(qrpass::core::QrPassService& service);
    int doSettingsSet(qrpass::core::QrPassService& service, const SettingsArgs& args, bool anyGiven);
    int doSettingsReset(qrpass::core::QrPassService& service);
    int doKeyInfo(qrpass::core::KeyStore& keys);

    void printSettings(const qrpass::core::AppSettings& settings);
    void printPreview(const qrpass::qr::QrSymbol& symbol);
    void printKeyWarning(const qrpass::core::KeyStatus& status);

    qrpass::crypto::ICryptoProvider& m_crypto;
    std::ostream& m_out;
};

} // namespace qrpass::ui::cli

#endif // QRPASS_UI_CLI_COMMANDRUNNER_HPP
