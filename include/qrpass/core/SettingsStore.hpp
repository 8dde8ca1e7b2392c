#ifndef INCLUDE_QRPASS_CORE_SETTINGSSTORE_HPP
#define INCLUDE_QRPASS_CORE_SETTINGSSTORE_HPP

#include "qrpass/core/AppSettings.hpp"
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace qrpass::core
{

enum class SettingsError : std::uint8_t
{
    PathNotAbsolute,
    PathNotADirectory,
    PathNotWritable,
    InvalidForegroundColor,
    InvalidBackgroundColor,
    UnsupportedLanguage,
    WriteFailed,
};

[[nodiscard]] std::string_view describe(SettingsError error) noexcept;

template <typename T> using SettingsResult = std::variant<T, SettingsError>;

struct SettingsLoadReport final
{
    AppSettings settings;
    bool loadedFromFile{ false };
    // One entry per value that was ignored or fell back to its default.
    std::vector<std::string> warnings;
};

class SettingsStore final
{
public:
    explicit SettingsStore(std::filesystem::path settingsFile);

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;
    SettingsStore(SettingsStore&&) = delete;
    SettingsStore& operator=(SettingsStore&&) = delete;
    ~SettingsStore() = default;

    // Defaults overlaid with every valid value from the settings file. A missing
    // or unreadable file yields the defaults. Replaces the in-memory settings.
    SettingsLoadReport load();

    // Validates, then writes. Nothing is written and the in-memory settings stay
    // untouched unless every check passes and the write succeeds.
    [[nodiscard]] SettingsResult<AppSettings> save(const AppSettings& settings);

    // Restores the defaults in memory and writes them without validation.
    // WriteFailed is reported but the in-memory defaults remain in effect.
    [[nodiscard]] SettingsResult<AppSettings> reset();

    [[nodiscard]] AppSettings current() const;
    [[nodiscard]] const std::filesystem::path& settingsFile() const noexcept;

    // Pre-write gates in order: save path, foreground, background, language.
    [[nodiscard]] static std::optional<SettingsError> validate(const AppSettings& settings);

private:
    [[nodiscard]] std::optional<SettingsError> write(const AppSettings& settings) const;

    std::filesystem::path m_settingsFile;
    mutable std::mutex m_mutex;
    AppSettings m_current;
};

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_SETTINGSSTORE_HPP
