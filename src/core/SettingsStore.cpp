#include "qrpass/core/SettingsStore.hpp"
#include "AtomicFile.hpp"
#include "Logging.hpp"
#include "qrpass/core/HexColor.hpp"
#include "qrpass/core/PathProbe.hpp"
#include <QByteArray>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>
#include <span>
#include <system_error>
#include <utility>

namespace qrpass::core
{
namespace
{

constexpr auto g_kKeySavePath{ "save_path" };
constexpr auto g_kKeyAutoSave{ "auto_save" };
constexpr auto g_kKeyImageQuality{ "image_quality" };
constexpr auto g_kKeyQrSize{ "qr_size" };
constexpr auto g_kKeyQrColor{ "qr_color" };
constexpr auto g_kKeyQrBgColor{ "qr_bg_color" };
constexpr auto g_kKeyLanguage{ "language" };

[[nodiscard]] QString toQString(std::string_view text)
{
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

[[nodiscard]] QJsonObject toJson(const AppSettings& settings)
{
    QJsonObject obj;
    obj.insert(g_kKeySavePath, QString::fromStdString(settings.savePath.string()));
    obj.insert(g_kKeyAutoSave, settings.autoSave);
    obj.insert(g_kKeyImageQuality, toQString(toLabel(settings.imageQuality)));
    obj.insert(g_kKeyQrSize, toQString(toLabel(settings.qrSize)));
    obj.insert(g_kKeyQrColor, QString::fromStdString(settings.qrColor));
    obj.insert(g_kKeyQrBgColor, QString::fromStdString(settings.qrBgColor));
    obj.insert(g_kKeyLanguage, QString::fromStdString(settings.language));
    return obj;
}

class Merger final
{
public:
    Merger(const QJsonObject& obj, SettingsLoadReport& report) : m_obj{ obj }, m_report{ report }
    {
    }

    // Returns the string under `key`, or nullopt when absent or not a string.
    [[nodiscard]] std::optional<std::string> text(const char* key)
    {
        const QJsonValue value{ m_obj.value(QLatin1String{ key }) };
        if (value.isUndefined())
        {
            return std::nullopt;
        }
        if (!value.isString())
        {
            reject(key, "expected a string");
            return std::nullopt;
        }
        return value.toString().toStdString();
    }

    void reject(const char* key, std::string_view reason)
    {
        std::string warning{ key };
        warning += ": ";
        warning += reason;
        warning += "; using default";
        qCWarning(lcSettings) << "ignoring settings value" << warning.c_str();
        m_report.warnings.push_back(std::move(warning));
    }

    void merge()
    {
        AppSettings& out{ m_report.settings };

        if (auto path{ text(g_kKeySavePath) })
        {
            const std::filesystem::path candidate{ *path };
            if (const auto err{ probeWritableDirectory(candidate) })
            {
                reject(g_kKeySavePath, describe(*err));
            }
            else
            {
                out.savePath = candidate;
            }
        }

        const QJsonValue autoSave{ m_obj.value(QLatin1String{ g_kKeyAutoSave }) };
        if (autoSave.isBool())
        {
            out.autoSave = autoSave.toBool();
        }
        else if (!autoSave.isUndefined())
        {
            reject(g_kKeyAutoSave, "expected true or false");
        }

        if (auto label{ text(g_kKeyImageQuality) })
        {
            if (const auto quality{ parseImageQuality(*label) })
            {
                out.imageQuality = *quality;
            }
            else
            {
                reject(g_kKeyImageQuality, "unknown quality label");
            }
        }

        if (auto label{ text(g_kKeyQrSize) })
        {
            if (const auto size{ parseQrSize(*label) })
            {
                out.qrSize = *size;
            }
            else
            {
                reject(g_kKeyQrSize, "unknown size label");
            }
        }

        mergeColor(g_kKeyQrColor, out.qrColor);
        mergeColor(g_kKeyQrBgColor, out.qrBgColor);

        if (auto tag{ text(g_kKeyLanguage) })
        {
            if (isSupportedLanguage(*tag))
            {
                out.language = std::move(*tag);
            }
            else
            {
                reject(g_kKeyLanguage, "unsupported language");
            }
        }
    }

private:
    void mergeColor(const char* key, std::string& target)
    {
        if (auto color{ text(key) })
        {
            if (isValidHexColor(*color))
            {
                target = std::move(*color);
            }
            else
            {
                reject(key, "not a hex color");
            }
        }
    }

    const QJsonObject& m_obj;
    SettingsLoadReport& m_report;
};

} // namespace

std::string_view describe(SettingsError error) noexcept
{
    switch (error)
    {
    case SettingsError::PathNotAbsolute:
        return "save path must be an absolute path";
    case SettingsError::PathNotADirectory:
        return "save path does not exist or is not a directory";
    case SettingsError::PathNotWritable:
        return "save path is not writable";
    case SettingsError::InvalidForegroundColor:
        return "QR color must be a hex color such as #000000";
    case SettingsError::InvalidBackgroundColor:
        return "QR background color must be a hex color such as #FFFFFF";
    case SettingsError::UnsupportedLanguage:
        return "language must be 'ar' or 'en'";
    case SettingsError::WriteFailed:
        return "settings file could not be written";
    }
    return "invalid settings";
}

SettingsStore::SettingsStore(std::filesystem::path settingsFile)
    : m_settingsFile{ std::move(settingsFile) }, m_current{ defaultSettings() }
{
}

const std::filesystem::path& SettingsStore::settingsFile() const noexcept
{
    return m_settingsFile;
}

AppSettings SettingsStore::current() const
{
    const std::scoped_lock lock{ m_mutex };
    return m_current;
}

std::optional<SettingsError> SettingsStore::validate(const AppSettings& settings)
{
    if (const auto pathError{ probeWritableDirectory(settings.savePath) })
    {
        switch (*pathError)
        {
        case PathError::NotAbsolute:
            return SettingsError::PathNotAbsolute;
        case PathError::NotADirectory:
            return SettingsError::PathNotADirectory;
        case PathError::NotWritable:
            return SettingsError::PathNotWritable;
        }
    }
    if (!isValidHexColor(settings.qrColor))
    {
        return SettingsError::InvalidForegroundColor;
    }
    if (!isValidHexColor(settings.qrBgColor))
    {
        return SettingsError::InvalidBackgroundColor;
    }
    if (!isSupportedLanguage(settings.language))
    {
        return SettingsError::UnsupportedLanguage;
    }
    return std::nullopt;
}

SettingsLoadReport SettingsStore::load()
{
    SettingsLoadReport report{};
    report.settings = defaultSettings();

    QFile file{ QString::fromStdString(m_settingsFile.string()) };
    if (!file.exists())
    {
        qCDebug(lcSettings) << "no settings file, using defaults";
    }
    else if (!file.open(QIODevice::ReadOnly))
    {
        report.warnings.emplace_back("settings file could not be read; using defaults");
        qCWarning(lcSettings) << "cannot read" << file.fileName() << ":" << file.errorString();
    }
    else
    {
        QJsonParseError parseError{};
        const QJsonDocument doc{ QJsonDocument::fromJson(file.readAll(), &parseError) };
        if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        {
            report.warnings.emplace_back("settings file is not a JSON object; using defaults");
            qCWarning(lcSettings) << "malformed settings file" << file.fileName() << ":" << parseError.errorString();
        }
        else
        {
            const QJsonObject obj{ doc.object() };
            Merger{ obj, report }.merge();
            report.loadedFromFile = true;
        }
    }

    const std::scoped_lock lock{ m_mutex };
    m_current = report.settings;
    return report;
}

std::optional<SettingsError> SettingsStore::write(const AppSettings& settings) const
{
    const QByteArray json{ QJsonDocument{ toJson(settings) }.toJson(QJsonDocument::Indented) };
    const std::span<const std::byte> bytes{ reinterpret_cast<const std::byte*>(json.constData()),
                                            static_cast<std::size_t>(json.size()) };
    if (const std::error_code ec{ detail::replaceFileAtomically(m_settingsFile, bytes) })
    {
        qCWarning(lcSettings) << "cannot write" << QString::fromStdString(m_settingsFile.string()) << ":"
                              << QString::fromStdString(ec.message());
        return SettingsError::WriteFailed;
    }
    return std::nullopt;
}

SettingsResult<AppSettings> SettingsStore::save(const AppSettings& settings)
{
    const std::scoped_lock lock{ m_mutex };
    if (const auto error{ validate(settings) })
    {
        qCInfo(lcSettings) << "settings rejected:" << describe(*error).data();
        return *error;
    }
    if (const auto error{ write(settings) })
    {
        return *error;
    }
    m_current = settings;
    qCInfo(lcSettings) << "settings saved";
    return m_current;
}

SettingsResult<AppSettings> SettingsStore::reset()
{
    const std::scoped_lock lock{ m_mutex };
    m_current = defaultSettings();
    if (const auto error{ write(m_current) })
    {
        return *error;
    }
    qCInfo(lcSettings) << "settings reset to defaults";
    return m_current;
}

} // namespace qrpass::core
