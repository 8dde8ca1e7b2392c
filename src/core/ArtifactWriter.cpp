#include "qrpass/core/ArtifactWriter.hpp"
#include "AtomicFile.hpp"
#include "Logging.hpp"
#include "qrpass/core/PayloadCodec.hpp"
#include <QString>
#include <span>
#include <string>
#include <utility>

namespace qrpass::core
{
namespace
{

constexpr std::string_view g_kFilePrefix{ "qr_code_" };
constexpr std::string_view g_kFileExtension{ ".png" };

[[nodiscard]] ArtifactError makeError(ArtifactErrorKind kind, std::string detail)
{
    std::string message{ describe(kind) };
    if (!detail.empty())
    {
        message += ": ";
        message += detail;
    }
    return ArtifactError{ kind, std::move(message) };
}

// File names are UTF-8 on every platform; Arabic-Indic ids stay intact on Windows too.
[[nodiscard]] std::filesystem::path utf8FileName(const std::string& name)
{
    return std::filesystem::path{ std::u8string{ name.begin(), name.end() } };
}

[[nodiscard]] QString displayPath(const std::filesystem::path& path)
{
    return QString::fromStdU16String(path.u16string());
}

} // namespace

std::string_view describe(ArtifactErrorKind kind) noexcept
{
    switch (kind)
    {
    case ArtifactErrorKind::InvalidPath:
        return "invalid save path";
    case ArtifactErrorKind::InvalidEmployeeId:
        return "employee id must contain digits only";
    case ArtifactErrorKind::PermissionDenied:
        return "permission denied";
    case ArtifactErrorKind::DiskFull:
        return "disk full";
    case ArtifactErrorKind::IoFailure:
        return "I/O error";
    }
    return "I/O error";
}

ArtifactErrorKind classify(const std::error_code& ec) noexcept
{
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system)
    {
        return ArtifactErrorKind::PermissionDenied;
    }
    if (ec == std::errc::no_space_on_device || ec == std::errc::file_too_large)
    {
        return ArtifactErrorKind::DiskFull;
    }
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory ||
        ec == std::errc::is_a_directory || ec == std::errc::filename_too_long || ec == std::errc::invalid_argument ||
        ec == std::errc::file_exists)
    {
        return ArtifactErrorKind::InvalidPath;
    }
    return ArtifactErrorKind::IoFailure;
}

std::string ArtifactWriter::fileNameFor(std::string_view employeeId)
{
    std::string name{ g_kFilePrefix };
    name += employeeId;
    name += g_kFileExtension;
    return name;
}

ArtifactResult ArtifactWriter::write(const qrpass::qr::RasterImage& image, const std::filesystem::path& directory,
                                     std::string_view employeeId) const
{
    // The id becomes part of a file name; decimal digits only keeps it a plain name.
    if (!PayloadCodec::isValidEmployeeId(employeeId))
    {
        return makeError(ArtifactErrorKind::InvalidEmployeeId, {});
    }
    if (directory.empty() || !directory.is_absolute())
    {
        return makeError(ArtifactErrorKind::InvalidPath, "save path must be absolute");
    }

    std::error_code ec{};
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        qCWarning(lcArtifact) << "cannot create" << displayPath(directory) << ":"
                              << QString::fromStdString(ec.message());
        return makeError(classify(ec), ec.message());
    }

    const std::filesystem::path target{ directory / utf8FileName(fileNameFor(employeeId)) };
    const std::span<const std::uint8_t> png{ image.png };
    if (const std::error_code writeError{ detail::replaceFileAtomically(target, std::as_bytes(png)) })
    {
        qCWarning(lcArtifact) << "cannot write" << displayPath(target) << ":"
                              << QString::fromStdString(writeError.message());
        return makeError(classify(writeError), writeError.message());
    }

    qCInfo(lcArtifact) << "saved" << displayPath(target);
    return target;
}

} // namespace qrpass::core
