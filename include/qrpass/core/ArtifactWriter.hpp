#ifndef INCLUDE_QRPASS_CORE_ARTIFACTWRITER_HPP
#define INCLUDE_QRPASS_CORE_ARTIFACTWRITER_HPP

#include "qrpass/qr/QrImageEncoder.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace qrpass::core
{

enum class ArtifactErrorKind : std::uint8_t
{
    InvalidPath,
    InvalidEmployeeId,
    PermissionDenied,
    DiskFull,
    IoFailure,
};

struct ArtifactError final
{
    ArtifactErrorKind kind{ ArtifactErrorKind::IoFailure };
    std::string message;
};

[[nodiscard]] std::string_view describe(ArtifactErrorKind kind) noexcept;
[[nodiscard]] ArtifactErrorKind classify(const std::error_code& ec) noexcept;

using ArtifactResult = std::variant<std::filesystem::path, ArtifactError>;

class ArtifactWriter final
{
public:
    // "qr_code_<employeeId>.png"
    [[nodiscard]] static std::string fileNameFor(std::string_view employeeId);

    // Creates `directory` (recursively) when missing and atomically replaces any
    // previous image for the same employee. Returns the written path.
    [[nodiscard]] ArtifactResult write(const qrpass::qr::RasterImage& image, const std::filesystem::path& directory,
                                       std::string_view employeeId) const;
};

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_ARTIFACTWRITER_HPP
