#ifndef INCLUDE_QRPASS_CORE_PATHPROBE_HPP
#define INCLUDE_QRPASS_CORE_PATHPROBE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace qrpass::core
{

enum class PathError : std::uint8_t
{
    NotAbsolute,
    NotADirectory,
    NotWritable,
};

[[nodiscard]] std::string_view describe(PathError error) noexcept;

// Accepts `dir` only if it is absolute, an existing directory, and a file can be
// created and deleted inside it. The probe file never outlives the call.
[[nodiscard]] std::optional<PathError> probeWritableDirectory(const std::filesystem::path& dir) noexcept;

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_PATHPROBE_HPP
