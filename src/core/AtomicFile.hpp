#ifndef QRPASS_CORE_ATOMICFILE_HPP
#define QRPASS_CORE_ATOMICFILE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <system_error>

namespace qrpass::core::detail
{

enum class FileMode : std::uint8_t
{
    Default,
    OwnerOnly,
};

// Writes `bytes` to a sibling temp file and renames it over `target`.
// Readers see either the old or the new content, never a partial file.
[[nodiscard]] std::error_code replaceFileAtomically(const std::filesystem::path& target,
                                                    std::span<const std::byte> bytes,
                                                    FileMode mode = FileMode::Default) noexcept;

// Publishes `bytes` at `target` only if nothing exists there yet. Returns
// std::errc::file_exists when another writer got there first.
[[nodiscard]] std::error_code createFileExclusively(const std::filesystem::path& target,
                                                    std::span<const std::byte> bytes,
                                                    FileMode mode = FileMode::Default) noexcept;

// Renames `target` to a unique sibling and reports the new name in `aside`.
// Of several callers racing on the same file exactly one succeeds; the others
// get std::errc::no_such_file_or_directory.
[[nodiscard]] std::error_code moveAside(const std::filesystem::path& target, std::filesystem::path& aside) noexcept;

} // namespace qrpass::core::detail

#endif // QRPASS_CORE_ATOMICFILE_HPP
