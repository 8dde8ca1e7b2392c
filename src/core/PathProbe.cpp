#include "qrpass/core/PathProbe.hpp"
#include "qrpass/security/SecureRandom.hpp"
#include <fstream>
#include <new>
#include <string>
#include <system_error>

namespace qrpass::core
{
namespace
{

constexpr std::size_t g_kProbeTokenBytes{ 8U };
constexpr std::string_view g_kProbePrefix{ ".qrpass-probe-" };

[[nodiscard]] bool createAndDeleteProbe(const std::filesystem::path& dir)
{
    const std::string token{ qrpass::security::secureRandomToken(g_kProbeTokenBytes) };
    if (token.empty())
    {
        return false;
    }
    const auto probe{ dir / (std::string{ g_kProbePrefix } + token) };

    {
        std::ofstream out{ probe, std::ios::binary | std::ios::trunc };
        if (!out)
        {
            return false;
        }
        out << "test";
        out.close();
        if (out.fail())
        {
            std::error_code ignored{};
            std::filesystem::remove(probe, ignored);
            return false;
        }
    }

    std::error_code ec{};
    return std::filesystem::remove(probe, ec) && !ec;
}

} // namespace

std::string_view describe(PathError error) noexcept
{
    switch (error)
    {
    case PathError::NotAbsolute:
        return "save path must be an absolute path";
    case PathError::NotADirectory:
        return "save path does not exist or is not a directory";
    case PathError::NotWritable:
        return "save path is not writable";
    }
    return "invalid save path";
}

std::optional<PathError> probeWritableDirectory(const std::filesystem::path& dir) noexcept
{
    if (dir.empty() || !dir.is_absolute())
    {
        return PathError::NotAbsolute;
    }

    std::error_code ec{};
    if (!std::filesystem::is_directory(dir, ec) || ec)
    {
        return PathError::NotADirectory;
    }

    try
    {
        if (!createAndDeleteProbe(dir))
        {
            return PathError::NotWritable;
        }
    }
    catch (const std::bad_alloc&)
    {
        return PathError::NotWritable;
    }
    return std::nullopt;
}

} // namespace qrpass::core
