#include "AtomicFile.hpp"
#include "qrpass/security/SecureRandom.hpp"
#include <cerrno>
#include <fstream>
#include <new>
#include <string>
#include <string_view>
#include <utility>

namespace qrpass::core::detail
{
namespace
{

constexpr std::size_t g_kTempTokenBytes{ 8U };

[[nodiscard]] std::filesystem::path tempSiblingFor(const std::filesystem::path& target,
                                                   std::string_view tag = ".tmp-")
{
    const std::string token{ qrpass::security::secureRandomToken(g_kTempTokenBytes) };
    if (token.empty())
    {
        return {};
    }
    std::filesystem::path tmp{ target };
    tmp += tag;
    tmp += token;
    return tmp;
}

[[nodiscard]] std::error_code lastErrnoOr(std::errc fallback) noexcept
{
    const int err{ errno };
    if (err != 0)
    {
        return std::error_code{ err, std::generic_category() };
    }
    return std::make_error_code(fallback);
}

[[nodiscard]] std::error_code writeWholeFile(const std::filesystem::path& path, std::span<const std::byte> bytes)
{
    errno = 0;
    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    if (!out)
    {
        return lastErrnoOr(std::errc::io_error);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out)
    {
        return lastErrnoOr(std::errc::io_error);
    }
    out.close();
    if (out.fail())
    {
        return lastErrnoOr(std::errc::io_error);
    }
    return {};
}

[[nodiscard]] std::error_code applyMode(const std::filesystem::path& path, FileMode mode) noexcept
{
    std::error_code ec{};
#if !defined(_WIN32)
    if (mode == FileMode::OwnerOnly)
    {
        std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
    }
#else
    (void)path;
    (void)mode;
#endif
    return ec;
}

void removeQuietly(const std::filesystem::path& path) noexcept
{
    std::error_code ignored{};
    std::filesystem::remove(path, ignored);
}

} // namespace

std::error_code replaceFileAtomically(const std::filesystem::path& target, std::span<const std::byte> bytes,
                                      FileMode mode) noexcept
{
    try
    {
        const auto tmp{ tempSiblingFor(target) };
        if (tmp.empty())
        {
            return std::make_error_code(std::errc::io_error);
        }

        if (auto ec{ writeWholeFile(tmp, bytes) }; ec)
        {
            removeQuietly(tmp);
            return ec;
        }
        if (auto ec{ applyMode(tmp, mode) }; ec)
        {
            removeQuietly(tmp);
            return ec;
        }

        std::error_code ec{};
        std::filesystem::rename(tmp, target, ec);
        if (ec)
        {
            removeQuietly(tmp);
        }
        return ec;
    }
    catch (const std::bad_alloc&)
    {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

std::error_code createFileExclusively(const std::filesystem::path& target, std::span<const std::byte> bytes,
                                      FileMode mode) noexcept
{
    try
    {
        const auto tmp{ tempSiblingFor(target) };
        if (tmp.empty())
        {
            return std::make_error_code(std::errc::io_error);
        }

        if (auto ec{ writeWholeFile(tmp, bytes) }; ec)
        {
            removeQuietly(tmp);
            return ec;
        }
        if (auto ec{ applyMode(tmp, mode) }; ec)
        {
            removeQuietly(tmp);
            return ec;
        }

        // A hard link fails with EEXIST instead of replacing, so exactly one
        // concurrent creator wins and the file is complete when it appears.
        std::error_code ec{};
        std::filesystem::create_hard_link(tmp, target, ec);
        removeQuietly(tmp);
        return ec;
    }
    catch (const std::bad_alloc&)
    {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

std::error_code moveAside(const std::filesystem::path& target, std::filesystem::path& aside) noexcept
{
    try
    {
        auto candidate{ tempSiblingFor(target, ".old-") };
        if (candidate.empty())
        {
            return std::make_error_code(std::errc::io_error);
        }

        std::error_code ec{};
        std::filesystem::rename(target, candidate, ec);
        if (!ec)
        {
            aside = std::move(candidate);
        }
        return ec;
    }
    catch (const std::bad_alloc&)
    {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

} // namespace qrpass::core::detail
