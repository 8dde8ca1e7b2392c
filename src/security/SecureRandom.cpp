#include "qrpass/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <limits>
#include <vector>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace qrpass::security
{
bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    if (out.empty())
    {
        return true;
    }
    std::uint8_t* outPtr{ out.data() };
    std::size_t remaining{ out.size() };
#if defined(_WIN32)

    constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    while (remaining > 0U)
    {
        const std::size_t chunk{ (remaining > kMaxChunk) ? kMaxChunk : remaining };

        const NTSTATUS status{ BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(outPtr), static_cast<ULONG>(chunk),
                                               BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
        if (!BCRYPT_SUCCESS(status))
        {
            return false;
        }

        remaining -= chunk;
        outPtr += chunk;
    }

#elif defined(__linux__)
    while (remaining > 0)
    {
        const ssize_t bytesReceived{ ::getrandom(outPtr, remaining, 0) };

        if (bytesReceived > 0)
        {
            const std::size_t received{ static_cast<std::size_t>(bytesReceived) };
            if (received > remaining)
            {
                return false;
            }
            remaining -= received;
            outPtr += received;
            continue;
        }

        if (bytesReceived < 0 && errno == EINTR)
        {
            continue;
        }

        return false;
    }

#endif
    return true;
}

std::string secureRandomToken(std::size_t byteCount)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::vector<std::uint8_t> rnd(byteCount);
    if (!secureRandomFill(std::span<std::uint8_t>{ rnd }))
    {
        return {};
    }

    std::string out{};
    out.reserve(byteCount * 2U);
    for (const std::uint8_t b : rnd)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

} // namespace qrpass::security
