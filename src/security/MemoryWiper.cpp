#include "qrpass/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace qrpass::security
{
namespace
{

void zeroMemory(void* data, std::size_t size) noexcept
{
#if defined(_WIN32)
    ::SecureZeroMemory(data, size);
#else
    ::explicit_bzero(data, size);
#endif
}

} // namespace

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (!bytes.empty())
    {
        zeroMemory(bytes.data(), bytes.size());
    }
}

void secureWipe(std::string& text) noexcept
{
    if (text.empty())
    {
        return;
    }
    // Short strings live inside the object itself; data() covers both layouts.
    zeroMemory(text.data(), text.size());
    text.clear();
}
} // namespace qrpass::security
