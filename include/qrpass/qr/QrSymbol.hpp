#ifndef INCLUDE_QRPASS_QR_QRSYMBOL_HPP
#define INCLUDE_QRPASS_QR_QRSYMBOL_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace qrpass::qr
{

inline constexpr int g_minVersion{ 1 };
inline constexpr int g_maxVersion{ 40 };

// Square module matrix, row-major, 1 = dark.
struct QrSymbol final
{
    int version{};
    int width{};
    std::vector<std::uint8_t> modules;

    [[nodiscard]] bool isDark(int x, int y) const noexcept
    {
        return modules[(static_cast<std::size_t>(y) * static_cast<std::size_t>(width)) + static_cast<std::size_t>(x)] !=
               0U;
    }

    friend bool operator==(const QrSymbol&, const QrSymbol&) = default;
};

// Byte-mode symbol at error-correction level H, smallest version that fits.
// Throws std::length_error when the text exceeds version 40 capacity and
// std::runtime_error on any other encoder failure.
[[nodiscard]] QrSymbol encodeQrSymbol(std::string_view text);

} // namespace qrpass::qr

#endif // INCLUDE_QRPASS_QR_QRSYMBOL_HPP
