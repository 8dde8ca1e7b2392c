#include "qrpass/core/HexColor.hpp"
#include <algorithm>
#include <cstddef>

namespace qrpass::core
{
namespace
{

constexpr std::size_t g_kShortForm{ 4U };
constexpr std::size_t g_kLongForm{ 7U };

[[nodiscard]] std::optional<std::uint8_t> hexNibble(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

} // namespace

bool isValidHexColor(std::string_view text) noexcept
{
    if (text.size() != g_kShortForm && text.size() != g_kLongForm)
    {
        return false;
    }
    if (text.front() != '#')
    {
        return false;
    }
    const auto digits{ text.substr(1) };
    return std::all_of(digits.begin(), digits.end(), [](char c) { return hexNibble(c).has_value(); });
}

std::optional<Rgb> parseHexColor(std::string_view text) noexcept
{
    if (!isValidHexColor(text))
    {
        return std::nullopt;
    }

    constexpr std::uint8_t kNibbleShift{ 4U };
    const auto nibble{ [&](std::size_t i) { return *hexNibble(text[i]); } };

    if (text.size() == g_kShortForm)
    {
        const auto expand{ [&](std::size_t i) {
            const std::uint8_t n{ nibble(i) };
            return static_cast<std::uint8_t>((n << kNibbleShift) | n);
        } };
        return Rgb{ .red = expand(1), .green = expand(2), .blue = expand(3) };
    }

    const auto byteAt{ [&](std::size_t i) {
        return static_cast<std::uint8_t>((nibble(i) << kNibbleShift) | nibble(i + 1U));
    } };
    return Rgb{ .red = byteAt(1), .green = byteAt(3), .blue = byteAt(5) };
}

} // namespace qrpass::core
