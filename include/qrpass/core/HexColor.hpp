#ifndef INCLUDE_QRPASS_CORE_HEXCOLOR_HPP
#define INCLUDE_QRPASS_CORE_HEXCOLOR_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace qrpass::core
{

struct Rgb final
{
    std::uint8_t red{};
    std::uint8_t green{};
    std::uint8_t blue{};

    friend bool operator==(const Rgb&, const Rgb&) = default;
};

// Accepts exactly '#' followed by 3 or 6 hex digits (either case).
[[nodiscard]] bool isValidHexColor(std::string_view text) noexcept;

// "#abc" expands to "#aabbcc".
[[nodiscard]] std::optional<Rgb> parseHexColor(std::string_view text) noexcept;

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_HEXCOLOR_HPP
