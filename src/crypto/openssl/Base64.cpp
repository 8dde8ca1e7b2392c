#include "qrpass/crypto/Base64.hpp"
#include <cstddef>
#include <limits>
#include <openssl/evp.h>
#include <stdexcept>

namespace qrpass::crypto
{
namespace
{

[[nodiscard]] bool isBase64AlphabetChar(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

// EVP_DecodeBlock tolerates surrounding whitespace and does not report padding,
// so the canonical form is checked here first and the pad count returned.
[[nodiscard]] std::optional<std::size_t> checkCanonical(std::string_view text) noexcept
{
    constexpr std::size_t kQuantum{ 4U };
    if (text.size() % kQuantum != 0U)
    {
        return std::nullopt;
    }

    std::size_t padding{};
    for (std::size_t i{}; i < text.size(); ++i)
    {
        const char c{ text[i] };
        if (c == '=')
        {
            const std::size_t fromEnd{ text.size() - i };
            if (fromEnd > 2U)
            {
                return std::nullopt;
            }
            ++padding;
            continue;
        }
        if (padding != 0U || !isBase64AlphabetChar(c))
        {
            return std::nullopt;
        }
    }
    return padding;
}

} // namespace

std::string base64Encode(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 4 * 3))
    {
        throw std::invalid_argument("base64Encode: input too large");
    }

    const std::size_t encodedLen{ 4U * ((bytes.size() + 2U) / 3U) };
    // EVP_EncodeBlock writes a trailing NUL.
    std::string out(encodedLen + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                       static_cast<int>(bytes.size())) };
    if (written < 0 || static_cast<std::size_t>(written) != encodedLen)
    {
        throw std::runtime_error("base64Encode: EVP_EncodeBlock failed");
    }
    out.resize(encodedLen);
    return out;
}

std::optional<std::vector<std::uint8_t>> base64Decode(std::string_view text)
{
    if (text.empty())
    {
        return std::vector<std::uint8_t>{};
    }
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        return std::nullopt;
    }

    const auto padding{ checkCanonical(text) };
    if (!padding)
    {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out(text.size() / 4U * 3U);
    const int decoded{ EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                       static_cast<int>(text.size())) };
    if (decoded < 0 || static_cast<std::size_t>(decoded) != out.size())
    {
        return std::nullopt;
    }
    out.resize(out.size() - *padding);
    return out;
}

} // namespace qrpass::crypto
