#include "qrpass/core/CiphertextEnvelope.hpp"
#include "qrpass/crypto/Base64.hpp"
#include <algorithm>

namespace qrpass::core
{

std::string CiphertextEnvelope::toText() const
{
    std::string out{ qrpass::crypto::base64Encode(iv) };
    out.push_back(g_separator);
    out += qrpass::crypto::base64Encode(cipherText);
    return out;
}

std::optional<CiphertextEnvelope> CiphertextEnvelope::fromText(std::string_view text)
{
    const auto pos{ text.find(g_separator) };
    if (pos == std::string_view::npos || text.find(g_separator, pos + 1U) != std::string_view::npos)
    {
        return std::nullopt;
    }

    const auto ivBytes{ qrpass::crypto::base64Decode(text.substr(0, pos)) };
    if (!ivBytes.has_value() || ivBytes->size() != qrpass::crypto::g_aesIvBytes)
    {
        return std::nullopt;
    }

    auto cipherBytes{ qrpass::crypto::base64Decode(text.substr(pos + 1U)) };
    if (!cipherBytes.has_value() || cipherBytes->empty() ||
        (cipherBytes->size() % qrpass::crypto::g_aesBlockBytes) != 0U)
    {
        return std::nullopt;
    }

    CiphertextEnvelope envelope{};
    std::copy(ivBytes->begin(), ivBytes->end(), envelope.iv.begin());
    envelope.cipherText = std::move(*cipherBytes);
    return envelope;
}

} // namespace qrpass::core
