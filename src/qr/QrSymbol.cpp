#include "qrpass/qr/QrSymbol.hpp"
#include <cerrno>
#include <memory>
#include <qrencode.h>
#include <stdexcept>

namespace qrpass::qr
{
namespace
{

using QrCodePtr = std::unique_ptr<QRcode, decltype(&QRcode_free)>;

// Version 0 asks the encoder for the smallest version that fits.
constexpr int g_kAutoVersion{ 0 };

} // namespace

QrSymbol encodeQrSymbol(std::string_view text)
{
    if (text.empty())
    {
        throw std::invalid_argument("QR payload must not be empty");
    }

    errno = 0;
    const auto* data{ reinterpret_cast<const unsigned char*>(text.data()) };
    QrCodePtr code{ QRcode_encodeData(static_cast<int>(text.size()), data, g_kAutoVersion, QR_ECLEVEL_H),
                    &QRcode_free };
    if (!code)
    {
        if (errno == ERANGE)
        {
            throw std::length_error("payload exceeds QR capacity at error-correction level H");
        }
        throw std::runtime_error("QR encoder failed");
    }

    QrSymbol symbol{};
    symbol.version = code->version;
    symbol.width = code->width;
    const auto count{ static_cast<std::size_t>(code->width) * static_cast<std::size_t>(code->width) };
    symbol.modules.resize(count);
    for (std::size_t i{}; i < count; ++i)
    {
        symbol.modules[i] = static_cast<std::uint8_t>(code->data[i] & 1U);
    }
    return symbol;
}

} // namespace qrpass::qr
