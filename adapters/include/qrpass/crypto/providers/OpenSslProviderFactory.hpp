#ifndef INCLUDE_QRPASS_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_QRPASS_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "qrpass/crypto/ICryptoProvider.hpp"
#include <memory>

namespace qrpass::crypto::providers
{

[[nodiscard]] std::unique_ptr<qrpass::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace qrpass::crypto::providers

#endif // INCLUDE_QRPASS_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
