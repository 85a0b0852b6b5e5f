#ifndef INCLUDE_CREDHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_CREDHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "credhash/crypto/ICryptoProvider.hpp"
#include <memory>

namespace credhash::crypto::providers
{

[[nodiscard]] std::unique_ptr<credhash::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace credhash::crypto::providers

#endif // INCLUDE_CREDHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
