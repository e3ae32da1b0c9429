#ifndef INCLUDE_DEVAUTH_CRYPTO_PROVIDERS_OPENSSLKEYCUSTODYFACTORY_HPP
#define INCLUDE_DEVAUTH_CRYPTO_PROVIDERS_OPENSSLKEYCUSTODYFACTORY_HPP

#include "devauth/crypto/IKeyCustody.hpp"
#include "devauth/security/SecureBuffer.hpp"
#include <filesystem>
#include <memory>

namespace devauth::crypto::providers
{

// Software key custody: RSA keys are generated with OpenSSL and kept as PKCS#8 DER, sealed with
// `wrappingKey`, in the `signing_keys` table of `dbPath` (":memory:" allowed).
// Throws KeyStoreUnavailable if the store cannot be opened.
[[nodiscard]] std::unique_ptr<devauth::crypto::IKeyCustody>
makeOpenSslKeyCustody(const std::filesystem::path& dbPath, devauth::security::SecureBuffer wrappingKey);

} // namespace devauth::crypto::providers

#endif // INCLUDE_DEVAUTH_CRYPTO_PROVIDERS_OPENSSLKEYCUSTODYFACTORY_HPP
