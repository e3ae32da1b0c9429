#ifndef INCLUDE_DEVAUTH_CRYPTO_KEYCUSTODYERRORS_HPP
#define INCLUDE_DEVAUTH_CRYPTO_KEYCUSTODYERRORS_HPP

#include <stdexcept>

namespace devauth::crypto
{

class KeyStoreUnavailable : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class KeyGenerationFailed final : public KeyStoreUnavailable
{
public:
    using KeyStoreUnavailable::KeyStoreUnavailable;
};

class KeyNotFound final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace devauth::crypto

#endif // INCLUDE_DEVAUTH_CRYPTO_KEYCUSTODYERRORS_HPP
