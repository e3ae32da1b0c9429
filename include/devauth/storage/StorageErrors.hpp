#ifndef INCLUDE_DEVAUTH_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_DEVAUTH_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace devauth::storage
{

class StorageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A stored record failed authentication (wrong device key or tampered row).
class CorruptRecord final : public StorageError
{
public:
    using StorageError::StorageError;
};

} // namespace devauth::storage

#endif // INCLUDE_DEVAUTH_STORAGE_STORAGEERRORS_HPP
