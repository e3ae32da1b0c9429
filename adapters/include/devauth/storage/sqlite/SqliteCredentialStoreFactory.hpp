#ifndef INCLUDE_DEVAUTH_STORAGE_SQLITE_SQLITECREDENTIALSTOREFACTORY_HPP
#define INCLUDE_DEVAUTH_STORAGE_SQLITE_SQLITECREDENTIALSTOREFACTORY_HPP

#include "devauth/security/SecureBuffer.hpp"
#include "devauth/storage/ICredentialStore.hpp"
#include <filesystem>
#include <memory>

namespace devauth::storage::sqlite
{

// `dbPath` may be ":memory:". `deviceKey` must be g_aeadKeyBytes long; every stored value is
// sealed with it. Throws StorageError if the database cannot be opened or initialized.
[[nodiscard]] std::unique_ptr<devauth::storage::ICredentialStore>
makeSqliteCredentialStore(const std::filesystem::path& dbPath, devauth::security::SecureBuffer deviceKey);

} // namespace devauth::storage::sqlite

#endif // INCLUDE_DEVAUTH_STORAGE_SQLITE_SQLITECREDENTIALSTOREFACTORY_HPP
