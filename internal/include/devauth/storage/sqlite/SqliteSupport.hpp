#ifndef INCLUDE_DEVAUTH_STORAGE_SQLITE_SQLITESUPPORT_HPP
#define INCLUDE_DEVAUTH_STORAGE_SQLITE_SQLITESUPPORT_HPP

#include "devauth/crypto/Aead.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

// Shared plumbing for the SQLite-backed credential store and key custody.
// All functions throw devauth::storage::StorageError on failure.
namespace devauth::storage::sqlite
{

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept;
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept;
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

// Opens (creating if needed) a database file with owner-only permissions.
// ":memory:" opens a private in-memory database.
[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path);

void exec(sqlite3* db, const char* sql);

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const std::string& sql);

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit() was called.
class Transaction final
{
public:
    explicit Transaction(sqlite3* db);
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    Transaction& operator=(Transaction&&) = delete;
    ~Transaction() noexcept;

    void commit();

private:
    sqlite3* m_db{ nullptr };
    bool m_done{ false };
};

// A "sealed table" maps a text name to an AEAD box (nonce, tag, ciphertext).
void ensureSealedTable(sqlite3* db, std::string_view table);

void upsertSealed(sqlite3* db, std::string_view table, std::string_view name, const devauth::crypto::AeadBox& box);

[[nodiscard]] std::optional<devauth::crypto::AeadBox> loadSealed(sqlite3* db, std::string_view table,
                                                                 std::string_view name);

// Returns true if a row was deleted.
bool deleteSealed(sqlite3* db, std::string_view table, std::string_view name);

[[nodiscard]] std::vector<std::string> listSealedNames(sqlite3* db, std::string_view table,
                                                       std::string_view prefix);

void deleteAllSealed(sqlite3* db, std::string_view table);

} // namespace devauth::storage::sqlite

#endif // INCLUDE_DEVAUTH_STORAGE_SQLITE_SQLITESUPPORT_HPP
