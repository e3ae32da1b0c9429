#include "devauth/storage/sqlite/SqliteSupport.hpp"

#include "devauth/storage/StorageErrors.hpp"
#include <algorithm>
#include <cstring>
#include <span>
#include <sqlite3.h>
#include <system_error>

namespace devauth::storage::sqlite
{
namespace
{

constexpr int g_kBusyTimeoutMs{ 5000 };

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view text)
{
    if (sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    {
        throw StorageError(sqliteErr(db, "storage: bind text failed"));
    }
}

void bindBlob(sqlite3* db, sqlite3_stmt* stmt, int index, std::span<const std::uint8_t> bytes)
{
    // sqlite3_bind_blob with a null pointer binds NULL, so empty blobs get a valid address.
    static constexpr std::uint8_t kEmpty{ 0U };
    const void* ptr{ bytes.empty() ? static_cast<const void*>(&kEmpty) : bytes.data() };
    if (sqlite3_bind_blob(stmt, index, ptr, static_cast<int>(bytes.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    {
        throw StorageError(sqliteErr(db, "storage: bind blob failed"));
    }
}

[[nodiscard]] std::span<const std::uint8_t> columnBlob(sqlite3_stmt* stmt, int column)
{
    const void* ptr{ sqlite3_column_blob(stmt, column) };
    const int bytes{ sqlite3_column_bytes(stmt, column) };
    if (bytes < 0 || (ptr == nullptr && bytes != 0))
    {
        throw StorageError("storage: invalid blob column");
    }
    return std::span<const std::uint8_t>{ static_cast<const std::uint8_t*>(ptr), static_cast<std::size_t>(bytes) };
}

void hardenFilePermissions(const std::filesystem::path& path)
{
    std::error_code ec{};
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        throw StorageError("storage: failed to restrict database permissions");
    }
}

} // namespace

void SqliteDbDeleter::operator()(sqlite3* db) const noexcept
{
    if (db != nullptr)
    {
        (void)sqlite3_close_v2(db);
    }
}

void SqliteStmtDeleter::operator()(sqlite3_stmt* stmt) const noexcept
{
    if (stmt != nullptr)
    {
        (void)sqlite3_finalize(stmt);
    }
}

SqliteDbPtr openDb(const std::filesystem::path& path)
{
    const std::string filename{ path.string() };
    const bool inMemory{ filename == ":memory:" };

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(filename.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw StorageError(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    (void)sqlite3_busy_timeout(db.get(), g_kBusyTimeoutMs);

    if (!inMemory)
    {
        hardenFilePermissions(path);
    }
    return db;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw StorageError(msg);
    }
}

SqliteStmtPtr prepare(sqlite3* db, const std::string& sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql.c_str(), -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw StorageError(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

Transaction::Transaction(sqlite3* db) : m_db(db)
{
    exec(m_db, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction() noexcept
{
    if (!m_done)
    {
        (void)sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit()
{
    exec(m_db, "COMMIT;");
    m_done = true;
}

void ensureSealedTable(sqlite3* db, std::string_view table)
{
    std::string sql{ "CREATE TABLE IF NOT EXISTS " };
    sql.append(table);
    sql.append(" ("
               " name TEXT PRIMARY KEY,"
               " nonce BLOB NOT NULL,"
               " tag BLOB NOT NULL,"
               " ciphertext BLOB NOT NULL"
               ");");
    exec(db, sql.c_str());
}

void upsertSealed(sqlite3* db, std::string_view table, std::string_view name, const devauth::crypto::AeadBox& box)
{
    std::string sql{ "INSERT INTO " };
    sql.append(table);
    sql.append("(name, nonce, tag, ciphertext) VALUES (?, ?, ?, ?)"
               " ON CONFLICT(name) DO UPDATE SET nonce=excluded.nonce, tag=excluded.tag,"
               " ciphertext=excluded.ciphertext;");

    auto stmt{ prepare(db, sql) };
    bindText(db, stmt.get(), 1, name);
    bindBlob(db, stmt.get(), 2, box.nonce);
    bindBlob(db, stmt.get(), 3, box.tag);
    bindBlob(db, stmt.get(), 4, box.cipherText);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        throw StorageError(sqliteErr(db, "storage: upsert failed"));
    }
}

std::optional<devauth::crypto::AeadBox> loadSealed(sqlite3* db, std::string_view table, std::string_view name)
{
    std::string sql{ "SELECT nonce, tag, ciphertext FROM " };
    sql.append(table);
    sql.append(" WHERE name = ?;");

    auto stmt{ prepare(db, sql) };
    bindText(db, stmt.get(), 1, name);

    const int stepRc = sqlite3_step(stmt.get());
    if (stepRc == SQLITE_DONE)
    {
        return std::nullopt;
    }
    if (stepRc != SQLITE_ROW)
    {
        throw StorageError(sqliteErr(db, "storage: select failed"));
    }

    const auto nonce{ columnBlob(stmt.get(), 0) };
    const auto tag{ columnBlob(stmt.get(), 1) };
    const auto cipherText{ columnBlob(stmt.get(), 2) };
    if (nonce.size() != devauth::crypto::g_aeadNonceBytes || tag.size() != devauth::crypto::g_aeadTagBytes)
    {
        throw CorruptRecord("storage: invalid sealed row");
    }

    devauth::crypto::AeadBox out{};
    std::copy(nonce.begin(), nonce.end(), out.nonce.begin());
    std::copy(tag.begin(), tag.end(), out.tag.begin());
    out.cipherText.assign(cipherText.begin(), cipherText.end());
    return out;
}

bool deleteSealed(sqlite3* db, std::string_view table, std::string_view name)
{
    std::string sql{ "DELETE FROM " };
    sql.append(table);
    sql.append(" WHERE name = ?;");

    auto stmt{ prepare(db, sql) };
    bindText(db, stmt.get(), 1, name);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        throw StorageError(sqliteErr(db, "storage: delete failed"));
    }
    return sqlite3_changes(db) > 0;
}

std::vector<std::string> listSealedNames(sqlite3* db, std::string_view table, std::string_view prefix)
{
    std::string sql{ "SELECT name FROM " };
    sql.append(table);
    sql.append(" ORDER BY name;");

    auto stmt{ prepare(db, sql) };
    std::vector<std::string> out{};
    for (;;)
    {
        const int stepRc = sqlite3_step(stmt.get());
        if (stepRc == SQLITE_DONE)
        {
            break;
        }
        if (stepRc != SQLITE_ROW)
        {
            throw StorageError(sqliteErr(db, "storage: list failed"));
        }
        const auto* text{ sqlite3_column_text(stmt.get(), 0) };
        const int bytes{ sqlite3_column_bytes(stmt.get(), 0) };
        if (text == nullptr || bytes < 0)
        {
            continue;
        }
        std::string name{ reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes) };
        if (name.starts_with(prefix))
        {
            out.push_back(std::move(name));
        }
    }
    return out;
}

void deleteAllSealed(sqlite3* db, std::string_view table)
{
    std::string sql{ "DELETE FROM " };
    sql.append(table);
    sql.append(";");
    exec(db, sql.c_str());
}

} // namespace devauth::storage::sqlite
