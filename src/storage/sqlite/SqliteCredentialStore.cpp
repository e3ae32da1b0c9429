#include "devauth/storage/sqlite/SqliteCredentialStoreFactory.hpp"

#include "devauth/crypto/Aead.hpp"
#include "devauth/storage/StorageErrors.hpp"
#include "devauth/storage/sqlite/SqliteSupport.hpp"
#include <array>
#include <charconv>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

namespace devauth::storage::sqlite
{
namespace
{

constexpr std::string_view g_kCredentialsTable{ "credentials" };
constexpr std::string_view g_kFlowTable{ "flow_state" };

constexpr std::string_view g_kServerUrl{ "serverUrl" };
constexpr std::string_view g_kClientId{ "clientId" };
constexpr std::string_view g_kKeyId{ "keyId" };
constexpr std::string_view g_kIsRegistered{ "isRegistered" };
constexpr std::string_view g_kRegistrationDate{ "registrationDate" };
constexpr std::string_view g_kAccessToken{ "accessToken" };
constexpr std::string_view g_kRefreshToken{ "refreshToken" };
constexpr std::string_view g_kTokenExpiresAt{ "tokenExpiresAt" };

constexpr std::array<std::string_view, 5> g_kRegistrationNames{ g_kServerUrl, g_kClientId, g_kKeyId,
                                                                 g_kIsRegistered, g_kRegistrationDate };
constexpr std::array<std::string_view, 3> g_kTokenNames{ g_kAccessToken, g_kRefreshToken, g_kTokenExpiresAt };

struct FlowNames final
{
    std::string_view state;
    std::string_view codeVerifier;
    std::string_view serverUrl;
};

[[nodiscard]] constexpr FlowNames flowNamesFor(FlowKind kind) noexcept
{
    if (kind == FlowKind::Enrollment)
    {
        return FlowNames{ .state = "pendingState",
                          .codeVerifier = "pendingCodeVerifier",
                          .serverUrl = "pendingServerUrl" };
    }
    return FlowNames{ .state = "oauthState", .codeVerifier = "oauthCodeVerifier", .serverUrl = "oauthServerUrl" };
}

[[nodiscard]] std::optional<std::int64_t> parseInt64(std::string_view text) noexcept
{
    std::int64_t value{};
    const auto* first{ text.data() };
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(first, last, value) };
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

class SqliteCredentialStore final : public devauth::storage::ICredentialStore
{
public:
    SqliteCredentialStore(const std::filesystem::path& dbPath, devauth::security::SecureBuffer deviceKey)
        : m_db{ openDb(dbPath) }, m_key{ std::move(deviceKey) }
    {
        if (m_key.size() != devauth::crypto::g_aeadKeyBytes)
        {
            throw StorageError("storage: device key has wrong size");
        }
        ensureSealedTable(m_db.get(), g_kCredentialsTable);
        ensureSealedTable(m_db.get(), g_kFlowTable);
    }

    SqliteCredentialStore(const SqliteCredentialStore&) = delete;
    SqliteCredentialStore& operator=(const SqliteCredentialStore&) = delete;
    SqliteCredentialStore(SqliteCredentialStore&&) = delete;
    SqliteCredentialStore& operator=(SqliteCredentialStore&&) = delete;

    ~SqliteCredentialStore() override
    {
        devauth::security::secureRelease(m_key);
    }

    [[nodiscard]] std::optional<DeviceRegistration> loadRegistration() const override
    {
        std::lock_guard lock{ m_mutex };

        const auto registered{ get(g_kCredentialsTable, g_kIsRegistered) };
        const auto serverUrl{ get(g_kCredentialsTable, g_kServerUrl) };
        const auto clientId{ get(g_kCredentialsTable, g_kClientId) };
        const auto keyId{ get(g_kCredentialsTable, g_kKeyId) };
        if (!registered || devauth::security::asStringView(*registered) != "1" || !serverUrl || !clientId ||
            !keyId || clientId->empty() || keyId->empty())
        {
            return std::nullopt;
        }

        DeviceRegistration out{};
        out.serverUrl = std::string{ devauth::security::asStringView(*serverUrl) };
        out.clientId = std::string{ devauth::security::asStringView(*clientId) };
        out.keyId = std::string{ devauth::security::asStringView(*keyId) };
        if (const auto date{ get(g_kCredentialsTable, g_kRegistrationDate) }; date)
        {
            out.registeredAtEpochMs = parseInt64(devauth::security::asStringView(*date)).value_or(0);
        }
        return out;
    }

    void saveRegistration(const DeviceRegistration& registration) override
    {
        if (registration.clientId.empty() || registration.keyId.empty())
        {
            throw std::invalid_argument("saveRegistration: clientId and keyId are required");
        }

        std::lock_guard lock{ m_mutex };
        Transaction tx{ m_db.get() };
        put(g_kCredentialsTable, g_kServerUrl, registration.serverUrl);
        put(g_kCredentialsTable, g_kClientId, registration.clientId);
        put(g_kCredentialsTable, g_kKeyId, registration.keyId);
        put(g_kCredentialsTable, g_kRegistrationDate, std::to_string(registration.registeredAtEpochMs));
        put(g_kCredentialsTable, g_kIsRegistered, "1");
        tx.commit();
    }

    void clearRegistration() override
    {
        std::lock_guard lock{ m_mutex };
        Transaction tx{ m_db.get() };
        for (const auto name : g_kRegistrationNames)
        {
            (void)deleteSealed(m_db.get(), g_kCredentialsTable, name);
        }
        tx.commit();
    }

    [[nodiscard]] std::optional<TokenSet> loadTokens() const override
    {
        std::lock_guard lock{ m_mutex };

        auto access{ get(g_kCredentialsTable, g_kAccessToken) };
        if (!access || access->empty())
        {
            return std::nullopt;
        }

        TokenSet out{};
        out.accessToken = std::move(*access);
        out.refreshToken = get(g_kCredentialsTable, g_kRefreshToken);
        if (const auto expires{ get(g_kCredentialsTable, g_kTokenExpiresAt) }; expires)
        {
            out.expiresAtEpochMs = parseInt64(devauth::security::asStringView(*expires)).value_or(0);
        }
        return out;
    }

    void saveTokens(const TokenSet& tokens) override
    {
        std::lock_guard lock{ m_mutex };
        Transaction tx{ m_db.get() };
        put(g_kCredentialsTable, g_kAccessToken, devauth::security::asStringView(tokens.accessToken));
        if (tokens.refreshToken)
        {
            put(g_kCredentialsTable, g_kRefreshToken, devauth::security::asStringView(*tokens.refreshToken));
        }
        else
        {
            (void)deleteSealed(m_db.get(), g_kCredentialsTable, g_kRefreshToken);
        }
        put(g_kCredentialsTable, g_kTokenExpiresAt, std::to_string(tokens.expiresAtEpochMs));
        tx.commit();
    }

    void clearTokens() override
    {
        std::lock_guard lock{ m_mutex };
        Transaction tx{ m_db.get() };
        for (const auto name : g_kTokenNames)
        {
            (void)deleteSealed(m_db.get(), g_kCredentialsTable, name);
        }
        tx.commit();
    }

    [[nodiscard]] std::optional<PendingFlowState> loadPendingFlow(FlowKind kind) const override
    {
        const auto names{ flowNamesFor(kind) };
        std::lock_guard lock{ m_mutex };

        const auto state{ get(g_kFlowTable, names.state) };
        if (!state || state->empty())
        {
            return std::nullopt;
        }

        PendingFlowState out{};
        out.state = std::string{ devauth::security::asStringView(*state) };
        out.codeVerifier = get(g_kFlowTable, names.codeVerifier);
        if (const auto serverUrl{ get(g_kFlowTable, names.serverUrl) }; serverUrl)
        {
            out.serverUrl = std::string{ devauth::security::asStringView(*serverUrl) };
        }
        return out;
    }

    void savePendingFlow(FlowKind kind, const PendingFlowState& pending) override
    {
        const auto names{ flowNamesFor(kind) };
        std::lock_guard lock{ m_mutex };
        Transaction tx{ m_db.get() };
        put(g_kFlowTable, names.state, pending.state);
        putOrErase(g_kFlowTable, names.codeVerifier,
                   pending.codeVerifier ? std::optional<std::string_view>{ devauth::security::asStringView(
                                              *pending.codeVerifier) }
                                        : std::nullopt);
        putOrErase(g_kFlowTable, names.serverUrl,
                   pending.serverUrl ? std::optional<std::string_view>{ *pending.serverUrl } : std::nullopt);
        tx.commit();
    }

    void clearPendingFlow(FlowKind kind) override
    {
        const auto names{ flowNamesFor(kind) };
        std::lock_guard lock{ m_mutex };
        Transaction tx{ m_db.get() };
        (void)deleteSealed(m_db.get(), g_kFlowTable, names.state);
        (void)deleteSealed(m_db.get(), g_kFlowTable, names.codeVerifier);
        (void)deleteSealed(m_db.get(), g_kFlowTable, names.serverUrl);
        tx.commit();
    }

    void clearAll() override
    {
        std::lock_guard lock{ m_mutex };
        Transaction tx{ m_db.get() };
        deleteAllSealed(m_db.get(), g_kCredentialsTable);
        deleteAllSealed(m_db.get(), g_kFlowTable);
        tx.commit();
    }

private:
    SqliteDbPtr m_db;
    devauth::security::SecureBuffer m_key;
    mutable std::mutex m_mutex;

    // The row name is bound as associated data so sealed values cannot be swapped between rows.
    void put(std::string_view table, std::string_view name, std::string_view value)
    {
        const auto box{ devauth::crypto::aeadSeal(m_key, devauth::security::asBytes(value),
                                                  devauth::security::asBytes(name)) };
        upsertSealed(m_db.get(), table, name, box);
    }

    void putOrErase(std::string_view table, std::string_view name, std::optional<std::string_view> value)
    {
        if (value)
        {
            put(table, name, *value);
            return;
        }
        (void)deleteSealed(m_db.get(), table, name);
    }

    [[nodiscard]] std::optional<devauth::security::SecureString> get(std::string_view table,
                                                                     std::string_view name) const
    {
        const auto box{ loadSealed(m_db.get(), table, name) };
        if (!box)
        {
            return std::nullopt;
        }
        auto plain{ devauth::crypto::aeadOpen(m_key, *box, devauth::security::asBytes(name)) };
        if (!plain)
        {
            throw CorruptRecord("storage: record failed authentication");
        }
        auto out{ devauth::security::toSecureString(*plain) };
        devauth::security::secureRelease(*plain);
        return out;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<devauth::storage::ICredentialStore>
makeSqliteCredentialStore(const std::filesystem::path& dbPath, devauth::security::SecureBuffer deviceKey)
{
    return std::make_unique<SqliteCredentialStore>(dbPath, std::move(deviceKey));
}

} // namespace devauth::storage::sqlite
