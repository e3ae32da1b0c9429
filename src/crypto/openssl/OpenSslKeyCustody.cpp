#include "devauth/crypto/providers/OpenSslKeyCustodyFactory.hpp"

#include "devauth/crypto/Aead.hpp"
#include "devauth/crypto/Encoding.hpp"
#include "devauth/crypto/KeyCustodyErrors.hpp"
#include "devauth/security/SecureRandom.hpp"
#include "devauth/storage/StorageErrors.hpp"
#include "devauth/storage/sqlite/SqliteSupport.hpp"
#include <limits>
#include <mutex>
#include <nlohmann/json.hpp>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <string>

namespace devauth::crypto::providers
{
namespace
{

namespace sq = devauth::storage::sqlite;

constexpr std::string_view g_kKeysTable{ "signing_keys" };
constexpr std::string_view g_kKeyPrefix{ "devauth_key_" };

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using Pkcs8Ptr = std::unique_ptr<PKCS8_PRIV_KEY_INFO, decltype(&PKCS8_PRIV_KEY_INFO_free)>;

[[nodiscard]] std::string rowName(std::string_view keyId)
{
    std::string out{ g_kKeyPrefix };
    out.append(keyId);
    return out;
}

[[nodiscard]] devauth::security::SecureBuffer encodePkcs8(EVP_PKEY* pkey)
{
    Pkcs8Ptr p8{ EVP_PKEY2PKCS8(pkey), &PKCS8_PRIV_KEY_INFO_free };
    if (!p8)
    {
        throw KeyGenerationFailed("key custody: EVP_PKEY2PKCS8 failed");
    }
    const int len{ i2d_PKCS8_PRIV_KEY_INFO(p8.get(), nullptr) };
    if (len <= 0)
    {
        throw KeyGenerationFailed("key custody: PKCS#8 encoding failed");
    }

    devauth::security::SecureBuffer der{};
    der.resize(static_cast<std::size_t>(len));
    unsigned char* out{ der.data() };
    if (i2d_PKCS8_PRIV_KEY_INFO(p8.get(), &out) != len)
    {
        devauth::security::secureRelease(der);
        throw KeyGenerationFailed("key custody: PKCS#8 encoding failed");
    }
    return der;
}

[[nodiscard]] EvpPkeyPtr decodePkcs8(const devauth::security::SecureBuffer& der)
{
    if (der.size() > static_cast<std::size_t>(std::numeric_limits<long>::max()))
    {
        throw KeyStoreUnavailable("key custody: wrapped key too large");
    }
    const unsigned char* in{ der.data() };
    Pkcs8Ptr p8{ d2i_PKCS8_PRIV_KEY_INFO(nullptr, &in, static_cast<long>(der.size())), &PKCS8_PRIV_KEY_INFO_free };
    if (!p8)
    {
        throw KeyStoreUnavailable("key custody: stored key is not PKCS#8");
    }
    EvpPkeyPtr pkey{ EVP_PKCS82PKEY(p8.get()), &EVP_PKEY_free };
    if (!pkey)
    {
        throw KeyStoreUnavailable("key custody: EVP_PKCS82PKEY failed");
    }
    return pkey;
}

[[nodiscard]] std::string bignumParam(const EVP_PKEY* pkey, const char* name)
{
    BIGNUM* raw{ nullptr };
    if (EVP_PKEY_get_bn_param(pkey, name, &raw) != 1 || raw == nullptr)
    {
        throw KeyStoreUnavailable("key custody: cannot read RSA public parameter");
    }
    BignumPtr bn{ raw, &BN_free };

    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(BN_num_bytes(bn.get())));
    if (BN_bn2bin(bn.get(), bytes.data()) != static_cast<int>(bytes.size()))
    {
        throw KeyStoreUnavailable("key custody: BN_bn2bin failed");
    }
    return base64UrlEncode(bytes);
}

[[nodiscard]] nlohmann::json publicJwk(const EVP_PKEY* pkey, std::string_view keyId)
{
    return nlohmann::json{ { "kty", "RSA" },
                           { "e", bignumParam(pkey, OSSL_PKEY_PARAM_RSA_E) },
                           { "n", bignumParam(pkey, OSSL_PKEY_PARAM_RSA_N) },
                           { "kid", std::string{ keyId } },
                           { "use", "sig" },
                           { "alg", std::string{ g_signingAlgorithm } } };
}

class OpenSslKeyCustody final : public devauth::crypto::IKeyCustody
{
public:
    OpenSslKeyCustody(const std::filesystem::path& dbPath, devauth::security::SecureBuffer wrappingKey)
        : m_key{ std::move(wrappingKey) }
    {
        if (m_key.size() != g_aeadKeyBytes)
        {
            throw std::invalid_argument("key custody: wrapping key has wrong size");
        }
        try
        {
            m_db = sq::openDb(dbPath);
            sq::ensureSealedTable(m_db.get(), g_kKeysTable);
        }
        catch (const devauth::storage::StorageError& e)
        {
            throw KeyStoreUnavailable(e.what());
        }
    }

    OpenSslKeyCustody(const OpenSslKeyCustody&) = delete;
    OpenSslKeyCustody& operator=(const OpenSslKeyCustody&) = delete;
    OpenSslKeyCustody(OpenSslKeyCustody&&) = delete;
    OpenSslKeyCustody& operator=(OpenSslKeyCustody&&) = delete;

    ~OpenSslKeyCustody() override
    {
        devauth::security::secureRelease(m_key);
    }

    [[nodiscard]] std::string generateKeyPair() override
    {
        auto keyId{ devauth::security::secureRandomUuid() };
        if (!keyId)
        {
            throw KeyGenerationFailed("key custody: CSPRNG failure");
        }

        EvpPkeyPtr pkey{ EVP_RSA_gen(static_cast<unsigned int>(g_signingKeyBits)), &EVP_PKEY_free };
        if (!pkey)
        {
            throw KeyGenerationFailed("key custody: RSA key generation failed");
        }

        auto der{ encodePkcs8(pkey.get()) };
        const auto name{ rowName(*keyId) };
        try
        {
            const auto box{ aeadSeal(m_key, devauth::security::asBytes(der), devauth::security::asBytes(name)) };
            devauth::security::secureRelease(der);

            std::lock_guard lock{ m_mutex };
            sq::upsertSealed(m_db.get(), g_kKeysTable, name, box);
        }
        catch (const std::runtime_error& e)
        {
            devauth::security::secureRelease(der);
            throw KeyGenerationFailed(e.what());
        }
        return *keyId;
    }

    [[nodiscard]] bool hasKey(std::string_view keyId) const override
    {
        if (keyId.empty())
        {
            return false;
        }
        std::lock_guard lock{ m_mutex };
        try
        {
            return sq::loadSealed(m_db.get(), g_kKeysTable, rowName(keyId)).has_value();
        }
        catch (const devauth::storage::StorageError& e)
        {
            throw KeyStoreUnavailable(e.what());
        }
    }

    void deleteKey(std::string_view keyId) override
    {
        if (keyId.empty())
        {
            return;
        }
        std::lock_guard lock{ m_mutex };
        try
        {
            (void)sq::deleteSealed(m_db.get(), g_kKeysTable, rowName(keyId));
        }
        catch (const devauth::storage::StorageError& e)
        {
            throw KeyStoreUnavailable(e.what());
        }
    }

    void deleteAllManagedKeys() override
    {
        std::lock_guard lock{ m_mutex };
        try
        {
            sq::Transaction tx{ m_db.get() };
            for (const auto& name : sq::listSealedNames(m_db.get(), g_kKeysTable, g_kKeyPrefix))
            {
                (void)sq::deleteSealed(m_db.get(), g_kKeysTable, name);
            }
            tx.commit();
        }
        catch (const devauth::storage::StorageError& e)
        {
            throw KeyStoreUnavailable(e.what());
        }
    }

    [[nodiscard]] std::string exportPublicJwks(std::string_view keyId) const override
    {
        const auto pkey{ unwrap(keyId) };
        const nlohmann::json jwks{ { "keys", nlohmann::json::array({ publicJwk(pkey.get(), keyId) }) } };
        return jwks.dump();
    }

    [[nodiscard]] KeyMaterial describeKey(std::string_view keyId) const override
    {
        const auto pkey{ unwrap(keyId) };
        return KeyMaterial{ .keyId = std::string{ keyId },
                            .publicJwk = publicJwk(pkey.get(), keyId).dump(),
                            .hardwareBacked = false };
    }

    [[nodiscard]] std::vector<std::uint8_t> sign(std::string_view keyId,
                                                 std::span<const std::byte> signingInput) const override
    {
        const auto pkey{ unwrap(keyId) };

        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx)
        {
            throw KeyStoreUnavailable("key custody: EVP_MD_CTX_new failed");
        }
        if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1)
        {
            throw KeyStoreUnavailable("key custody: EVP_DigestSignInit failed");
        }

        const auto* in{ reinterpret_cast<const unsigned char*>(signingInput.data()) };
        std::size_t sigLen{ 0 };
        if (EVP_DigestSign(ctx.get(), nullptr, &sigLen, in, signingInput.size()) != 1)
        {
            throw KeyStoreUnavailable("key custody: EVP_DigestSign size query failed");
        }
        std::vector<std::uint8_t> signature(sigLen);
        if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, in, signingInput.size()) != 1)
        {
            throw KeyStoreUnavailable("key custody: EVP_DigestSign failed");
        }
        signature.resize(sigLen);
        return signature;
    }

private:
    devauth::security::SecureBuffer m_key;
    sq::SqliteDbPtr m_db;
    mutable std::mutex m_mutex;

    // The returned key lives only for the duration of one operation.
    [[nodiscard]] EvpPkeyPtr unwrap(std::string_view keyId) const
    {
        const auto name{ rowName(keyId) };
        std::optional<AeadBox> box{};
        {
            std::lock_guard lock{ m_mutex };
            try
            {
                box = sq::loadSealed(m_db.get(), g_kKeysTable, name);
            }
            catch (const devauth::storage::StorageError& e)
            {
                throw KeyStoreUnavailable(e.what());
            }
        }
        if (keyId.empty() || !box)
        {
            throw KeyNotFound("key custody: no key with this id");
        }

        auto der{ aeadOpen(m_key, *box, devauth::security::asBytes(name)) };
        if (!der)
        {
            throw KeyStoreUnavailable("key custody: wrapped key failed authentication");
        }
        auto pkey{ decodePkcs8(*der) };
        devauth::security::secureRelease(*der);
        return pkey;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<devauth::crypto::IKeyCustody>
makeOpenSslKeyCustody(const std::filesystem::path& dbPath, devauth::security::SecureBuffer wrappingKey)
{
    return std::make_unique<OpenSslKeyCustody>(dbPath, std::move(wrappingKey));
}

} // namespace devauth::crypto::providers
