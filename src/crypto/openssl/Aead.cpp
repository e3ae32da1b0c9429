#include "devauth/crypto/Aead.hpp"
#include "devauth/security/SecureRandom.hpp"
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace devauth::crypto
{
namespace
{

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

void requireKey(std::span<const std::uint8_t> key, const char* what)
{
    if (key.size() != g_aeadKeyBytes)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t n, const char* what)
{
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

[[nodiscard]] EvpCipherCtxPtr newChaChaContext(bool encrypt, std::span<const std::uint8_t> key,
                                               std::span<const std::uint8_t> nonce)
{
    EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("aead: EVP_CIPHER_CTX_new failed");
    }
    const int enc{ encrypt ? 1 : 0 };
    if (EVP_CipherInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr, enc) != 1)
    {
        throw std::runtime_error("aead: EVP_CipherInit_ex failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1)
    {
        throw std::runtime_error("aead: set ivlen failed");
    }
    if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1)
    {
        throw std::runtime_error("aead: set key/nonce failed");
    }
    return ctx;
}

} // namespace

AeadBox aeadSeal(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                 std::span<const std::byte> associatedData)
{
    requireKey(key, "aeadSeal: key");
    requireIntSized(plainText.size(), "aeadSeal: plainText too large");
    requireIntSized(associatedData.size(), "aeadSeal: associatedData too large");

    AeadBox box{};
    if (!devauth::security::secureRandomFill(std::span<std::uint8_t>{ box.nonce }))
    {
        throw std::runtime_error("aeadSeal: CSPRNG failure");
    }

    auto ctx{ newChaChaContext(true, key, box.nonce) };

    int len{ 0 };
    const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
    {
        throw std::runtime_error("aeadSeal: add aad failed");
    }

    box.cipherText.resize(plainText.size());
    int outLen{ 0 };
    const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
    auto* ctPtr{ box.cipherText.empty() ? nullptr : box.cipherText.data() };
    if (EVP_EncryptUpdate(ctx.get(), ctPtr, &outLen, ptPtr, static_cast<int>(plainText.size())) != 1 ||
        outLen < 0 || static_cast<std::size_t>(outLen) > box.cipherText.size())
    {
        throw std::runtime_error("aeadSeal: encrypt update failed");
    }

    int finalLen{ 0 };
    auto* ctFinalPtr{ box.cipherText.empty() ? nullptr : (box.cipherText.data() + outLen) };
    if (EVP_EncryptFinal_ex(ctx.get(), ctFinalPtr, &finalLen) != 1 || finalLen < 0)
    {
        throw std::runtime_error("aeadSeal: encrypt final failed");
    }
    const std::size_t totalBytes{ static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) };
    if (totalBytes > box.cipherText.size())
    {
        throw std::runtime_error("aeadSeal: invalid output length");
    }
    box.cipherText.resize(totalBytes);

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) != 1)
    {
        throw std::runtime_error("aeadSeal: get tag failed");
    }
    return box;
}

std::optional<devauth::security::SecureBuffer> aeadOpen(std::span<const std::uint8_t> key, const AeadBox& box,
                                                        std::span<const std::byte> associatedData)
{
    requireKey(key, "aeadOpen: key");
    requireIntSized(associatedData.size(), "aeadOpen: associatedData too large");
    requireIntSized(box.cipherText.size(), "aeadOpen: cipherText too large");

    auto ctx{ newChaChaContext(false, key, box.nonce) };

    int len{ 0 };
    const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
    {
        throw std::runtime_error("aeadOpen: add aad failed");
    }

    devauth::security::SecureBuffer plainText{};
    plainText.resize(box.cipherText.size());

    int outLen{ 0 };
    const auto* ctPtr{ box.cipherText.empty() ? nullptr : box.cipherText.data() };
    auto* ptPtr{ plainText.empty() ? nullptr : plainText.data() };
    if (EVP_DecryptUpdate(ctx.get(), ptPtr, &outLen, ctPtr, static_cast<int>(box.cipherText.size())) != 1 ||
        outLen < 0 || static_cast<std::size_t>(outLen) > plainText.size())
    {
        devauth::security::secureRelease(plainText);
        return std::nullopt;
    }

    std::array<std::uint8_t, g_aeadTagBytes> tagCopy{ box.tag };
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) != 1)
    {
        throw std::runtime_error("aeadOpen: set tag failed");
    }

    int finalLen{ 0 };
    auto* ptFinalPtr{ plainText.empty() ? nullptr : (plainText.data() + outLen) };
    if (EVP_DecryptFinal_ex(ctx.get(), ptFinalPtr, &finalLen) != 1 || finalLen < 0)
    {
        devauth::security::secureRelease(plainText);
        return std::nullopt;
    }
    const std::size_t totalBytes{ static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) };
    if (totalBytes > plainText.size())
    {
        devauth::security::secureRelease(plainText);
        return std::nullopt;
    }
    plainText.resize(totalBytes);
    return plainText;
}

} // namespace devauth::crypto
