#include "devauth/security/DeviceKey.hpp"
#include "devauth/security/SecureRandom.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace devauth::security
{
namespace
{

constexpr auto g_kPublicBits{ std::filesystem::perms::group_all | std::filesystem::perms::others_all };

[[nodiscard]] SecureBuffer readKeyFile(const std::filesystem::path& keyFile)
{
    std::error_code ec{};
    const auto perms{ std::filesystem::status(keyFile, ec).permissions() };
    if (ec)
    {
        throw std::runtime_error("device key: cannot stat key file");
    }
    if ((perms & g_kPublicBits) != std::filesystem::perms::none)
    {
        throw std::runtime_error("device key: key file is accessible by other users");
    }

    std::ifstream in{ keyFile, std::ios::binary };
    if (!in)
    {
        throw std::runtime_error("device key: failed to open key file");
    }

    SecureBuffer key{};
    key.resize(g_deviceKeyBytes);
    in.read(reinterpret_cast<char*>(key.data()), static_cast<std::streamsize>(key.size()));
    if (!in || in.peek() != std::ifstream::traits_type::eof())
    {
        secureRelease(key);
        throw std::runtime_error("device key: key file has unexpected size");
    }
    return key;
}

void writeKeyFile(const std::filesystem::path& keyFile, const SecureBuffer& key)
{
    std::error_code ec{};
    if (keyFile.has_parent_path())
    {
        std::filesystem::create_directories(keyFile.parent_path(), ec);
        if (ec)
        {
            throw std::runtime_error("device key: failed to create data directory");
        }
    }

    {
        std::ofstream out{ keyFile, std::ios::binary | std::ios::trunc };
        if (!out)
        {
            throw std::runtime_error("device key: failed to create key file");
        }
    }
    // Restrict before the secret is written.
    std::filesystem::permissions(keyFile, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        std::filesystem::remove(keyFile, ec);
        throw std::runtime_error("device key: failed to restrict key file permissions");
    }

    std::ofstream out{ keyFile, std::ios::binary | std::ios::trunc };
    out.write(reinterpret_cast<const char*>(key.data()), static_cast<std::streamsize>(key.size()));
    out.flush();
    if (!out)
    {
        throw std::runtime_error("device key: failed to write key file");
    }
}

} // namespace

SecureBuffer loadOrCreateDeviceKey(const std::filesystem::path& keyFile)
{
    std::error_code ec{};
    if (std::filesystem::exists(keyFile, ec))
    {
        return readKeyFile(keyFile);
    }

    SecureBuffer key{};
    key.resize(g_deviceKeyBytes);
    if (!secureRandomFill(std::span<std::uint8_t>{ key }))
    {
        secureRelease(key);
        throw std::runtime_error("device key: CSPRNG failure");
    }
    writeKeyFile(keyFile, key);
    return key;
}

} // namespace devauth::security
