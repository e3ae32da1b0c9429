#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"
#include "DeviceCommands.hpp"

#include "devauth/core/AuthFlow.hpp"
#include "devauth/core/RegistrationEngine.hpp"
#include "devauth/core/TokenEngine.hpp"
#include "devauth/crypto/providers/OpenSslKeyCustodyFactory.hpp"
#include "devauth/net/HttpTransportClient.hpp"
#include "devauth/net/curl/CurlHttpClientFactory.hpp"
#include "devauth/security/DeviceKey.hpp"
#include "devauth/storage/sqlite/SqliteCredentialStoreFactory.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

namespace
{

constexpr std::size_t g_kHostNameMax{ 256 };

[[nodiscard]] std::string hostName()
{
    std::array<char, g_kHostNameMax> buf{};
    if (gethostname(buf.data(), buf.size() - 1) != 0)
    {
        return {};
    }
    return std::string{ buf.data() };
}

void ensurePrivateDirectory(const std::filesystem::path& dir)
{
    std::filesystem::create_directories(dir);
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace);
}

[[nodiscard]] int runCommand(const devauth::ui::cli::CliOptions& options)
{
    ensurePrivateDirectory(options.dataDir);

    // One wrapping key seals both databases; each store gets its own copy.
    auto deviceKey{ devauth::security::loadOrCreateDeviceKey(options.dataDir / "device.key") };
    auto store{ devauth::storage::sqlite::makeSqliteCredentialStore(options.dataDir / "credentials.db", deviceKey) };
    auto custody{ devauth::crypto::providers::makeOpenSslKeyCustody(options.dataDir / "keys.db",
                                                                    std::move(deviceKey)) };

    devauth::net::TransportOptions transportOptions{};
    transportOptions.totalTimeout = std::chrono::seconds{ options.timeoutSeconds };
    transportOptions.connectTimeout = std::min(transportOptions.connectTimeout, transportOptions.totalTimeout);
    transportOptions.verifyTls = !options.insecure;
    transportOptions.caBundlePath = options.caBundle;
    auto http{ devauth::net::curl::makeCurlHttpClient(std::move(transportOptions)) };
    devauth::net::HttpTransportClient transport{ *http };

    devauth::core::EngineConfig config{};
    config.deviceId = hostName();
    if (options.redirectUri)
    {
        config.redirectUri = *options.redirectUri;
    }

    devauth::core::RegistrationEngine registration{ *custody, *store, transport, config };
    devauth::core::TokenEngine tokens{ *custody, *store, transport, config };
    devauth::core::AuthFlow flow{ registration, tokens, *store };

    devauth::ui::cli::DeviceCommands commands{ registration, tokens, flow, *store, std::cout,
                                               &devauth::ui::cli::readSecret };
    if (options.insecure)
    {
        std::cout << "warning: TLS certificate verification is disabled\n";
    }
    return commands.run(options);
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        devauth::ui::cli::lockProcessMemory();

        const std::vector<std::string> args(argv, argv + argc);
        devauth::ui::cli::CliOptions options{};
        if (const auto exitCode{ devauth::ui::cli::parseCommandLine(args, options, std::cout) }; exitCode)
        {
            return *exitCode;
        }
        return runCommand(options);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return devauth::ui::cli::g_exitFailure;
    }
}
