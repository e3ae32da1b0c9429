#include "CommandLine.hpp"

#include <CLI/CLI.hpp>
#include <cstdlib>

namespace devauth::ui::cli
{

namespace
{

constexpr int g_kMinTimeoutSeconds{ 1 };
constexpr int g_kMaxTimeoutSeconds{ 600 };

void addServerOption(CLI::App* sub, std::string& serverUrl)
{
    sub->add_option("-s,--server", serverUrl, "Server base URL, e.g. https://play.dhis2.org/dev")->required();
}

} // namespace

std::filesystem::path defaultDataDir()
{
    if (const char* xdg{ std::getenv("XDG_DATA_HOME") }; xdg != nullptr && *xdg != '\0')
    {
        return std::filesystem::path{ xdg } / "devauth";
    }
    if (const char* home{ std::getenv("HOME") }; home != nullptr && *home != '\0')
    {
        return std::filesystem::path{ home } / ".local" / "share" / "devauth";
    }
    return std::filesystem::path{ ".devauth" };
}

std::optional<int> parseCommandLine(const std::vector<std::string>& args, CliOptions& options, std::ostream& out)
{
    CLI::App app{ "DeviceAuthCore: register this device with a DHIS2 server and sign in" };
    app.name(args.empty() ? std::string{ "devauth" } : args.front());
    app.require_subcommand(1);
    app.set_config("--config", "", "INI or TOML file with option defaults");

    std::string dataDir{ defaultDataDir().string() };
    app.add_option("--data-dir", dataDir, "Directory holding credentials.db, keys.db and device.key")
        ->capture_default_str();

    std::string redirectUri;
    app.add_option("--redirect-uri", redirectUri, "Redirect URI registered for this client");
    app.add_option("--timeout", options.timeoutSeconds, "Total HTTP timeout in seconds")
        ->check(CLI::Range(g_kMinTimeoutSeconds, g_kMaxTimeoutSeconds))
        ->capture_default_str();
    app.add_flag("--insecure", options.insecure, "Skip TLS certificate verification");
    std::string caBundle;
    app.add_option("--ca-bundle", caBundle, "PEM file with trusted CA certificates")->check(CLI::ExistingFile);

    auto* subProbe{ app.add_subcommand("probe", "Check that the server is reachable") };
    addServerOption(subProbe, options.serverUrl);
    subProbe->callback([&options]() { options.command = Command::Probe; });

    auto* subEnroll{ app.add_subcommand("enroll", "Start enrollment and print the URL to open") };
    addServerOption(subEnroll, options.serverUrl);
    subEnroll->callback([&options]() { options.command = Command::Enroll; });

    auto* subCallback{ app.add_subcommand("callback", "Complete enrollment or login from the redirect URI") };
    subCallback->add_option("uri", options.callbackUri, "Redirect URI as received (prompted if omitted)");
    subCallback->callback([&options]() { options.command = Command::Callback; });

    app.add_subcommand("login", "Start login and print the URL to open")->callback([&options]() {
        options.command = Command::Login;
    });
    app.add_subcommand("me", "Show the signed-in user")->callback([&options]() { options.command = Command::Me; });
    app.add_subcommand("refresh", "Refresh the access token")->callback([&options]() {
        options.command = Command::Refresh;
    });
    app.add_subcommand("logout", "Forget the tokens, keep the registration")->callback([&options]() {
        options.command = Command::Logout;
    });
    app.add_subcommand("reset", "Delete the registration, key and tokens")->callback([&options]() {
        options.command = Command::Reset;
    });
    app.add_subcommand("status", "Show registration and session state")->callback([&options]() {
        options.command = Command::Status;
    });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        out << app.help();
        return g_exitSuccess;
    }
    catch (const CLI::ParseError& e)
    {
        out << "Syntax Error: " << e.what() << "\n";
        return g_exitUsage;
    }

    options.dataDir = dataDir;
    if (!redirectUri.empty())
    {
        options.redirectUri = redirectUri;
    }
    if (!caBundle.empty())
    {
        options.caBundle = caBundle;
    }
    return std::nullopt;
}

} // namespace devauth::ui::cli
