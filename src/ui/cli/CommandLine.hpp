#ifndef DEVAUTH_UI_CLI_COMMANDLINE_HPP
#define DEVAUTH_UI_CLI_COMMANDLINE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace devauth::ui::cli
{

constexpr int g_exitSuccess{ 0 };
constexpr int g_exitFailure{ 1 };
constexpr int g_exitUsage{ 2 };

enum class Command : std::uint8_t
{
    Probe,
    Enroll,
    Callback,
    Login,
    Me,
    Refresh,
    Logout,
    Reset,
    Status,
};

struct CliOptions final
{
    Command command{ Command::Status };
    std::string serverUrl;
    // Empty: `callback` prompts for the URI without echo.
    std::string callbackUri;
    std::filesystem::path dataDir;
    std::optional<std::string> redirectUri;
    int timeoutSeconds{ 30 };
    bool insecure{ false };
    std::optional<std::string> caBundle;
};

// `$XDG_DATA_HOME/devauth`, else `$HOME/.local/share/devauth`, else `./.devauth`.
[[nodiscard]] std::filesystem::path defaultDataDir();

// Parses `args` (args[0] is the program name). Returns std::nullopt when a command should run,
// otherwise the exit code to return right away: 0 after printing help, 2 on a usage error.
[[nodiscard]] std::optional<int> parseCommandLine(const std::vector<std::string>& args, CliOptions& options,
                                                  std::ostream& out);

} // namespace devauth::ui::cli

#endif // DEVAUTH_UI_CLI_COMMANDLINE_HPP
