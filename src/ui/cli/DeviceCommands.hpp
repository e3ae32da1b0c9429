#ifndef DEVAUTH_UI_CLI_DEVICECOMMANDS_HPP
#define DEVAUTH_UI_CLI_DEVICECOMMANDS_HPP

#include "CommandLine.hpp"
#include "devauth/core/AuthFlow.hpp"
#include "devauth/core/RegistrationEngine.hpp"
#include "devauth/core/TokenEngine.hpp"
#include "devauth/security/SecureBuffer.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace devauth::ui::cli
{

// In tests: returns a pre-determined string.
using SecretReader = std::function<devauth::security::SecureString(const std::string&)>;

// Shortest prefix of a token shown by `status`.
constexpr std::size_t g_redactedPrefixLength{ 6 };

// "abcdef..." for tokens longer than the prefix, "***" otherwise.
[[nodiscard]] std::string redactToken(std::string_view token);

// One handler per subcommand. Every handler writes to the injected stream and returns the
// process exit code; secrets are never written.
class DeviceCommands final
{
public:
    DeviceCommands(devauth::core::RegistrationEngine& registration, devauth::core::TokenEngine& tokens,
                   devauth::core::AuthFlow& flow, devauth::storage::ICredentialStore& store, std::ostream& out,
                   SecretReader secretReader);

    [[nodiscard]] int run(const CliOptions& options);

    [[nodiscard]] int doProbe(std::string_view serverUrl);
    [[nodiscard]] int doEnroll(std::string_view serverUrl);
    [[nodiscard]] int doCallback(std::string_view uri);
    [[nodiscard]] int doLogin();
    [[nodiscard]] int doMe();
    [[nodiscard]] int doRefresh();
    [[nodiscard]] int doLogout();
    [[nodiscard]] int doReset();
    [[nodiscard]] int doStatus();

private:
    devauth::core::RegistrationEngine& m_registration;
    devauth::core::TokenEngine& m_tokens;
    devauth::core::AuthFlow& m_flow;
    devauth::storage::ICredentialStore& m_store;
    std::ostream& m_out;
    SecretReader m_secretReader;

    template <class T> [[nodiscard]] int reportFailure(const devauth::core::ApiResult<T>& result);
};

} // namespace devauth::ui::cli

#endif // DEVAUTH_UI_CLI_DEVICECOMMANDS_HPP
