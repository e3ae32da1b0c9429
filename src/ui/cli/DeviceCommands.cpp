#include "DeviceCommands.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace devauth::ui::cli
{

namespace
{

using devauth::core::ApiResult;
using devauth::core::isOk;

constexpr std::int64_t g_kMsPerSecond{ 1000 };

[[nodiscard]] std::string formatEpochMs(std::int64_t epochMs)
{
    const auto seconds{ static_cast<std::time_t>(epochMs / g_kMsPerSecond) };
    std::tm utc{};
    if (gmtime_r(&seconds, &utc) == nullptr)
    {
        return std::to_string(epochMs);
    }
    std::ostringstream os;
    os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

void printOptional(std::ostream& out, std::string_view label, const std::optional<std::string>& value)
{
    if (value)
    {
        out << "  " << label << ": " << *value << "\n";
    }
}

} // namespace

std::string redactToken(std::string_view token)
{
    if (token.size() <= g_redactedPrefixLength)
    {
        return "***";
    }
    return std::string{ token.substr(0, g_redactedPrefixLength) } + "...";
}

DeviceCommands::DeviceCommands(devauth::core::RegistrationEngine& registration, devauth::core::TokenEngine& tokens,
                               devauth::core::AuthFlow& flow, devauth::storage::ICredentialStore& store,
                               std::ostream& out, SecretReader secretReader)
    : m_registration(registration), m_tokens(tokens), m_flow(flow), m_store(store), m_out(out),
      m_secretReader(std::move(secretReader))
{
}

int DeviceCommands::run(const CliOptions& options)
{
    switch (options.command)
    {
    case Command::Probe:
        return doProbe(options.serverUrl);
    case Command::Enroll:
        return doEnroll(options.serverUrl);
    case Command::Callback:
        return doCallback(options.callbackUri);
    case Command::Login:
        return doLogin();
    case Command::Me:
        return doMe();
    case Command::Refresh:
        return doRefresh();
    case Command::Logout:
        return doLogout();
    case Command::Reset:
        return doReset();
    case Command::Status:
        return doStatus();
    }
    return g_exitUsage;
}

template <class T> int DeviceCommands::reportFailure(const ApiResult<T>& result)
{
    std::visit(devauth::core::Overloaded{
                   [](const T&) {},
                   [this](const devauth::core::ValidationError& e) {
                       m_out << "Error [" << devauth::core::validationErrorCodeName(e.code) << "]: " << e.message
                             << "\n";
                       if (e.isFatal())
                       {
                           m_out << "The signing key is unusable. Run 'reset' and enroll again.\n";
                       }
                   },
                   [this, &result](const devauth::core::ProtocolError&) {
                       m_out << "Server error: " << devauth::core::errorMessage(result) << "\n";
                   },
                   [this](const devauth::core::TransportError& e) {
                       m_out << "Network error: " << e.cause << "\n";
                   } },
               result);
    return g_exitFailure;
}

int DeviceCommands::doProbe(std::string_view serverUrl)
{
    const auto result{ m_registration.probeServer(serverUrl) };
    if (!isOk(result))
    {
        return reportFailure(result);
    }

    const auto& info{ std::get<devauth::net::SystemInfo>(result) };
    m_out << "Server reachable: " << serverUrl << "\n";
    printOptional(m_out, "name", info.systemName);
    printOptional(m_out, "version", info.version);
    printOptional(m_out, "revision", info.revision);
    printOptional(m_out, "context path", info.contextPath);
    return g_exitSuccess;
}

int DeviceCommands::doEnroll(std::string_view serverUrl)
{
    const auto result{ m_flow.beginEnrollment(serverUrl) };
    if (!isOk(result))
    {
        return reportFailure(result);
    }

    m_out << "Open this URL in a browser to enroll the device:\n" << std::get<std::string>(result) << "\n";
    m_out << "Then pass the redirect URI to 'callback'.\n";
    return g_exitSuccess;
}

int DeviceCommands::doCallback(std::string_view uri)
{
    devauth::security::SecureString prompted{};
    if (uri.empty())
    {
        prompted = m_secretReader("Callback URI: ");
        uri = devauth::security::asStringView(prompted);
    }

    const auto result{ m_flow.handleCallback(uri) };
    if (!isOk(result))
    {
        return reportFailure(result);
    }

    const auto& outcome{ std::get<devauth::core::CallbackOutcome>(result) };
    if (outcome.kind == devauth::core::CallbackKind::Enrollment)
    {
        m_out << "Device registered. Client ID: " << outcome.clientId.value_or("") << "\n";
    }
    else
    {
        m_out << "Signed in.\n";
    }
    return g_exitSuccess;
}

int DeviceCommands::doLogin()
{
    const auto result{ m_flow.beginLogin() };
    if (!isOk(result))
    {
        return reportFailure(result);
    }

    m_out << "Open this URL in a browser to sign in:\n" << std::get<std::string>(result) << "\n";
    m_out << "Then pass the redirect URI to 'callback'.\n";
    return g_exitSuccess;
}

int DeviceCommands::doMe()
{
    const auto result{ m_tokens.getUserInfo() };
    if (!isOk(result))
    {
        return reportFailure(result);
    }

    const auto& user{ std::get<devauth::net::UserInfo>(result) };
    m_out << "User: " << user.username << " (id " << user.id << ")\n";
    printOptional(m_out, "name", user.displayName);
    printOptional(m_out, "email", user.email);
    return g_exitSuccess;
}

int DeviceCommands::doRefresh()
{
    const auto result{ m_tokens.refreshAccessToken() };
    if (!isOk(result))
    {
        return reportFailure(result);
    }

    m_out << "Access token refreshed";
    if (const auto expiresAt{ m_tokens.tokenExpiresAt() }; expiresAt)
    {
        m_out << ", expires " << formatEpochMs(*expiresAt);
    }
    m_out << ".\n";
    return g_exitSuccess;
}

int DeviceCommands::doLogout()
{
    const auto result{ m_tokens.logout() };
    if (!isOk(result))
    {
        return reportFailure(result);
    }
    m_out << "Signed out. The device stays registered.\n";
    return g_exitSuccess;
}

int DeviceCommands::doReset()
{
    const auto result{ m_registration.resetRegistration() };
    if (!isOk(result))
    {
        return reportFailure(result);
    }
    m_out << "Registration, signing key and tokens deleted.\n";
    return g_exitSuccess;
}

int DeviceCommands::doStatus()
{
    const auto reg{ m_registration.registration() };
    if (!reg)
    {
        m_out << "Registered: no\n";
        return g_exitSuccess;
    }

    m_out << "Registered: " << (m_registration.isDeviceRegistered() ? "yes" : "no (signing key missing)") << "\n";
    m_out << "  server: " << reg->serverUrl << "\n";
    m_out << "  client id: " << reg->clientId << "\n";
    m_out << "  key id: " << reg->keyId << "\n";
    m_out << "  registered: " << formatEpochMs(reg->registeredAtEpochMs) << "\n";

    std::optional<devauth::storage::TokenSet> tokens{};
    try
    {
        tokens = m_store.loadTokens();
    }
    catch (const std::exception& e)
    {
        m_out << "Error [storage_failure]: " << e.what() << "\n";
        return g_exitFailure;
    }

    if (!tokens)
    {
        m_out << "Signed in: no\n";
        return g_exitSuccess;
    }
    m_out << "Signed in: " << (m_tokens.isLoggedIn() ? "yes" : "token expired") << "\n";
    m_out << "  access token: " << redactToken(devauth::security::asStringView(tokens->accessToken)) << "\n";
    m_out << "  refresh token: " << (tokens->refreshToken ? "present" : "none") << "\n";
    m_out << "  expires: " << formatEpochMs(tokens->expiresAtEpochMs) << "\n";
    return g_exitSuccess;
}

} // namespace devauth::ui::cli
