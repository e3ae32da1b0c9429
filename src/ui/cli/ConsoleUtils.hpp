#ifndef DEVAUTH_UI_CLI_CONSOLEUTILS_HPP
#define DEVAUTH_UI_CLI_CONSOLEUTILS_HPP

#include "devauth/security/SecureBuffer.hpp"
#include <string>

namespace devauth::ui::cli
{

// Keeps tokens and key material out of swap and core dumps.
void lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo disabled.
[[nodiscard]] devauth::security::SecureString readSecret(const std::string& prompt);

} // namespace devauth::ui::cli

#endif // DEVAUTH_UI_CLI_CONSOLEUTILS_HPP
