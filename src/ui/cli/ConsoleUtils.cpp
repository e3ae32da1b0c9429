#include "ConsoleUtils.hpp"
#include "devauth/security/ScopeWipe.hpp"

#include <iostream>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace devauth::ui::cli
{

namespace
{

// Restores the terminal echo flag on scope exit. A no-op when stdin is not a terminal.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
        if (isatty(STDIN_FILENO) == 0 || tcgetattr(STDIN_FILENO, &m_saved) != 0)
        {
            return;
        }
        struct termios silent
        {
            m_saved
        };
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        m_active = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;
    EchoGuard(EchoGuard&&) = delete;
    EchoGuard& operator=(EchoGuard&&) = delete;

    ~EchoGuard() noexcept
    {
        if (m_active)
        {
            tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
        }
    }

private:
    struct termios m_saved
    {
    };
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
    mlockall(MCL_CURRENT | MCL_FUTURE);
    struct rlimit lim
    {
        0, 0
    };
    setrlimit(RLIMIT_CORE, &lim);
}

devauth::security::SecureString readSecret(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    {
        const EchoGuard noEcho{};
        std::getline(std::cin, line);
    }
    auto wipeLine{ devauth::security::scopeWipe(line) };
    std::cout << "\n";

    return devauth::security::secureStringFrom(line);
}

} // namespace devauth::ui::cli
