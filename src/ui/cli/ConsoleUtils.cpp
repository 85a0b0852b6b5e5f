#include "ConsoleUtils.hpp"

#include <iostream>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace credhash::ui::cli
{
namespace
{

// Turns terminal echo off for its lifetime. Does nothing when stdin is not a terminal.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        if (GetConsoleMode(m_handle, &m_saved) != 0)
        {
            m_active = SetConsoleMode(m_handle, m_saved & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
        }
#else
        if (tcgetattr(STDIN_FILENO, &m_saved) == 0)
        {
            termios quiet{ m_saved };
            quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            m_active = tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
        }
#endif
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;
    EchoGuard(EchoGuard&&) = delete;
    EchoGuard& operator=(EchoGuard&&) = delete;

    ~EchoGuard() noexcept
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_saved);
#else
        tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{ nullptr };
    DWORD m_saved{ 0 };
#else
    termios m_saved{};
#endif
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
#if defined(__linux__)
    // Best effort: unprivileged processes may be refused.
    (void)mlockall(MCL_CURRENT | MCL_FUTURE);
    const rlimit noCore{ 0, 0 };
    (void)setrlimit(RLIMIT_CORE, &noCore);
#endif
}

std::optional<credhash::security::SecureString> readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    bool gotLine{ false };
    {
        EchoGuard quiet{};
        gotLine = static_cast<bool>(std::getline(std::cin, line));
    }
    std::cout << "\n";

    const auto wipeLine{ credhash::security::scopeWipe(std::span<char>{ line }) };
    if (!gotLine)
    {
        return std::nullopt;
    }
    return credhash::security::secureStringFrom(line);
}

} // namespace credhash::ui::cli
