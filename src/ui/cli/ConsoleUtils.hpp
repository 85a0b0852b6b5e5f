#ifndef CREDHASH_UI_CLI_CONSOLEUTILS_HPP
#define CREDHASH_UI_CLI_CONSOLEUTILS_HPP

#include "credhash/security/SecureBuffer.hpp"
#include <optional>
#include <string>

namespace credhash::ui::cli
{

// Keeps passwords out of swap and core dumps.
void lockProcessMemory() noexcept;

// Prompts on stdout and reads one line from stdin with terminal echo disabled.
// std::nullopt when no line could be read (EOF or stream error).
[[nodiscard]] std::optional<credhash::security::SecureString> readPassword(const std::string& prompt);

} // namespace credhash::ui::cli

#endif // CREDHASH_UI_CLI_CONSOLEUTILS_HPP
