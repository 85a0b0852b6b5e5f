#ifndef CREDHASH_UI_CLI_HASHSHELL_HPP
#define CREDHASH_UI_CLI_HASHSHELL_HPP

#include "credhash/core/PasswordHasher.hpp"
#include "credhash/security/SecureBuffer.hpp"

#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace credhash::ui::cli
{

// Production: no-echo terminal input. Tests: canned answers.
// std::nullopt means no password could be read; the command is abandoned.
using PasswordReader = std::function<std::optional<credhash::security::SecureString>(const std::string&)>;

class HashShell final
{
public:
    HashShell(credhash::core::PasswordHasher& hasher, std::istream& in, std::ostream& out, PasswordReader pwdReader,
              std::uint32_t defaultIterations);

    // Reads commands from the input stream until EOF or `exit`.
    int run();

    // Runs a single command given as separate arguments (program name excluded).
    // Returns 0 when the command succeeded, 1 otherwise.
    int execute(const std::vector<std::string>& args);

private:
    credhash::core::PasswordHasher& m_hasher;
    std::istream& m_in;
    std::ostream& m_out;
    PasswordReader m_pwdReader;
    std::uint32_t m_defaultIterations;
    bool m_running{ true };

    [[nodiscard]] bool doHash(std::uint32_t iterations);
    [[nodiscard]] bool doVerify(const std::string& encoded);
    [[nodiscard]] bool doInspect(const std::string& encoded);
};

} // namespace credhash::ui::cli

#endif // CREDHASH_UI_CLI_HASHSHELL_HPP
