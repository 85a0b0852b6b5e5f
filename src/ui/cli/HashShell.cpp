#include "HashShell.hpp"

#include "credhash/core/HashPolicy.hpp"
#include "credhash/core/PasswordHash.hpp"
#include <CLI/CLI.hpp>
#include <sstream>
#include <variant>

namespace credhash::ui::cli
{
namespace
{

constexpr const char* g_kNoPasswordMessage{ "Error: No password entered.\n" };

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

[[nodiscard]] std::vector<std::string> splitWords(const std::string& line)
{
    std::vector<std::string> words;
    std::istringstream stream{ line };
    std::string word;
    while (stream >> word)
    {
        words.push_back(word);
    }
    return words;
}

} // namespace

HashShell::HashShell(credhash::core::PasswordHasher& hasher, std::istream& in, std::ostream& out,
                     PasswordReader pwdReader, std::uint32_t defaultIterations)
    : m_hasher(hasher), m_in(in), m_out(out), m_pwdReader(std::move(pwdReader)), m_defaultIterations(defaultIterations)
{
}

int HashShell::run()
{
    m_out << "credhash shell. Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        m_out << "credhash> ";
        if (!std::getline(m_in, line))
        {
            break;
        }

        const auto words{ splitWords(line) };
        if (words.empty())
        {
            continue;
        }
        (void)execute(words);
    }
    return 0;
}

int HashShell::execute(const std::vector<std::string>& args)
{
    if (args.empty())
    {
        return 1;
    }

    std::vector<std::string> argvStrings;
    argvStrings.reserve(args.size() + 1U);
    argvStrings.emplace_back("credhash");
    argvStrings.insert(argvStrings.end(), args.begin(), args.end());
    // 'help' as a command prints the root help rather than the subcommand's.
    if (argvStrings[1] == "help")
    {
        argvStrings[1] = "--help";
    }

    CLI::App app{ "ASP.NET Identity compatible password hashes" };
    app.require_subcommand(1);

    bool ok{ true };

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Leave the shell")->alias("quit")->callback([this]() { m_running = false; });

    std::uint32_t iterations{ m_defaultIterations };
    auto* subHash = app.add_subcommand("hash", "Hash a password (prompts twice)");
    subHash
        ->add_option("-i,--iterations", iterations, "PBKDF2 iteration count")
        ->check(CLI::Range(credhash::core::g_kMinIterations, credhash::core::g_kMaxIterations));
    subHash->callback([&]() { ok = doHash(iterations); });

    std::string encoded;
    auto* subVerify = app.add_subcommand("verify", "Check a password against an encoded hash");
    subVerify->add_option("encoded", encoded, "Base64 hashed value")->required();
    subVerify->callback([&]() { ok = doVerify(encoded); });

    auto* subInspect = app.add_subcommand("inspect", "Show the parameters of an encoded hash");
    subInspect->add_option("encoded", encoded, "Base64 hashed value")->required();
    subInspect->callback([&]() { ok = doInspect(encoded); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(argvStrings.size());
        for (auto& arg : argvStrings)
        {
            argv.push_back(arg.data());
        }
        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
        return 1;
    }

    return ok ? 0 : 1;
}

bool HashShell::doHash(std::uint32_t iterations)
{
    auto p1 = m_pwdReader("Password: ");
    if (!p1.has_value())
    {
        m_out << g_kNoPasswordMessage;
        return false;
    }
    auto wipeP1 = credhash::security::scopeWipe(*p1);

    auto p2 = m_pwdReader("Confirm Password: ");
    if (!p2.has_value())
    {
        m_out << g_kNoPasswordMessage;
        return false;
    }
    auto wipeP2 = credhash::security::scopeWipe(*p2);

    if (credhash::security::asStringView(*p1) != credhash::security::asStringView(*p2))
    {
        m_out << "Error: Passwords do not match.\n";
        return false;
    }

    auto result = m_hasher.generateFromPassword(credhash::security::asBytes(*p1), iterations);
    if (const auto* error = std::get_if<credhash::core::HashError>(&result))
    {
        m_out << "Error: " << credhash::core::describe(*error) << "\n";
        return false;
    }

    m_out << std::get<std::string>(result) << "\n";
    return true;
}

bool HashShell::doVerify(const std::string& encoded)
{
    auto pass = m_pwdReader("Password: ");
    if (!pass.has_value())
    {
        m_out << g_kNoPasswordMessage;
        return false;
    }
    auto wipePass = credhash::security::scopeWipe(*pass);

    const auto result = m_hasher.verifyEncodedHash(encoded, credhash::security::asBytes(*pass));
    if (result.error.has_value())
    {
        m_out << "Error: " << credhash::core::describe(*result.error) << "\n";
    }

    m_out << (result.matched ? "OK\n" : "FAILED\n");
    return result.matched;
}

bool HashShell::doInspect(const std::string& encoded)
{
    const auto decoded = credhash::core::decodePasswordHashText(encoded);
    if (const auto* error = std::get_if<credhash::core::HashError>(&decoded))
    {
        m_out << "Error: " << credhash::core::describe(*error) << "\n";
        return false;
    }

    const auto& hash = std::get<credhash::core::PasswordHash>(decoded);
    m_out << "version: " << static_cast<unsigned>(hash.version()) << "\n";
    m_out << "prf: HMAC-SHA256\n";
    m_out << "iterations: " << hash.iterations() << "\n";
    m_out << "salt length: " << hash.salt().size() << "\n";
    m_out << "salt: " << toHex(hash.salt()) << "\n";
    return true;
}

} // namespace credhash::ui::cli
