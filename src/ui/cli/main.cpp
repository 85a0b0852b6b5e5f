#include "ConsoleUtils.hpp"
#include "HashShell.hpp"

#include "credhash/core/HashPolicy.hpp"
#include "credhash/core/PasswordHasher.hpp"
#include "credhash/crypto/providers/OpenSslProviderFactory.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        credhash::ui::cli::lockProcessMemory();

        auto crypto{ credhash::crypto::providers::makeOpenSslCryptoProvider() };
        credhash::core::PasswordHasher hasher{ *crypto };

        credhash::ui::cli::HashShell shell{ hasher, std::cin, std::cout, &credhash::ui::cli::readPassword,
                                            credhash::core::defaultIterationsFromEnvironment() };

        if (argc > 1)
        {
            const std::vector<std::string> args(argv + 1, argv + argc);
            return shell.execute(args);
        }
        return shell.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
