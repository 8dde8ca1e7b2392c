#include "CommandRunner.hpp"

#include "qrpass/crypto/providers/OpenSslProviderFactory.hpp"
#include <cstddef>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        auto crypto{ qrpass::crypto::providers::makeOpenSslCryptoProvider() };
        qrpass::ui::cli::CommandRunner runner{ *crypto, std::cout };

        std::vector<std::string> args{};
        args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0U);
        for (int i{ 1 }; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        return runner.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return qrpass::ui::cli::g_exitFailure;
    }
}
