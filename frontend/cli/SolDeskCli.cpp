/*
 * soldesk: command-line front end to the wallet core
 *
 *   soldesk address
 *   soldesk balance <token> [tokenDecimals] [networkId]
 *   soldesk settle <file>
 *
 * Configuration comes from the SOLDESK_* environment variables.
 */

#include "CliCommands.h"
#include "Crypto.h"
#include "EnvironmentConfig.h"
#include "Logger.h"
#include "TradingSession.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        Frontend::PrintUsage(std::cerr);
        return Frontend::CLI_EXIT_USAGE;
    }

    Config::EnvironmentConfig config = Config::EnvironmentConfig::Load();
    if (!Logging::Logger::getInstance().initialize(config.logFile, config.logLevel, false)) {
        std::cerr << "Logging to file disabled" << std::endl;
    }

    if (!Crypto::Initialize()) {
        std::cerr << "Failed to initialize cryptography library" << std::endl;
        Logging::Logger::getInstance().shutdown();
        return Frontend::CLI_EXIT_FAILURE;
    }

    WalletAPI::TradingSession session = WalletAPI::TradingSession::FromConfig(config);

    std::vector<std::string> args(argv + 1, argv + argc);
    int exit_code = Frontend::RunCommand(args, session, config, std::cout, std::cerr);
    Crypto::SecureWipeString(config.privateKey);

    Logging::Logger::getInstance().shutdown();
    return exit_code;
}
