#pragma once

#include "EnvironmentConfig.h"
#include "TradingSession.h"

#include <ostream>
#include <string>
#include <vector>

namespace Frontend {

constexpr int CLI_EXIT_SUCCESS = 0;
constexpr int CLI_EXIT_FAILURE = 1;
constexpr int CLI_EXIT_USAGE = 2;

void PrintUsage(std::ostream& err);

/**
 * @brief Dispatch one soldesk subcommand
 *
 * `args` excludes the program name: `{"balance", "<token>", "6"}`. Returns 0 on success,
 * 1 when the command ran and failed, 2 on a usage error.
 */
int RunCommand(const std::vector<std::string>& args,
               const WalletAPI::TradingSession& session,
               const Config::EnvironmentConfig& config,
               std::ostream& out,
               std::ostream& err);

} // namespace Frontend
