#include "CliCommands.h"
#include "SolanaTransaction.h"
#include "TransactionSettler.h"

#include <fstream>
#include <sstream>
#include <utility>

namespace Frontend {

namespace {

bool ParseInt(const std::string& text, int& out) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int RunAddress(const WalletAPI::TradingSession& session, const Config::EnvironmentConfig& config,
               std::ostream& out, std::ostream& err) {
    const KeyMaterial::Keypair* keypair = session.GetKeypair();
    if (keypair == nullptr) {
        err << (session.KeyError().empty() ? "SOLDESK_PRIVATE_KEY is not set" : session.KeyError()) << std::endl;
        return CLI_EXIT_FAILURE;
    }

    out << "Address: " << keypair->PublicKeyBase58() << std::endl;
    out << "Key format: " << KeyMaterial::KeyFormatToString(keypair->SourceFormat()) << std::endl;
    out << "Trading: " << (session.IsTradingEnabled() ? "enabled" : "disabled (set SOLDESK_RPC_URL)")
        << std::endl;
    out << "Trading panel: "
        << (config.IsPanelEnabled() ? "enabled" : "disabled (needs SOLDESK_RPC_URL and SOLDESK_REFERRAL_ACCOUNT)")
        << std::endl;
    return CLI_EXIT_SUCCESS;
}

int RunBalance(const std::vector<std::string>& args, const WalletAPI::TradingSession& session,
               std::ostream& out, std::ostream& err) {
    if (args.size() < 2) {
        PrintUsage(err);
        return CLI_EXIT_USAGE;
    }

    const std::string& token = args[1];
    int token_decimals = WalletAPI::SOLANA_NATIVE_DECIMALS;
    int network_id = WalletAPI::SOLANA_MAINNET_NETWORK_ID;
    if (args.size() > 2 && !ParseInt(args[2], token_decimals)) {
        err << "Invalid token decimals: " << args[2] << std::endl;
        return CLI_EXIT_USAGE;
    }
    if (args.size() > 3 && !ParseInt(args[3], network_id)) {
        err << "Invalid network id: " << args[3] << std::endl;
        return CLI_EXIT_USAGE;
    }

    if (!session.IsTradingEnabled()) {
        err << "Wallet not initialized. Set SOLDESK_RPC_URL and SOLDESK_PRIVATE_KEY." << std::endl;
        return CLI_EXIT_FAILURE;
    }

    WalletAPI::BalanceSnapshot snapshot = session.RefreshBalances(token, token_decimals, network_id);
    out << "Wallet:  " << session.WalletAddress() << std::endl;
    out << "SOL:     " << snapshot.nativeBalance << " (" << snapshot.nativeAtomic.ToString() << " lamports)"
        << std::endl;
    out << "Token:   " << snapshot.tokenBalance << " (" << snapshot.tokenAtomic.ToString() << " atomic, "
        << WalletAPI::AddressFormatToString(snapshot.tokenFormat) << ", "
        << WalletAPI::TokenBalanceStatusToString(snapshot.tokenStatus) << ")" << std::endl;
    return CLI_EXIT_SUCCESS;
}

int RunSettle(const std::vector<std::string>& args, const WalletAPI::TradingSession& session,
              std::ostream& out, std::ostream& err) {
    if (args.size() < 2) {
        PrintUsage(err);
        return CLI_EXIT_USAGE;
    }

    std::ifstream file(args[1]);
    if (!file.is_open()) {
        err << "Cannot open " << args[1] << std::endl;
        return CLI_EXIT_FAILURE;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto unsigned_tx = SolanaService::UnsignedTransaction::FromBase64(buffer.str());
    if (!unsigned_tx) {
        err << "Invalid transaction: " << unsigned_tx.errorMessage << std::endl;
        return CLI_EXIT_FAILURE;
    }

    const SolanaService::TransactionLayout& layout = unsigned_tx->Layout();
    out << "Transaction: " << (layout.versioned ? "v" + std::to_string(layout.version) : std::string("legacy"))
        << ", " << layout.signatureCount << " signer(s), " << layout.accountKeys.size() << " account(s), "
        << unsigned_tx->Bytes().size() << " bytes" << std::endl;

    WalletAPI::TransactionSettler settler;
    WalletAPI::SettlementOutcome outcome =
        settler.Settle(std::move(unsigned_tx.data), session.GetKeypair(), session.GetConnection(),
                       [&out](WalletAPI::SettlementStage stage) {
                           out << "[" << WalletAPI::SettlementStageToString(stage) << "]" << std::endl;
                       });

    if (outcome.IsConfirmed()) {
        out << "Confirmed: " << outcome.signature << std::endl;
        return CLI_EXIT_SUCCESS;
    }

    err << WalletAPI::ErrorCodeToString(outcome.errorCode) << ": " << outcome.reason << std::endl;
    if (!outcome.signature.empty()) {
        err << "Signature: " << outcome.signature << std::endl;
    }
    return CLI_EXIT_FAILURE;
}

} // namespace

void PrintUsage(std::ostream& err) {
    err << "Usage:" << std::endl;
    err << "  soldesk address" << std::endl;
    err << "  soldesk balance <token> [tokenDecimals] [networkId]" << std::endl;
    err << "  soldesk settle <file>" << std::endl;
}

int RunCommand(const std::vector<std::string>& args,
               const WalletAPI::TradingSession& session,
               const Config::EnvironmentConfig& config,
               std::ostream& out,
               std::ostream& err) {
    if (args.empty()) {
        PrintUsage(err);
        return CLI_EXIT_USAGE;
    }

    const std::string& command = args[0];
    if (command == "address") {
        return RunAddress(session, config, out, err);
    }
    if (command == "balance") {
        return RunBalance(args, session, out, err);
    }
    if (command == "settle") {
        return RunSettle(args, session, out, err);
    }

    err << "Unknown command: " << command << std::endl;
    PrintUsage(err);
    return CLI_EXIT_USAGE;
}

} // namespace Frontend
