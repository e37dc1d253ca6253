#include "CliCommands.h"
#include "StubChainConnection.h"
#include "TestFixtures.h"
#include "TestUtils.h"
#include "TokenAccounts.h"

#include <cstdio>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using Frontend::CLI_EXIT_FAILURE;
using Frontend::CLI_EXIT_SUCCESS;
using Frontend::CLI_EXIT_USAGE;
using Frontend::RunCommand;

namespace {

/**
 * Session over a scripted chain plus captured output streams
 */
struct CliHarness {
    StubChainConnection* chain = nullptr;
    WalletAPI::TradingSession session;
    Config::EnvironmentConfig config;
    std::ostringstream out;
    std::ostringstream err;

    explicit CliHarness(bool withKey = true) {
        auto stub = std::make_unique<StubChainConnection>();
        chain = stub.get();
        std::optional<KeyMaterial::Keypair> keypair;
        if (withKey) {
            keypair = TestFixtures::RfcKeypair();
            config.privateKey = TestFixtures::RFC8032_SECRET_HEX;
        }
        config.rpcUrl = "https://rpc.example";
        session = WalletAPI::TradingSession(std::move(keypair), std::move(stub));
    }

    int run(const std::vector<std::string>& args) { return RunCommand(args, session, config, out, err); }
};

std::string WriteTransactionFile(const std::string& name, const std::string& contents) {
    std::ofstream file(name, std::ios::trunc);
    file << contents;
    return name;
}

} // namespace

static bool testUsageErrors() {
    TEST_START("Missing or unknown commands are usage errors");

    CliHarness harness;
    TEST_ASSERT(harness.run({}) == CLI_EXIT_USAGE, "No command");
    TEST_ASSERT(harness.run({"withdraw"}) == CLI_EXIT_USAGE, "Unknown command");
    TEST_ASSERT(harness.err.str().find("Unknown command: withdraw") != std::string::npos, "Command named");
    TEST_ASSERT(harness.err.str().find("soldesk settle <file>") != std::string::npos, "Usage printed");
    TEST_ASSERT(harness.run({"balance"}) == CLI_EXIT_USAGE, "balance needs a token");
    TEST_ASSERT(harness.run({"settle"}) == CLI_EXIT_USAGE, "settle needs a file");
    TEST_ASSERT(harness.chain->networkCalls() == 0, "Usage errors never reach the chain");

    TEST_PASS();
}

static bool testAddressCommand() {
    TEST_START("address prints the wallet, key format and panel availability");

    CliHarness harness;
    TEST_ASSERT(harness.run({"address"}) == CLI_EXIT_SUCCESS, "address succeeds");
    std::string printed = harness.out.str();
    TEST_ASSERT(printed.find(std::string("Address: ") + TestFixtures::RFC8032_WALLET_ADDRESS) != std::string::npos,
                "Wallet address printed");
    TEST_ASSERT(printed.find("Key format: hex") != std::string::npos, "Source format printed");
    TEST_ASSERT(printed.find("Trading: enabled") != std::string::npos, "Trading enabled");
    TEST_ASSERT(printed.find("Trading panel: disabled") != std::string::npos, "Panel needs a referral account");

    CliHarness with_referral;
    with_referral.config.referralAccount = TestFixtures::SEQUENTIAL_WALLET_ADDRESS;
    TEST_ASSERT(with_referral.run({"address"}) == CLI_EXIT_SUCCESS, "address succeeds");
    TEST_ASSERT(with_referral.out.str().find("Trading panel: enabled") != std::string::npos, "Panel enabled");

    CliHarness no_key(false);
    TEST_ASSERT(no_key.run({"address"}) == CLI_EXIT_FAILURE, "No key configured");
    TEST_ASSERT(no_key.err.str().find("SOLDESK_PRIVATE_KEY is not set") != std::string::npos, "Reason printed");

    TEST_PASS();
}

static bool testBalanceCommand() {
    TEST_START("balance parses its arguments and prints both balances");

    CliHarness harness;
    harness.chain->balanceResult =
        WalletAPI::Result<WalletAPI::AtomicAmount>(WalletAPI::AtomicAmount::FromUInt64(1000000000));
    harness.chain->accounts[TestFixtures::WRAPPED_SOL_MINT] =
        StubChainConnection::MintOwnedBy(SolanaService::TOKEN_PROGRAM_ID);
    harness.chain->tokenBalances[TestFixtures::RFC8032_WSOL_TOKEN_ACCOUNT] =
        *WalletAPI::AtomicAmount::FromString("2500000");

    TEST_ASSERT(harness.run({"balance", TestFixtures::WRAPPED_SOL_MINT, "6"}) == CLI_EXIT_SUCCESS,
                "balance succeeds");
    std::string printed = harness.out.str();
    TEST_ASSERT(printed.find("SOL:     1.0 (1000000000 lamports)") != std::string::npos, "Native balance");
    TEST_ASSERT(printed.find("Token:   2.5 (2500000 atomic, base58, resolved)") != std::string::npos,
                "Token balance with decimals from the command line");

    TEST_ASSERT(harness.run({"balance", TestFixtures::WRAPPED_SOL_MINT, "six"}) == CLI_EXIT_USAGE,
                "Non-numeric decimals rejected");
    TEST_ASSERT(harness.run({"balance", TestFixtures::WRAPPED_SOL_MINT, "6", "101x"}) == CLI_EXIT_USAGE,
                "Trailing characters in the network id rejected");

    int calls_before = harness.chain->networkCalls();
    TEST_ASSERT(harness.run({"balance", TestFixtures::WRAPPED_SOL_MINT, "6", "1"}) == CLI_EXIT_SUCCESS,
                "Other networks still succeed");
    TEST_ASSERT(harness.chain->networkCalls() == calls_before, "Other networks are not queried");

    CliHarness no_key(false);
    TEST_ASSERT(no_key.run({"balance", TestFixtures::WRAPPED_SOL_MINT}) == CLI_EXIT_FAILURE,
                "Balance needs an initialized wallet");

    TEST_PASS();
}

static bool testSettleCommand() {
    TEST_START("settle reads a base64 transaction and reports the outcome");

    KeyMaterial::Keypair keypair = TestFixtures::RfcKeypair();
    std::vector<uint8_t> wire = TestFixtures::BuildUnsignedTransaction(
        {keypair.PublicKey()}, {TestFixtures::KeyFromByte(0x05)}, true);
    std::string path = WriteTransactionFile("soldesk_cli_settle.b64", Crypto::B64Encode(wire) + "\n");

    CliHarness harness;
    TEST_ASSERT(harness.run({"settle", path}) == CLI_EXIT_SUCCESS, "Settlement confirms");
    std::string printed = harness.out.str();
    TEST_ASSERT(printed.find("Transaction: v0, 1 signer(s), 2 account(s), " + std::to_string(wire.size()) +
                             " bytes") != std::string::npos,
                "Transaction summary printed");
    TEST_ASSERT(printed.find("[signing]") < printed.find("[sending]") &&
                    printed.find("[sending]") < printed.find("[confirming]"),
                "Stages printed in order");
    TEST_ASSERT(printed.find("Confirmed: 5VERv8NM") != std::string::npos, "Signature printed");

    CliHarness unconfirmed;
    unconfirmed.chain->confirmResult = WalletAPI::Result<SolanaService::ConfirmationResult>(
        WalletAPI::ErrorCode::ConfirmationFailed, "Blockhash expired at block height 1001 (last valid 1000)");
    TEST_ASSERT(unconfirmed.run({"settle", path}) == CLI_EXIT_FAILURE, "Unconfirmed settlement fails");
    TEST_ASSERT(unconfirmed.err.str().find("ConfirmationFailed: ") == 0, "Error code printed first");
    TEST_ASSERT(unconfirmed.err.str().find("Signature: 5VERv8NM") != std::string::npos,
                "Signature printed for lookup");

    std::string garbage = WriteTransactionFile("soldesk_cli_garbage.b64", "AAAA");
    CliHarness invalid;
    TEST_ASSERT(invalid.run({"settle", garbage}) == CLI_EXIT_FAILURE, "Unparseable transaction fails");
    TEST_ASSERT(invalid.err.str().find("Invalid transaction") != std::string::npos, "Parse error printed");
    TEST_ASSERT(invalid.chain->networkCalls() == 0, "Nothing sent");

    CliHarness missing;
    TEST_ASSERT(missing.run({"settle", "does_not_exist.b64"}) == CLI_EXIT_FAILURE, "Missing file fails");
    TEST_ASSERT(missing.err.str().find("Cannot open does_not_exist.b64") != std::string::npos, "Path printed");

    std::remove(path.c_str());
    std::remove(garbage.c_str());
    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("Command Line Tests");
    if (!TestUtils::initializeTestEnvironment()) {
        return 1;
    }

    testUsageErrors();
    testAddressCommand();
    testBalanceCommand();
    testSettleCommand();

    return TestUtils::finishTestSuite("Command Line");
}
