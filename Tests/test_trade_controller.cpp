#include "StubChainConnection.h"
#include "TestFixtures.h"
#include "TestUtils.h"
#include "TokenAccounts.h"
#include "TradeController.h"
#include "TradingSession.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace Frontend;
using WalletAPI::ErrorCode;
using WalletAPI::SettlementOutcome;
using WalletAPI::TradingSession;

namespace {

/**
 * Builds a one-signer transaction for the requesting wallet, or fails on demand
 */
class StubTransactionBuilder : public TransactionBuilder {
public:
    std::vector<TradeRequest> requests;
    std::optional<std::string> failWith;
    std::function<void()> duringBuild;

    WalletAPI::Result<SolanaService::UnsignedTransaction> Build(const TradeRequest& request) override {
        requests.push_back(request);
        if (duringBuild) {
            duringBuild();
        }
        if (failWith) {
            return WalletAPI::Result<SolanaService::UnsignedTransaction>(ErrorCode::BuildFailed, *failWith);
        }

        SolanaService::PublicKey signer{};
        SolanaService::DecodePublicKey(request.signer, signer);
        return SolanaService::UnsignedTransaction::FromBytes(
            TestFixtures::BuildUnsignedTransaction({signer}, {TestFixtures::KeyFromByte(0x09)}, true));
    }
};

struct Harness {
    StubChainConnection* chain = nullptr;
    TradingSession session;
    StubTransactionBuilder builder;
    int refreshCount = 0;
    std::vector<std::string> messages;

    explicit Harness(bool withKey = true) {
        auto stub = std::make_unique<StubChainConnection>();
        chain = stub.get();
        std::optional<KeyMaterial::Keypair> keypair;
        if (withKey) {
            keypair = TestFixtures::RfcKeypair();
        }
        session = TradingSession(std::move(keypair), std::move(stub));
    }

    std::unique_ptr<TradeController> controller() {
        return std::make_unique<TradeController>(session, builder, [this]() { ++refreshCount; },
                                                 std::chrono::milliseconds(0));
    }

    ProgressNotifier notifier() {
        return [this](const std::string& message) { messages.push_back(message); };
    }
};

} // namespace

static bool testSuccessfulTrade() {
    TEST_START("A confirmed trade reports progress and refreshes balances once");

    Harness harness;
    auto controller = harness.controller();
    SettlementOutcome outcome = controller->ExecuteTrade(TradeDirection::Buy, 0.5, harness.notifier());

    TEST_ASSERT(outcome.IsConfirmed(), "Trade should confirm: " + outcome.reason);
    TEST_ASSERT(harness.builder.requests.size() == 1, "Builder called once");
    TEST_ASSERT(harness.builder.requests[0].signer == TestFixtures::RFC8032_WALLET_ADDRESS,
                "Builder told which wallet signs");
    TEST_ASSERT(harness.builder.requests[0].direction == TradeDirection::Buy, "Direction forwarded");
    TEST_ASSERT(harness.builder.requests[0].value == 0.5, "Value forwarded");

    std::vector<std::string> expected = {
        "Submitting trade request...",
        "Signing transaction...",
        "Sending transaction...",
        "Confirming transaction...",
        "Trade successful! TX: 5VERv8NM...",
    };
    TEST_ASSERT(harness.messages == expected, "Progress messages in order");
    TEST_ASSERT(harness.refreshCount == 1, "Balances refreshed exactly once");
    TEST_ASSERT(!controller->IsSettling(), "In-flight flag released");

    TEST_PASS();
}

static bool testDisabledTrading() {
    TEST_START("Without a keypair the trade is rejected before the builder runs");

    Harness harness(false);
    auto controller = harness.controller();
    SettlementOutcome outcome = controller->ExecuteTrade(TradeDirection::Sell, 50.0, harness.notifier());

    TEST_ASSERT(outcome.errorCode == ErrorCode::WalletNotInitialized, "WalletNotInitialized expected");
    TEST_ASSERT(outcome.reason.find("SOLDESK_PRIVATE_KEY") != std::string::npos, "Reason names the configuration");
    TEST_ASSERT(harness.builder.requests.empty(), "Builder not called");
    TEST_ASSERT(harness.chain->networkCalls() == 0, "No chain calls");
    TEST_ASSERT(harness.refreshCount == 0, "No refresh");

    TEST_PASS();
}

static bool testBuildFailure() {
    TEST_START("A builder failure is terminal and nothing is signed");

    Harness harness;
    harness.builder.failWith = "Insufficient liquidity";
    auto controller = harness.controller();
    SettlementOutcome outcome = controller->ExecuteTrade(TradeDirection::Buy, 1.0, harness.notifier());

    TEST_ASSERT(outcome.errorCode == ErrorCode::BuildFailed, "BuildFailed expected");
    TEST_ASSERT(outcome.reason == "Build failed: Insufficient liquidity", "Builder reason kept");
    TEST_ASSERT(harness.chain->sendTransactionCalls == 0, "Nothing submitted");
    TEST_ASSERT(harness.refreshCount == 0, "No refresh after failure");
    TEST_ASSERT(harness.messages.back() == outcome.reason, "Failure shown to the operator");

    TEST_PASS();
}

static bool testInvalidAmounts() {
    TEST_START("Non-positive amounts and sells above 100 percent are refused");

    Harness harness;
    auto controller = harness.controller();

    TEST_ASSERT(controller->ExecuteTrade(TradeDirection::Buy, 0.0).errorCode == ErrorCode::BuildFailed,
                "Zero buy refused");
    TEST_ASSERT(controller->ExecuteTrade(TradeDirection::Buy, -1.0).errorCode == ErrorCode::BuildFailed,
                "Negative buy refused");
    TEST_ASSERT(controller->ExecuteTrade(TradeDirection::Sell, 100.5).errorCode == ErrorCode::BuildFailed,
                "Sell above 100 percent refused");
    TEST_ASSERT(harness.builder.requests.empty(), "Builder never called");

    TEST_ASSERT(controller->ExecuteTrade(TradeDirection::Sell, 100.0).IsConfirmed(), "Selling everything allowed");

    TEST_PASS();
}

static bool testSingleSettlementInFlight() {
    TEST_START("A second trade while one is settling is rejected");

    Harness harness;
    auto controller = harness.controller();
    std::optional<SettlementOutcome> nested;
    harness.builder.duringBuild = [&]() {
        if (!nested) {
            nested = controller->ExecuteTrade(TradeDirection::Buy, 0.1);
        }
    };

    SettlementOutcome outcome = controller->ExecuteTrade(TradeDirection::Buy, 0.2);
    TEST_ASSERT(outcome.IsConfirmed(), "First trade confirms");
    TEST_ASSERT(nested.has_value(), "Nested trade attempted");
    TEST_ASSERT(nested->errorCode == ErrorCode::SettlementInProgress, "Nested trade rejected");
    TEST_ASSERT(harness.builder.requests.size() == 1, "Only the first trade reached the builder");
    TEST_ASSERT(harness.chain->sendTransactionCalls == 1, "Only one submission");
    TEST_ASSERT(!controller->IsSettling(), "Flag released afterwards");

    TEST_PASS();
}

static bool testFailedTradeMessage() {
    TEST_START("An on-chain failure shows 'Trade failed' and skips the refresh");

    Harness harness;
    SolanaService::ConfirmationResult failed;
    failed.executionError = "{\"InstructionError\":[1,\"InsufficientFunds\"]}";
    harness.chain->confirmResult = WalletAPI::Result<SolanaService::ConfirmationResult>(failed);

    auto controller = harness.controller();
    SettlementOutcome outcome = controller->ExecuteTrade(TradeDirection::Sell, 25.0, harness.notifier());

    TEST_ASSERT(outcome.errorCode == ErrorCode::TradeFailed, "TradeFailed expected");
    TEST_ASSERT(harness.messages.back() == "Trade failed", "Operator sees the fixed message");
    TEST_ASSERT(harness.refreshCount == 0, "No refresh");

    TEST_PASS();
}

static bool testDecodeThenResolveBalances() {
    TEST_START("A JSON array key resolves balances through its associated token account");

    auto decoded = KeyMaterial::Decode(TestFixtures::SequentialSecretJson());
    TEST_ASSERT(decoded.success, "Sequential JSON secret decodes: " + decoded.errorMessage);
    TEST_ASSERT(decoded->SourceFormat() == KeyMaterial::KeyFormat::JsonArray, "Decoded as JSON array");

    auto stub = std::make_unique<StubChainConnection>();
    StubChainConnection* chain = stub.get();
    chain->balanceResult = WalletAPI::Result<WalletAPI::AtomicAmount>(WalletAPI::AtomicAmount::FromUInt64(1000000000));
    chain->accounts[TestFixtures::WRAPPED_SOL_MINT] =
        StubChainConnection::MintOwnedBy(SolanaService::TOKEN_PROGRAM_ID);

    TradingSession session(std::optional<KeyMaterial::Keypair>(std::move(decoded.data)), std::move(stub));
    TEST_ASSERT(session.WalletAddress() == TestFixtures::SEQUENTIAL_WALLET_ADDRESS, "Wallet from the public half");

    WalletAPI::BalanceSnapshot snapshot = session.RefreshBalances(TestFixtures::WRAPPED_SOL_MINT, 9);
    TEST_ASSERT(snapshot.nativeBalance == "1.0", "One SOL");
    TEST_ASSERT(snapshot.tokenBalance == "0.0", "Missing token account is zero");
    TEST_ASSERT(chain->tokenAccountsQueried.size() == 1 &&
                    chain->tokenAccountsQueried[0] == TestFixtures::SEQUENTIAL_WSOL_TOKEN_ACCOUNT,
                "Derived associated token account queried");

    TEST_PASS();
}

static bool testSessionWithoutKeySkipsRefresh() {
    TEST_START("Balance refresh without a wallet makes no chain calls");

    auto stub = std::make_unique<StubChainConnection>();
    StubChainConnection* chain = stub.get();
    TradingSession session(std::nullopt, std::move(stub));

    TEST_ASSERT(!session.IsTradingEnabled(), "Trading disabled");
    WalletAPI::BalanceSnapshot snapshot = session.RefreshBalances(TestFixtures::WRAPPED_SOL_MINT, 9);
    TEST_ASSERT(snapshot.nativeBalance == "0.0" && snapshot.tokenBalance == "0.0", "Zero balances");
    TEST_ASSERT(chain->networkCalls() == 0, "No chain calls");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("Trade Controller Tests");
    if (!TestUtils::initializeTestEnvironment()) {
        return 1;
    }

    testSuccessfulTrade();
    testDisabledTrading();
    testBuildFailure();
    testInvalidAmounts();
    testSingleSettlementInFlight();
    testFailedTradeMessage();
    testDecodeThenResolveBalances();
    testSessionWithoutKeySkipsRefresh();

    return TestUtils::finishTestSuite("Trade Controller");
}
