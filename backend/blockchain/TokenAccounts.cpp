#include "TokenAccounts.h"
#include "Logger.h"

#include <cstring>

namespace SolanaService {

namespace {

const char PDA_MARKER[] = "ProgramDerivedAddress";

} // namespace

bool DecodePublicKey(const std::string& address, PublicKey& out) {
    std::vector<uint8_t> bytes;
    if (!Crypto::DecodeBase58(address, bytes) || bytes.size() != out.size()) {
        return false;
    }
    std::memcpy(out.data(), bytes.data(), out.size());
    return true;
}

std::string EncodePublicKey(const PublicKey& key) {
    return Crypto::EncodeBase58(key.data(), key.size());
}

namespace TokenAccounts {

std::optional<bool> IsOnCurve(const PublicKey& key) {
    bool on_curve = false;
    if (!Crypto::Ed25519_IsOnCurve(key, on_curve)) {
        return std::nullopt;
    }
    return on_curve;
}

std::optional<PublicKey> CreateProgramAddress(const std::vector<std::vector<uint8_t>>& seeds,
                                              const PublicKey& programId) {
    if (seeds.size() > MAX_SEEDS) {
        return std::nullopt;
    }

    std::vector<uint8_t> buffer;
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LENGTH) {
            return std::nullopt;
        }
        buffer.insert(buffer.end(), seed.begin(), seed.end());
    }
    buffer.insert(buffer.end(), programId.begin(), programId.end());
    buffer.insert(buffer.end(), PDA_MARKER, PDA_MARKER + sizeof(PDA_MARKER) - 1);

    PublicKey candidate{};
    if (!Crypto::SHA256(buffer.data(), buffer.size(), candidate)) {
        return std::nullopt;
    }

    auto on_curve = IsOnCurve(candidate);
    if (!on_curve.has_value() || *on_curve) {
        return std::nullopt;
    }
    return candidate;
}

std::optional<ProgramAddress> FindProgramAddress(const std::vector<std::vector<uint8_t>>& seeds,
                                                 const PublicKey& programId) {
    std::vector<std::vector<uint8_t>> seeds_with_bump(seeds);
    seeds_with_bump.push_back({0});

    for (int bump = 255; bump >= 0; --bump) {
        seeds_with_bump.back()[0] = static_cast<uint8_t>(bump);
        auto address = CreateProgramAddress(seeds_with_bump, programId);
        if (address.has_value()) {
            return ProgramAddress{*address, static_cast<uint8_t>(bump)};
        }
    }

    SOLDESK_LOG_ERROR("TokenAccounts", "No viable bump seed for program address",
                      "Program: " + EncodePublicKey(programId));
    return std::nullopt;
}

std::optional<PublicKey> GetAssociatedTokenAddress(const PublicKey& owner, const PublicKey& mint,
                                                   const PublicKey& tokenProgram) {
    PublicKey ata_program{};
    if (!DecodePublicKey(ASSOCIATED_TOKEN_PROGRAM_ID, ata_program)) {
        return std::nullopt;
    }

    std::vector<std::vector<uint8_t>> seeds = {
        std::vector<uint8_t>(owner.begin(), owner.end()),
        std::vector<uint8_t>(tokenProgram.begin(), tokenProgram.end()),
        std::vector<uint8_t>(mint.begin(), mint.end()),
    };

    auto derived = FindProgramAddress(seeds, ata_program);
    if (!derived.has_value()) {
        return std::nullopt;
    }
    return derived->address;
}

bool IsTokenProgram(const std::string& programId) {
    return programId == TOKEN_PROGRAM_ID || programId == TOKEN_2022_PROGRAM_ID;
}

} // namespace TokenAccounts
} // namespace SolanaService
