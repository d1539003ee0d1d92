#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"

namespace btcfi {

/**
 * Result of the off-chain settlement computation. Untrusted: every field is
 * checked against the engine's own recomputation before any funds move.
 */
struct SettlementProof {
    std::string option_id;
    Price spot_price{0};
    bool is_itm{false};
    Amount settlement_amount{0};
    Bytes proof_bytes;
    Hash256 commitment{};
    BlockHeight block_height{0};
};

struct ProofJob {
    std::string option_id;
    OptionKind kind{OptionKind::CALL};
    Price strike_price{0};
    Price spot_price{0};
    Amount quantity{0};
    Amount collateral{0};
    Hash256 commitment{};
    BlockHeight block_height{0};
};

/**
 * Off-chain proof engine. May block; never called with an engine lock held.
 */
class ProofGenerator {
public:
    virtual ~ProofGenerator() = default;

    virtual std::optional<SettlementProof> generate(const ProofJob& job) = 0;
};

/**
 * In-process reference computation of the settlement program.
 * Proof bytes: program hash || kind(1) || strike(8 LE) || spot(8 LE) || amount(8 LE).
 */
class LocalProofGenerator : public ProofGenerator {
public:
    explicit LocalProofGenerator(const Hash256& program_hash);

    std::optional<SettlementProof> generate(const ProofJob& job) override;

private:
    Hash256 program_hash_;
};

} // namespace btcfi
