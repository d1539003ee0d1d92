#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"
#include "bitcoin/script.hpp"
#include "contracts/script_builder.hpp"

namespace btcfi {

struct OptionTerms {
    OptionKind kind{OptionKind::CALL};
    Price strike_price{0};
    Amount quantity{0};          // Notional in sats
    BlockHeight expiry_height{0};
    Amount premium{0};
};

struct ContractKeys {
    XOnlyPubKey buyer{};
    XOnlyPubKey seller{};
    XOnlyPubKey verifier{};
};

/**
 * One written option. Owned by ContractRegistry; callers receive copies.
 */
struct OptionContract {
    std::string contract_id;
    std::string holder;
    OptionTerms terms;
    ContractKeys keys;

    // Derived at creation, immutable afterwards
    Amount collateral{0};
    Hash256 commitment{};
    std::string address;
    bitcoin::Script output_script;
    TaprootSpendInfo spend_info;

    // Set once the funding output is observed on chain
    std::optional<OutPoint> funding;
    Amount funding_value{0};

    ContractStatus status{ContractStatus::ACTIVE};
    int64_t created_at_ms{0};
    int64_t settled_at_ms{0};

    bool is_active() const { return status == ContractStatus::ACTIVE; }
    bool is_funded() const { return funding.has_value(); }
    bool is_expired(BlockHeight current_height) const { return terms.expiry_height <= current_height; }

    bool is_in_the_money(Price spot) const;
    Amount settlement_amount(Price spot) const;

    // Value held by the option output: observed funding value, else collateral + premium
    Amount output_value() const { return funding ? funding_value : collateral + terms.premium; }
};

// Call: the full quantity. Put: strike * quantity / reference_unit_price.
Amount compute_collateral(const OptionTerms& terms, Price reference_unit_price);

bool compute_in_the_money(OptionKind kind, Price strike, Price spot);

/**
 * Payout owed to the buyer at a given spot price, bounded by collateral.
 *   Call, spot > strike: (spot - strike) * quantity / spot
 *   Put,  spot < strike: (strike - spot) * quantity / strike
 */
Amount compute_settlement_amount(OptionKind kind, Price strike, Amount quantity,
                                 Amount collateral, Price spot);

/**
 * Binds a contract to the proof program and its parameters:
 * TaggedHash("BTCFi/OptionCommitment", program || id || kind || strike || quantity || expiry).
 */
Hash256 compute_commitment(const Hash256& program_hash, const std::string& contract_id,
                           const OptionTerms& terms);

} // namespace btcfi
