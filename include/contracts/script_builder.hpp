#pragma once

#include <vector>
#include "common/types.hpp"
#include "common/result.hpp"
#include "bitcoin/script.hpp"

namespace btcfi {

// BIP342 tapscript leaf version
constexpr uint8_t TAPSCRIPT_LEAF_VERSION = 0xc0;

// nLockTime values at or above this are timestamps, not heights
constexpr BlockHeight LOCKTIME_THRESHOLD = 500000000;

/**
 * One script-path leaf and what is needed to reveal it.
 */
struct TaprootLeaf {
    bitcoin::Script script;
    Hash256 leaf_hash{};
    Bytes control_block;  // (leaf_version | parity) || internal key || sibling hash
};

/**
 * Data needed to later satisfy either leaf of an option output.
 */
struct TaprootSpendInfo {
    XOnlyPubKey internal_key{};
    Hash256 merkle_root{};
    bool output_parity{false};
    TaprootLeaf settlement;
    TaprootLeaf refund;
};

struct TaprootBuild {
    bitcoin::Script output_script;  // OP_1 <Q.x>
    XOnlyPubKey output_key{};
    TaprootSpendInfo spend_info;
};

/**
 * Builds the two-leaf taproot policy of an option contract.
 *
 * Key path: aggregate of buyer and seller keys (cooperative close).
 * Settlement leaf: after expiry, verifier signature plus the contract's commitment
 * preimage; the in-the-money flag then selects the buyer or the seller key.
 * Refund leaf: seller alone after expiry + grace period.
 */
class ScriptBuilder {
public:
    explicit ScriptBuilder(uint32_t refund_grace_period = 144);

    Result<TaprootBuild> build(const XOnlyPubKey& buyer_key,
                               const XOnlyPubKey& seller_key,
                               const XOnlyPubKey& verifier_key,
                               const Hash256& commitment,
                               BlockHeight expiry_height) const;

    static bitcoin::Script settlement_script(const XOnlyPubKey& buyer_key,
                                             const XOnlyPubKey& seller_key,
                                             const XOnlyPubKey& verifier_key,
                                             const Hash256& commitment,
                                             BlockHeight expiry_height);

    bitcoin::Script refund_script(const XOnlyPubKey& seller_key, BlockHeight expiry_height) const;

    uint32_t refund_grace_period() const { return refund_grace_period_; }

private:
    uint32_t refund_grace_period_;
};

// TapLeaf tagged hash of (leaf_version || compact_size(script) || script)
Hash256 tapleaf_hash(const bitcoin::Script& script, uint8_t leaf_version = TAPSCRIPT_LEAF_VERSION);

// TapBranch tagged hash over the lexicographically sorted pair
Hash256 tapbranch_hash(const Hash256& a, const Hash256& b);

/**
 * Witness stacks, bottom first, ending with the leaf script and control block.
 */
std::vector<Bytes> settlement_witness(const TaprootSpendInfo& info,
                                      const Bytes& branch_signature,
                                      bool in_the_money,
                                      const Bytes& verifier_signature,
                                      const Bytes& proof_bytes,
                                      const Hash256& commitment);

std::vector<Bytes> refund_witness(const TaprootSpendInfo& info, const Bytes& seller_signature);

} // namespace btcfi
