#include "contracts/script_builder.hpp"
#include "bitcoin/keys.hpp"
#include "bitcoin/serialize.hpp"
#include "utils/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace btcfi {

using bitcoin::Script;

namespace {

Bytes make_control_block(const XOnlyPubKey& internal_key, bool parity, const Hash256& sibling) {
    Bytes cb;
    cb.reserve(1 + 32 + 32);
    cb.push_back(static_cast<uint8_t>(TAPSCRIPT_LEAF_VERSION | (parity ? 1 : 0)));
    cb.insert(cb.end(), internal_key.begin(), internal_key.end());
    cb.insert(cb.end(), sibling.begin(), sibling.end());
    return cb;
}

Result<TaprootBuild> construction_failure(const std::string& why) {
    spdlog::error("Taproot construction failed: {}", why);
    return Result<TaprootBuild>::failure(ErrorCode::TAPROOT_CONSTRUCTION_FAILED, why);
}

} // namespace

ScriptBuilder::ScriptBuilder(uint32_t refund_grace_period)
    : refund_grace_period_(refund_grace_period) {}

Script ScriptBuilder::settlement_script(const XOnlyPubKey& buyer_key,
                                        const XOnlyPubKey& seller_key,
                                        const XOnlyPubKey& verifier_key,
                                        const Hash256& commitment,
                                        BlockHeight expiry_height) {
    Script script;

    // Absolute time-lock at expiry
    script.push_int(expiry_height);
    script.op(bitcoin::OP_CHECKLOCKTIMEVERIFY);
    script.op(bitcoin::OP_DROP);

    // Commitment preimage must hash to the precommitted value
    script.op(bitcoin::OP_SHA256);
    script.push_data(crypto::sha256(commitment.data(), commitment.size()));
    script.op(bitcoin::OP_EQUALVERIFY);

    // Proof bytes are carried for the verifier, not interpreted on chain
    script.op(bitcoin::OP_DROP);

    script.push_data(verifier_key);
    script.op(bitcoin::OP_CHECKSIGVERIFY);

    // ITM flag selects the claimant
    script.op(bitcoin::OP_IF);
    script.push_data(buyer_key);
    script.op(bitcoin::OP_ELSE);
    script.push_data(seller_key);
    script.op(bitcoin::OP_ENDIF);
    script.op(bitcoin::OP_CHECKSIG);

    return script;
}

Script ScriptBuilder::refund_script(const XOnlyPubKey& seller_key, BlockHeight expiry_height) const {
    Script script;
    script.push_int(static_cast<int64_t>(expiry_height) + refund_grace_period_);
    script.op(bitcoin::OP_CHECKLOCKTIMEVERIFY);
    script.op(bitcoin::OP_DROP);
    script.push_data(seller_key);
    script.op(bitcoin::OP_CHECKSIG);
    return script;
}

Result<TaprootBuild> ScriptBuilder::build(const XOnlyPubKey& buyer_key,
                                          const XOnlyPubKey& seller_key,
                                          const XOnlyPubKey& verifier_key,
                                          const Hash256& commitment,
                                          BlockHeight expiry_height) const {
    if (expiry_height == 0 ||
        static_cast<uint64_t>(expiry_height) + refund_grace_period_ >= LOCKTIME_THRESHOLD) {
        return construction_failure("expiry height out of block-height locktime range");
    }
    if (!bitcoin::is_valid_xonly(buyer_key)) {
        return construction_failure("buyer key is not a valid x-only public key");
    }
    if (!bitcoin::is_valid_xonly(seller_key)) {
        return construction_failure("seller key is not a valid x-only public key");
    }
    if (!bitcoin::is_valid_xonly(verifier_key)) {
        return construction_failure("verifier key is not a valid x-only public key");
    }

    auto internal_key = bitcoin::aggregate_keys({buyer_key, seller_key});
    if (!internal_key) {
        return construction_failure("key aggregation produced no valid point");
    }

    TaprootBuild result;
    TaprootSpendInfo& info = result.spend_info;
    info.internal_key = *internal_key;

    info.settlement.script = settlement_script(buyer_key, seller_key, verifier_key,
                                               commitment, expiry_height);
    info.refund.script = refund_script(seller_key, expiry_height);
    info.settlement.leaf_hash = tapleaf_hash(info.settlement.script);
    info.refund.leaf_hash = tapleaf_hash(info.refund.script);
    info.merkle_root = tapbranch_hash(info.settlement.leaf_hash, info.refund.leaf_hash);

    auto tweaked = bitcoin::taproot_tweak(info.internal_key, info.merkle_root);
    if (!tweaked) {
        return construction_failure("taproot tweak out of range");
    }

    info.output_parity = tweaked->parity;
    info.settlement.control_block = make_control_block(info.internal_key, info.output_parity,
                                                       info.refund.leaf_hash);
    info.refund.control_block = make_control_block(info.internal_key, info.output_parity,
                                                   info.settlement.leaf_hash);

    result.output_key = tweaked->output_key;
    result.output_script = bitcoin::witness_program_script(
        1, Bytes(tweaked->output_key.begin(), tweaked->output_key.end()));

    spdlog::debug("Built taproot output {} (expiry {}, refund after {})",
                  crypto::hex_encode(result.output_key), expiry_height,
                  expiry_height + refund_grace_period_);

    return Result<TaprootBuild>::success(std::move(result));
}

Hash256 tapleaf_hash(const Script& script, uint8_t leaf_version) {
    bitcoin::ByteWriter w;
    w.write_u8(leaf_version);
    w.write_var_bytes(script.bytes());
    return crypto::tagged_hash("TapLeaf", w.data());
}

Hash256 tapbranch_hash(const Hash256& a, const Hash256& b) {
    const Hash256& lo = std::min(a, b);
    const Hash256& hi = std::max(a, b);
    Bytes msg(lo.begin(), lo.end());
    msg.insert(msg.end(), hi.begin(), hi.end());
    return crypto::tagged_hash("TapBranch", msg);
}

std::vector<Bytes> settlement_witness(const TaprootSpendInfo& info,
                                      const Bytes& branch_signature,
                                      bool in_the_money,
                                      const Bytes& verifier_signature,
                                      const Bytes& proof_bytes,
                                      const Hash256& commitment) {
    std::vector<Bytes> stack;
    stack.reserve(7);
    stack.push_back(branch_signature);
    // MINIMALIF: true is exactly 0x01, false is the empty vector
    stack.push_back(in_the_money ? Bytes{0x01} : Bytes{});
    stack.push_back(verifier_signature);
    stack.push_back(proof_bytes);
    stack.emplace_back(commitment.begin(), commitment.end());
    stack.push_back(info.settlement.script.bytes());
    stack.push_back(info.settlement.control_block);
    return stack;
}

std::vector<Bytes> refund_witness(const TaprootSpendInfo& info, const Bytes& seller_signature) {
    return {seller_signature, info.refund.script.bytes(), info.refund.control_block};
}

} // namespace btcfi
