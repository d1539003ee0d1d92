#include "settlement/proof_generator.hpp"
#include "contracts/option_contract.hpp"
#include "bitcoin/serialize.hpp"
#include <spdlog/spdlog.h>

namespace btcfi {

LocalProofGenerator::LocalProofGenerator(const Hash256& program_hash)
    : program_hash_(program_hash) {}

std::optional<SettlementProof> LocalProofGenerator::generate(const ProofJob& job) {
    if (job.spot_price == 0) {
        spdlog::warn("Proof job for {} has no spot price", job.option_id);
        return std::nullopt;
    }

    SettlementProof proof;
    proof.option_id = job.option_id;
    proof.spot_price = job.spot_price;
    proof.is_itm = compute_in_the_money(job.kind, job.strike_price, job.spot_price);
    proof.settlement_amount = compute_settlement_amount(job.kind, job.strike_price, job.quantity,
                                                        job.collateral, job.spot_price);
    proof.commitment = job.commitment;
    proof.block_height = job.block_height;

    bitcoin::ByteWriter w;
    w.write_hash(program_hash_);
    w.write_u8(job.kind == OptionKind::CALL ? 0x00 : 0x01);
    w.write_u64_le(job.strike_price);
    w.write_u64_le(job.spot_price);
    w.write_u64_le(proof.settlement_amount);
    proof.proof_bytes = w.release();

    spdlog::debug("Local proof for {}: itm={}, amount={}", job.option_id, proof.is_itm,
                  proof.settlement_amount);
    return proof;
}

} // namespace btcfi
