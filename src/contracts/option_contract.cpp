#include "contracts/option_contract.hpp"
#include "bitcoin/serialize.hpp"
#include "utils/crypto.hpp"
#include "utils/math.hpp"
#include <algorithm>

namespace btcfi {

bool OptionContract::is_in_the_money(Price spot) const {
    return compute_in_the_money(terms.kind, terms.strike_price, spot);
}

Amount OptionContract::settlement_amount(Price spot) const {
    return compute_settlement_amount(terms.kind, terms.strike_price, terms.quantity,
                                     collateral, spot);
}

Amount compute_collateral(const OptionTerms& terms, Price reference_unit_price) {
    if (terms.kind == OptionKind::CALL) {
        return terms.quantity;
    }
    return mul_div(terms.strike_price, terms.quantity, reference_unit_price);
}

bool compute_in_the_money(OptionKind kind, Price strike, Price spot) {
    if (kind == OptionKind::CALL) {
        return spot > strike;
    }
    return spot < strike;
}

Amount compute_settlement_amount(OptionKind kind, Price strike, Amount quantity,
                                 Amount collateral, Price spot) {
    if (!compute_in_the_money(kind, strike, spot)) {
        return 0;
    }

    Amount intrinsic = 0;
    if (kind == OptionKind::CALL) {
        intrinsic = mul_div(spot - strike, quantity, spot);
    } else {
        intrinsic = mul_div(strike - spot, quantity, strike);
    }
    return std::min(collateral, intrinsic);
}

Hash256 compute_commitment(const Hash256& program_hash, const std::string& contract_id,
                           const OptionTerms& terms) {
    bitcoin::ByteWriter w;
    w.write_hash(program_hash);
    w.write_bytes(reinterpret_cast<const uint8_t*>(contract_id.data()), contract_id.size());
    w.write_u8(terms.kind == OptionKind::CALL ? 0x00 : 0x01);
    w.write_u64_le(terms.strike_price);
    w.write_u64_le(terms.quantity);
    w.write_u32_le(terms.expiry_height);
    return crypto::tagged_hash("BTCFi/OptionCommitment", w.data());
}

} // namespace btcfi
