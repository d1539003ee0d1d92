#pragma once

#include <string>
#include "common/types.hpp"

namespace btcfi {

enum class SignerRole {
    VERIFIER,
    BUYER,
    SELLER
};

inline std::string signer_role_to_string(SignerRole r) {
    switch (r) {
        case SignerRole::VERIFIER: return "VERIFIER";
        case SignerRole::BUYER: return "BUYER";
        case SignerRole::SELLER: return "SELLER";
    }
    return "UNKNOWN";
}

/**
 * Produces BIP340 signatures over a sighash on behalf of a contract party.
 * Key custody lives outside this process; an empty result means the role
 * could not sign.
 */
class SettlementSigner {
public:
    virtual ~SettlementSigner() = default;

    virtual Bytes sign(SignerRole role, const std::string& contract_id, const Hash256& sighash) = 0;
};

} // namespace btcfi
