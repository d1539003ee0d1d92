#pragma once

#include <optional>
#include "common/types.hpp"

namespace btcfi {

struct PricingInput {
    OptionKind kind{OptionKind::CALL};
    Price strike_price{0};
    Price spot_price{0};
    Amount quantity{0};
    uint32_t blocks_to_expiry{0};
};

struct PremiumQuote {
    Amount premium{0};
    double implied_volatility{0.0};
};

/**
 * Premium source for new contracts (Black-Scholes or any other model).
 * Returns nullopt when the model cannot price the input.
 */
class PricingEngine {
public:
    virtual ~PricingEngine() = default;

    virtual std::optional<PremiumQuote> quote(const PricingInput& input) const = 0;
};

} // namespace btcfi
