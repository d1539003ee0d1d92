#pragma once

#include <map>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "common/result.hpp"
#include "config/config.hpp"
#include "contracts/option_contract.hpp"
#include "contracts/script_builder.hpp"
#include "pool/collateral_pool.hpp"
#include "pricing/pricing_engine.hpp"
#include "storage/repository.hpp"

namespace btcfi {

struct CreateOptionRequest {
    std::string contract_id;    // Generated as OPT-<16 hex> when empty
    std::string holder;         // Defaults to the buyer key hex
    OptionTerms terms;
    ContractKeys keys;
};

struct RegistryStats {
    size_t total{0};
    size_t active{0};
    size_t settled{0};
    size_t funded{0};
    Amount active_collateral{0};
    Amount total_premium{0};
};

/**
 * Owns every OptionContract. Validates new options, derives their taproot
 * output, and secures collateral + premium in the pool before a contract
 * becomes visible. Lock order: registry, then pool.
 */
class ContractRegistry {
public:
    ContractRegistry(const ContractLimits& limits,
                     Network network,
                     CollateralPool& pool,
                     const ScriptBuilder& script_builder,
                     std::unique_ptr<Repository<OptionContract>> store = nullptr);

    Result<std::string> create(const CreateOptionRequest& request, BlockHeight current_height);

    // Premium taken from the pricing engine instead of the request
    Result<std::string> create_quoted(const CreateOptionRequest& request,
                                      Price spot_price,
                                      BlockHeight current_height,
                                      const PricingEngine& pricing);

    std::optional<OptionContract> get(const std::string& contract_id) const;
    std::vector<OptionContract> by_holder(const std::string& holder) const;
    std::vector<OptionContract> get_expired(BlockHeight current_height) const;
    std::vector<OptionContract> list() const;

    Status record_funding(const std::string& contract_id, const OutPoint& outpoint, Amount value);

    // Single ACTIVE -> SETTLED edge
    Status mark_settled(const std::string& contract_id);

    RegistryStats stats() const;

    // Checks terms against the configured limits, in validation order
    Status validate_terms(const OptionTerms& terms, BlockHeight current_height) const;

    const ContractLimits& limits() const { return limits_; }
    Network network() const { return network_; }

private:
    ContractLimits limits_;
    Network network_;
    Hash256 program_hash_{};
    CollateralPool& pool_;
    const ScriptBuilder& script_builder_;
    std::unique_ptr<Repository<OptionContract>> store_;

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> by_holder_;
};

} // namespace btcfi
