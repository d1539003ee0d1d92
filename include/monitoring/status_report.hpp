#pragma once

#include <nlohmann/json.hpp>
#include "pool/collateral_pool.hpp"
#include "contracts/contract_registry.hpp"
#include "settlement/settlement_engine.hpp"

namespace btcfi {

// JSON serialization of the read-only management views
void to_json(nlohmann::json& j, const PoolSnapshot& s);
void to_json(nlohmann::json& j, const PoolRiskMetrics& m);
void to_json(nlohmann::json& j, const RegistryStats& s);
void to_json(nlohmann::json& j, const EngineStats& s);
void to_json(nlohmann::json& j, const PoolEvent& e);

/**
 * Point-in-time operational snapshot of pool, registry and settlement engine.
 * Each section is read under its own aggregate lock, so the sections are
 * individually consistent but not taken at one instant.
 */
nlohmann::json build_status_report(const CollateralPool& pool,
                                   const ContractRegistry& registry,
                                   const SettlementEngine& engine);

} // namespace btcfi
