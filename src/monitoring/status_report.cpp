#include "monitoring/status_report.hpp"

namespace btcfi {

void to_json(nlohmann::json& j, const PoolSnapshot& s) {
    j = nlohmann::json{
        {"total_liquidity", s.total_liquidity},
        {"available_liquidity", s.available_liquidity},
        {"locked_collateral", s.locked_collateral},
        {"total_shares", s.total_shares},
        {"total_premium_collected", s.total_premium_collected},
        {"total_payout", s.total_payout},
        {"net_profit", s.net_profit()},
        {"active_options", s.active_options},
        {"provider_count", s.provider_count},
        {"utilization_rate", s.utilization_rate},
        {"net_delta", s.net_delta()}
    };
}

void to_json(nlohmann::json& j, const PoolRiskMetrics& m) {
    j = nlohmann::json{
        {"utilization_rate", m.utilization_rate},
        {"net_delta", m.net_delta},
        {"delta_ratio", m.delta_ratio},
        {"net_profit", m.net_profit},
        {"net_profit_btc", m.net_profit_btc}
    };
}

void to_json(nlohmann::json& j, const RegistryStats& s) {
    j = nlohmann::json{
        {"total", s.total},
        {"active", s.active},
        {"settled", s.settled},
        {"funded", s.funded},
        {"active_collateral", s.active_collateral},
        {"total_premium", s.total_premium}
    };
}

void to_json(nlohmann::json& j, const EngineStats& s) {
    j = nlohmann::json{
        {"total_requests", s.total_requests},
        {"pending", s.pending},
        {"proof_submitted", s.proof_submitted},
        {"validated", s.validated},
        {"executed", s.executed},
        {"failed", s.failed},
        {"proof_rejections", s.proof_rejections},
        {"total_paid_out", s.total_paid_out}
    };
}

void to_json(nlohmann::json& j, const PoolEvent& e) {
    j = nlohmann::json{
        {"type", pool_event_type_to_string(e.type)},
        {"reference", e.reference},
        {"amount", e.amount},
        {"block_height", e.block_height},
        {"timestamp_ms", e.timestamp_ms}
    };
    if (e.shares > 0) {
        j["shares"] = e.shares;
    }
    if (!e.recipient.empty()) {
        j["recipient"] = e.recipient;
    }
}

nlohmann::json build_status_report(const CollateralPool& pool,
                                   const ContractRegistry& registry,
                                   const SettlementEngine& engine) {
    nlohmann::json report;
    report["timestamp_ms"] = now_ms();
    report["network"] = network_to_string(registry.network());
    PoolSnapshot snapshot = pool.snapshot();
    report["pool"] = snapshot;
    report["risk"] = risk_metrics_of(snapshot);
    report["contracts"] = registry.stats();
    report["settlement"] = engine.stats();
    return report;
}

} // namespace btcfi
