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
#include "storage/repository.hpp"

namespace btcfi {

struct LiquidityProvider {
    std::string provider_id;
    Amount deposited_amount{0};   // Cost basis still invested
    uint64_t shares{0};
    int64_t last_update_ms{0};
};

enum class PoolEventType {
    DEPOSIT,
    WITHDRAWAL,
    PREMIUM_COLLECTED,
    COLLATERAL_LOCKED,
    COLLATERAL_RELEASED,
    SETTLEMENT_PAYOUT
};

inline std::string pool_event_type_to_string(PoolEventType t) {
    switch (t) {
        case PoolEventType::DEPOSIT: return "DEPOSIT";
        case PoolEventType::WITHDRAWAL: return "WITHDRAWAL";
        case PoolEventType::PREMIUM_COLLECTED: return "PREMIUM_COLLECTED";
        case PoolEventType::COLLATERAL_LOCKED: return "COLLATERAL_LOCKED";
        case PoolEventType::COLLATERAL_RELEASED: return "COLLATERAL_RELEASED";
        case PoolEventType::SETTLEMENT_PAYOUT: return "SETTLEMENT_PAYOUT";
    }
    return "UNKNOWN";
}

struct PoolEvent {
    PoolEventType type{PoolEventType::DEPOSIT};
    std::string reference;    // Provider id or contract id
    Amount amount{0};
    uint64_t shares{0};       // Minted or burned, deposits and withdrawals only
    std::string recipient;    // Settlement payouts only
    BlockHeight block_height{0};
    int64_t timestamp_ms{0};
};

struct PoolSnapshot {
    Amount total_liquidity{0};
    Amount available_liquidity{0};
    Amount locked_collateral{0};
    uint64_t total_shares{0};
    Amount total_premium_collected{0};
    Amount total_payout{0};
    uint32_t active_options{0};
    size_t provider_count{0};
    double utilization_rate{0.0};
    double total_call_delta{0.0};
    double total_put_delta{0.0};

    // Premium earned minus payouts made
    int64_t net_profit() const {
        return static_cast<int64_t>(total_premium_collected) - static_cast<int64_t>(total_payout);
    }

    double net_delta() const { return total_call_delta + total_put_delta; }
};

struct PoolRiskMetrics {
    double utilization_rate{0.0};
    double net_delta{0.0};
    double delta_ratio{0.0};      // |net delta| per BTC of liquidity
    int64_t net_profit{0};
    double net_profit_btc{0.0};
};

PoolRiskMetrics risk_metrics_of(const PoolSnapshot& snapshot);

/**
 * Liquidity pool backing every written option.
 * Single source of truth for liquidity and LP shares. Thread-safe: each
 * operation holds the pool lock for its full read-modify-write and either
 * applies completely or leaves every counter unchanged.
 */
class CollateralPool {
public:
    explicit CollateralPool(const PoolConfig& config,
                            std::unique_ptr<Repository<LiquidityProvider>> providers = nullptr);

    // LP operations. Every mutation is stamped with the block height it happened at.
    Result<uint64_t> add_liquidity(const std::string& provider_id, Amount amount,
                                   BlockHeight height = 0);
    Result<Amount> remove_liquidity(const std::string& provider_id, uint64_t shares,
                                    BlockHeight height = 0);

    // Collateral lifecycle, keyed by contract id
    Status lock_collateral(const std::string& contract_id, Amount amount, BlockHeight height = 0);
    Status release_collateral(const std::string& contract_id, Amount amount,
                              BlockHeight height = 0);
    Status payout_settlement(const std::string& contract_id, Amount amount,
                             const std::string& recipient, BlockHeight height = 0);

    // Premium is pool revenue, immediately reusable as collateral
    Status collect_premium(const std::string& contract_id, Amount amount, BlockHeight height = 0);

    // Aggregate greeks of the written book, supplied by the pricing side
    void update_delta(double call_delta, double put_delta);

    // Reads
    PoolSnapshot snapshot() const;
    double utilization_rate() const;
    std::optional<double> lp_return(const std::string& provider_id) const;
    std::optional<LiquidityProvider> provider(const std::string& provider_id) const;
    Amount locked_for(const std::string& contract_id) const;
    PoolRiskMetrics risk_metrics() const;
    std::vector<PoolEvent> history() const;
    Amount share_value(uint64_t shares) const;

    const PoolConfig& config() const { return config_; }

private:
    Amount share_value_locked(uint64_t shares) const;
    void record_event(PoolEventType type, const std::string& reference, Amount amount,
                      BlockHeight height, uint64_t shares = 0, const std::string& recipient = "");

    PoolConfig config_;
    std::unique_ptr<Repository<LiquidityProvider>> providers_;

    mutable std::mutex mutex_;
    Amount total_liquidity_{0};
    Amount available_liquidity_{0};
    Amount locked_collateral_{0};
    uint64_t total_shares_{0};
    Amount total_premium_collected_{0};
    Amount total_payout_{0};
    uint32_t active_options_{0};
    double total_call_delta_{0.0};
    double total_put_delta_{0.0};

    std::map<std::string, Amount> locks_;
    std::vector<PoolEvent> history_;
};

} // namespace btcfi
