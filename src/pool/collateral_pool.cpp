#include "pool/collateral_pool.hpp"
#include "utils/math.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace btcfi {

CollateralPool::CollateralPool(const PoolConfig& config,
                               std::unique_ptr<Repository<LiquidityProvider>> providers)
    : config_(config)
    , providers_(std::move(providers))
{
    if (!providers_) {
        providers_ = std::make_unique<InMemoryRepository<LiquidityProvider>>();
    }
    spdlog::info("CollateralPool initialized with min_deposit={} sats", config_.min_deposit);
}

Result<uint64_t> CollateralPool::add_liquidity(const std::string& provider_id, Amount amount,
                                              BlockHeight height) {
    using R = Result<uint64_t>;

    if (amount == 0) {
        return R::failure(ErrorCode::INVALID_AMOUNT, "Deposit amount must be positive");
    }
    if (amount < config_.min_deposit) {
        return R::failure(ErrorCode::BELOW_MINIMUM_DEPOSIT,
                          fmt::format("Deposit {} below minimum {}", amount, config_.min_deposit));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t shares = 0;
    if (total_shares_ == 0) {
        shares = amount;
    } else {
        if (total_liquidity_ == 0) {
            return R::failure(ErrorCode::POOL_INSOLVENT,
                              "Outstanding shares with no liquidity, deposits suspended");
        }
        shares = mul_div(amount, total_shares_, total_liquidity_);
    }

    if (shares == 0) {
        return R::failure(ErrorCode::INVALID_AMOUNT,
                          fmt::format("Deposit {} too small to mint a share", amount));
    }

    LiquidityProvider lp = providers_->get(provider_id).value_or(LiquidityProvider{});
    lp.provider_id = provider_id;
    lp.deposited_amount += amount;
    lp.shares += shares;
    lp.last_update_ms = now_ms();
    providers_->put(provider_id, lp);

    total_liquidity_ += amount;
    available_liquidity_ += amount;
    total_shares_ += shares;

    record_event(PoolEventType::DEPOSIT, provider_id, amount, height, shares);

    spdlog::info("Liquidity added: provider={}, amount={}, shares={}, total={}",
                 provider_id, amount, shares, total_liquidity_);

    return R::success(shares);
}

Result<Amount> CollateralPool::remove_liquidity(const std::string& provider_id, uint64_t shares,
                                               BlockHeight height) {
    using R = Result<Amount>;

    if (shares == 0) {
        return R::failure(ErrorCode::INVALID_AMOUNT, "Share amount must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto lp = providers_->get(provider_id);
    if (!lp || lp->shares < shares) {
        return R::failure(ErrorCode::INSUFFICIENT_SHARES,
                          fmt::format("Provider {} holds {} shares, requested {}",
                                      provider_id, lp ? lp->shares : 0, shares));
    }

    Amount value = share_value_locked(shares);
    if (value > available_liquidity_) {
        return R::failure(ErrorCode::INSUFFICIENT_AVAILABLE_LIQUIDITY,
                          fmt::format("Redemption value {} exceeds available liquidity {}",
                                      value, available_liquidity_));
    }

    // Cost basis shrinks with the fraction of shares redeemed
    Amount basis_removed = mul_div(lp->deposited_amount, shares, lp->shares);
    lp->deposited_amount -= basis_removed;
    lp->shares -= shares;
    lp->last_update_ms = now_ms();
    providers_->put(provider_id, *lp);

    total_liquidity_ -= value;
    available_liquidity_ -= value;
    total_shares_ -= shares;

    record_event(PoolEventType::WITHDRAWAL, provider_id, value, height, shares);

    spdlog::info("Liquidity removed: provider={}, shares={}, amount={}, total={}",
                 provider_id, shares, value, total_liquidity_);

    return R::success(value);
}

Status CollateralPool::lock_collateral(const std::string& contract_id, Amount amount,
                                       BlockHeight height) {
    if (amount == 0) {
        return Status::failure(ErrorCode::INVALID_AMOUNT, "Collateral amount must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (locks_.count(contract_id)) {
        return Status::failure(ErrorCode::DUPLICATE_CONTRACT,
                               "Collateral already locked for " + contract_id);
    }
    if (amount > available_liquidity_) {
        return Status::failure(ErrorCode::INSUFFICIENT_LIQUIDITY,
                               fmt::format("Need {} collateral, {} available",
                                           amount, available_liquidity_));
    }

    available_liquidity_ -= amount;
    locked_collateral_ += amount;
    locks_[contract_id] = amount;
    active_options_++;

    record_event(PoolEventType::COLLATERAL_LOCKED, contract_id, amount, height);

    spdlog::debug("Collateral locked: contract={}, amount={}, available={}, locked={}",
                  contract_id, amount, available_liquidity_, locked_collateral_);

    return Status::success();
}

Status CollateralPool::release_collateral(const std::string& contract_id, Amount amount,
                                          BlockHeight height) {
    if (amount == 0) {
        return Status::failure(ErrorCode::INVALID_AMOUNT, "Release amount must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = locks_.find(contract_id);
    if (it == locks_.end()) {
        return Status::failure(ErrorCode::CONTRACT_NOT_FOUND,
                               "No collateral locked for " + contract_id);
    }
    if (amount > it->second) {
        return Status::failure(ErrorCode::INSUFFICIENT_LOCKED_COLLATERAL,
                               fmt::format("Release {} exceeds locked {} for {}",
                                           amount, it->second, contract_id));
    }

    it->second -= amount;
    locked_collateral_ -= amount;
    available_liquidity_ += amount;
    if (it->second == 0) {
        locks_.erase(it);
        active_options_--;
    }

    record_event(PoolEventType::COLLATERAL_RELEASED, contract_id, amount, height);

    spdlog::debug("Collateral released: contract={}, amount={}, available={}, locked={}",
                  contract_id, amount, available_liquidity_, locked_collateral_);

    return Status::success();
}

Status CollateralPool::payout_settlement(const std::string& contract_id, Amount amount,
                                         const std::string& recipient, BlockHeight height) {
    if (amount == 0) {
        return Status::failure(ErrorCode::INVALID_AMOUNT, "Payout amount must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = locks_.find(contract_id);
    if (it == locks_.end()) {
        return Status::failure(ErrorCode::CONTRACT_NOT_FOUND,
                               "No collateral locked for " + contract_id);
    }
    if (amount > it->second) {
        return Status::failure(ErrorCode::INSUFFICIENT_LOCKED_COLLATERAL,
                               fmt::format("Payout {} exceeds locked {} for {}",
                                           amount, it->second, contract_id));
    }

    Amount remainder = it->second - amount;

    // Payout leaves the pool entirely
    locked_collateral_ -= amount;
    total_liquidity_ -= amount;
    total_payout_ += amount;

    // Unused collateral of the settled contract goes back to available
    locked_collateral_ -= remainder;
    available_liquidity_ += remainder;

    locks_.erase(it);
    active_options_--;

    record_event(PoolEventType::SETTLEMENT_PAYOUT, contract_id, amount, height, 0, recipient);
    if (remainder > 0) {
        record_event(PoolEventType::COLLATERAL_RELEASED, contract_id, remainder, height);
    }

    spdlog::info("Settlement payout: contract={}, amount={}, released={}, recipient={}",
                 contract_id, amount, remainder, recipient);

    return Status::success();
}

Status CollateralPool::collect_premium(const std::string& contract_id, Amount amount,
                                       BlockHeight height) {
    if (amount == 0) {
        return Status::failure(ErrorCode::INVALID_AMOUNT, "Premium must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    total_liquidity_ += amount;
    available_liquidity_ += amount;
    total_premium_collected_ += amount;

    record_event(PoolEventType::PREMIUM_COLLECTED, contract_id, amount, height);

    spdlog::debug("Premium collected: contract={}, amount={}, total_premium={}",
                  contract_id, amount, total_premium_collected_);

    return Status::success();
}

PoolSnapshot CollateralPool::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolSnapshot snap;
    snap.total_liquidity = total_liquidity_;
    snap.available_liquidity = available_liquidity_;
    snap.locked_collateral = locked_collateral_;
    snap.total_shares = total_shares_;
    snap.total_premium_collected = total_premium_collected_;
    snap.total_payout = total_payout_;
    snap.active_options = active_options_;
    snap.provider_count = providers_->list().size();
    snap.utilization_rate = total_liquidity_ == 0
        ? 0.0
        : static_cast<double>(locked_collateral_) / static_cast<double>(total_liquidity_);
    snap.total_call_delta = total_call_delta_;
    snap.total_put_delta = total_put_delta_;
    return snap;
}

void CollateralPool::update_delta(double call_delta, double put_delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_call_delta_ = call_delta;
    total_put_delta_ = put_delta;
    spdlog::debug("Pool delta updated: call={:.4f}, put={:.4f}, net={:.4f}",
                  call_delta, put_delta, call_delta + put_delta);
}

PoolRiskMetrics CollateralPool::risk_metrics() const {
    return risk_metrics_of(snapshot());
}

PoolRiskMetrics risk_metrics_of(const PoolSnapshot& snap) {
    PoolRiskMetrics metrics;
    metrics.utilization_rate = snap.utilization_rate;
    metrics.net_delta = snap.net_delta();
    // Delta per BTC of pool liquidity
    metrics.delta_ratio = snap.total_liquidity == 0
        ? 0.0
        : std::abs(metrics.net_delta) / (static_cast<double>(snap.total_liquidity) / COIN);
    metrics.net_profit = snap.net_profit();
    metrics.net_profit_btc = static_cast<double>(metrics.net_profit) / COIN;
    return metrics;
}

double CollateralPool::utilization_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (total_liquidity_ == 0) {
        return 0.0;
    }
    return static_cast<double>(locked_collateral_) / static_cast<double>(total_liquidity_);
}

std::optional<double> CollateralPool::lp_return(const std::string& provider_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto lp = providers_->get(provider_id);
    if (!lp) {
        return std::nullopt;
    }
    if (lp->shares == 0 || lp->deposited_amount == 0) {
        return 0.0;
    }

    double current = static_cast<double>(share_value_locked(lp->shares));
    double deposited = static_cast<double>(lp->deposited_amount);
    return (current - deposited) / deposited;
}

std::optional<LiquidityProvider> CollateralPool::provider(const std::string& provider_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_->get(provider_id);
}

Amount CollateralPool::locked_for(const std::string& contract_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(contract_id);
    return it == locks_.end() ? 0 : it->second;
}

std::vector<PoolEvent> CollateralPool::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

Amount CollateralPool::share_value(uint64_t shares) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return share_value_locked(shares);
}

Amount CollateralPool::share_value_locked(uint64_t shares) const {
    if (total_shares_ == 0) {
        return 0;
    }
    return mul_div(shares, total_liquidity_, total_shares_);
}

void CollateralPool::record_event(PoolEventType type, const std::string& reference, Amount amount,
                                  BlockHeight height, uint64_t shares,
                                  const std::string& recipient) {
    PoolEvent event;
    event.type = type;
    event.reference = reference;
    event.amount = amount;
    event.shares = shares;
    event.recipient = recipient;
    event.block_height = height;
    event.timestamp_ms = now_ms();
    history_.push_back(std::move(event));
}

} // namespace btcfi
