#include "contracts/contract_registry.hpp"
#include "bitcoin/address.hpp"
#include "bitcoin/transaction.hpp"
#include "utils/crypto.hpp"
#include "utils/math.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace btcfi {

ContractRegistry::ContractRegistry(const ContractLimits& limits,
                                   Network network,
                                   CollateralPool& pool,
                                   const ScriptBuilder& script_builder,
                                   std::unique_ptr<Repository<OptionContract>> store)
    : limits_(limits)
    , network_(network)
    , pool_(pool)
    , script_builder_(script_builder)
    , store_(std::move(store))
{
    if (!crypto::parse_hash256(limits_.proof_program_hash, program_hash_)) {
        throw std::runtime_error("Malformed proof_program_hash: " + limits_.proof_program_hash);
    }
    if (!store_) {
        store_ = std::make_unique<InMemoryRepository<OptionContract>>();
    }
    spdlog::info("ContractRegistry initialized: network={}, max_strike={}, quantity=[{}, {}], "
                 "max_premium_bps={}, horizon={} blocks",
                 network_to_string(network_), limits_.max_strike, limits_.min_quantity,
                 limits_.max_quantity, limits_.max_premium_bps, limits_.max_expiry_horizon);
}

Status ContractRegistry::validate_terms(const OptionTerms& terms, BlockHeight current_height) const {
    if (terms.strike_price == 0 || terms.strike_price > limits_.max_strike) {
        return Status::failure(ErrorCode::INVALID_STRIKE,
                               fmt::format("Strike {} outside (0, {}]",
                                           terms.strike_price, limits_.max_strike));
    }

    if (terms.quantity < limits_.min_quantity || terms.quantity > limits_.max_quantity) {
        return Status::failure(ErrorCode::INVALID_QUANTITY,
                               fmt::format("Quantity {} outside [{}, {}]", terms.quantity,
                                           limits_.min_quantity, limits_.max_quantity));
    }

    Amount notional = mul_div(terms.strike_price, terms.quantity, limits_.reference_unit_price);
    Amount max_premium = mul_div(notional, limits_.max_premium_bps, 10000);
    if (terms.premium == 0 || terms.premium > max_premium) {
        return Status::failure(ErrorCode::INVALID_PREMIUM,
                               fmt::format("Premium {} outside (0, {}] for notional {}",
                                           terms.premium, max_premium, notional));
    }

    uint64_t horizon_end = static_cast<uint64_t>(current_height) + limits_.max_expiry_horizon;
    if (terms.expiry_height <= current_height || terms.expiry_height > horizon_end) {
        return Status::failure(ErrorCode::INVALID_EXPIRY,
                               fmt::format("Expiry {} outside ({}, {}]", terms.expiry_height,
                                           current_height, horizon_end));
    }

    return Status::success();
}

Result<std::string> ContractRegistry::create(const CreateOptionRequest& request,
                                             BlockHeight current_height) {
    using R = Result<std::string>;

    auto valid = validate_terms(request.terms, current_height);
    if (!valid) {
        spdlog::debug("Option rejected: {} ({})", error_to_string(valid.error), valid.reason);
        return R::failure(valid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string contract_id = request.contract_id.empty()
        ? "OPT-" + crypto::random_hex(8)
        : request.contract_id;

    if (store_->get(contract_id)) {
        return R::failure(ErrorCode::DUPLICATE_CONTRACT, "Contract already exists: " + contract_id);
    }

    OptionContract contract;
    contract.contract_id = contract_id;
    contract.holder = request.holder.empty() ? crypto::hex_encode(request.keys.buyer) : request.holder;
    contract.terms = request.terms;
    contract.keys = request.keys;
    contract.commitment = compute_commitment(program_hash_, contract_id, request.terms);

    auto built = script_builder_.build(request.keys.buyer, request.keys.seller,
                                       request.keys.verifier, contract.commitment,
                                       request.terms.expiry_height);
    if (!built) {
        return R::failure(built.status());
    }

    contract.address = bitcoin::encode_taproot_address(network_, built.value.output_key);
    if (contract.address.empty()) {
        return R::failure(ErrorCode::TAPROOT_CONSTRUCTION_FAILED, "Failed to encode taproot address");
    }
    contract.output_script = built.value.output_script;
    contract.spend_info = built.value.spend_info;

    contract.collateral = compute_collateral(request.terms, limits_.reference_unit_price);
    if (contract.collateral == 0) {
        return R::failure(ErrorCode::INVALID_QUANTITY, "Quantity too small to require collateral");
    }

    auto locked = pool_.lock_collateral(contract_id, contract.collateral, current_height);
    if (!locked) {
        spdlog::warn("Option {} rejected by pool: {}", contract_id, locked.reason);
        return R::failure(locked);
    }

    auto premium = pool_.collect_premium(contract_id, request.terms.premium, current_height);
    if (!premium) {
        auto released = pool_.release_collateral(contract_id, contract.collateral, current_height);
        if (!released) {
            spdlog::error("Failed to unwind collateral for {}: {}", contract_id, released.reason);
        }
        return R::failure(premium);
    }

    contract.status = ContractStatus::ACTIVE;
    contract.created_at_ms = now_ms();

    store_->put(contract_id, contract);
    by_holder_[contract.holder].push_back(contract_id);

    spdlog::info("Option created: id={}, kind={}, strike={}, quantity={}, expiry={}, premium={}, "
                 "collateral={}, address={}",
                 contract_id, option_kind_to_string(contract.terms.kind),
                 contract.terms.strike_price, contract.terms.quantity,
                 contract.terms.expiry_height, contract.terms.premium,
                 contract.collateral, contract.address);

    return R::success(contract_id);
}

Result<std::string> ContractRegistry::create_quoted(const CreateOptionRequest& request,
                                                    Price spot_price,
                                                    BlockHeight current_height,
                                                    const PricingEngine& pricing) {
    PricingInput input;
    input.kind = request.terms.kind;
    input.strike_price = request.terms.strike_price;
    input.spot_price = spot_price;
    input.quantity = request.terms.quantity;
    input.blocks_to_expiry = request.terms.expiry_height > current_height
        ? request.terms.expiry_height - current_height
        : 0;

    auto quote = pricing.quote(input);
    if (!quote) {
        return Result<std::string>::failure(ErrorCode::INVALID_PREMIUM,
                                            "Pricing engine returned no quote");
    }

    spdlog::debug("Premium quoted: {} sats (iv={:.4f})", quote->premium, quote->implied_volatility);

    CreateOptionRequest priced = request;
    priced.terms.premium = quote->premium;
    return create(priced, current_height);
}

std::optional<OptionContract> ContractRegistry::get(const std::string& contract_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_->get(contract_id);
}

std::vector<OptionContract> ContractRegistry::by_holder(const std::string& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<OptionContract> result;
    auto it = by_holder_.find(holder);
    if (it == by_holder_.end()) {
        return result;
    }
    for (const auto& id : it->second) {
        auto contract = store_->get(id);
        if (contract) {
            result.push_back(std::move(*contract));
        }
    }
    return result;
}

std::vector<OptionContract> ContractRegistry::get_expired(BlockHeight current_height) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<OptionContract> result;
    for (auto& contract : store_->list()) {
        if (contract.is_active() && contract.is_expired(current_height)) {
            result.push_back(std::move(contract));
        }
    }
    return result;
}

std::vector<OptionContract> ContractRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_->list();
}

Status ContractRegistry::record_funding(const std::string& contract_id, const OutPoint& outpoint,
                                        Amount value) {
    if (value == 0) {
        return Status::failure(ErrorCode::INVALID_AMOUNT, "Funding value must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto contract = store_->get(contract_id);
    if (!contract) {
        return Status::failure(ErrorCode::CONTRACT_NOT_FOUND, "Unknown contract: " + contract_id);
    }
    if (!contract->is_active()) {
        return Status::failure(ErrorCode::NOT_ACTIVE, "Contract already settled: " + contract_id);
    }

    if (value < contract->collateral + contract->terms.premium) {
        spdlog::warn("Funding for {} is {} sats, expected {}", contract_id, value,
                     contract->collateral + contract->terms.premium);
    }

    contract->funding = outpoint;
    contract->funding_value = value;
    store_->put(contract_id, *contract);

    spdlog::info("Funding recorded: contract={}, outpoint={}:{}, value={}",
                 contract_id, bitcoin::txid_to_hex(outpoint.txid), outpoint.vout, value);

    return Status::success();
}

Status ContractRegistry::mark_settled(const std::string& contract_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto contract = store_->get(contract_id);
    if (!contract) {
        return Status::failure(ErrorCode::CONTRACT_NOT_FOUND, "Unknown contract: " + contract_id);
    }
    if (!contract->is_active()) {
        return Status::failure(ErrorCode::ALREADY_SETTLED, "Contract already settled: " + contract_id);
    }

    contract->status = ContractStatus::SETTLED;
    contract->settled_at_ms = now_ms();
    store_->put(contract_id, *contract);

    spdlog::info("Contract settled: {}", contract_id);
    return Status::success();
}

RegistryStats ContractRegistry::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    RegistryStats stats;
    for (const auto& contract : store_->list()) {
        stats.total++;
        stats.total_premium += contract.terms.premium;
        if (contract.is_funded()) {
            stats.funded++;
        }
        if (contract.is_active()) {
            stats.active++;
            stats.active_collateral += contract.collateral;
        } else {
            stats.settled++;
        }
    }
    return stats;
}

} // namespace btcfi
