#include "settlement/settlement_engine.hpp"
#include "bitcoin/address.hpp"
#include "utils/crypto.hpp"
#include <spdlog/spdlog.h>

namespace btcfi {

SettlementEngine::SettlementEngine(const SettlementConfig& config,
                                   Network network,
                                   CollateralPool& pool,
                                   ContractRegistry& registry,
                                   const ScriptBuilder& script_builder,
                                   std::unique_ptr<Repository<SettlementRequest>> store)
    : config_(config)
    , network_(network)
    , pool_(pool)
    , registry_(registry)
    , script_builder_(script_builder)
    , store_(std::move(store))
{
    if (!store_) {
        store_ = std::make_unique<InMemoryRepository<SettlementRequest>>();
    }
    spdlog::info("SettlementEngine initialized: fee={} sats, dust_limit={} sats, network={}",
                 config_.settlement_fee, config_.dust_limit, network_to_string(network_));
}

void SettlementEngine::set_signer(std::shared_ptr<SettlementSigner> signer) {
    std::lock_guard<std::mutex> lock(mutex_);
    signer_ = std::move(signer);
}

void SettlementEngine::set_price_feed(std::shared_ptr<PriceFeed> feed) {
    std::lock_guard<std::mutex> lock(mutex_);
    price_feed_ = std::move(feed);
}

void SettlementEngine::set_proof_generator(std::shared_ptr<ProofGenerator> generator) {
    std::lock_guard<std::mutex> lock(mutex_);
    proof_generator_ = std::move(generator);
}

Result<std::string> SettlementEngine::create_request(const std::string& contract_id,
                                                     Price spot_price,
                                                     BlockHeight current_height) {
    using R = Result<std::string>;

    std::lock_guard<std::mutex> lock(mutex_);

    auto contract = registry_.get(contract_id);
    if (!contract) {
        return R::failure(ErrorCode::CONTRACT_NOT_FOUND, "Unknown contract: " + contract_id);
    }
    if (!contract->is_active()) {
        return R::failure(ErrorCode::NOT_ACTIVE, "Contract is not active: " + contract_id);
    }
    if (!contract->is_expired(current_height)) {
        return R::failure(ErrorCode::NOT_EXPIRED,
                          fmt::format("Contract {} expires at {}, current height {}",
                                      contract_id, contract->terms.expiry_height, current_height));
    }
    if (spot_price == 0) {
        return R::failure(ErrorCode::INVALID_SPOT_PRICE, "Spot price must be positive");
    }

    SettlementRequest request;
    request.request_id = "SETTLE-" + contract_id + "-" + crypto::random_hex(4);
    request.contract = std::move(*contract);
    request.spot_price = spot_price;
    request.created_height = current_height;
    request.status = SettlementStatus::PENDING;
    request.created_at_ms = now_ms();
    request.updated_at_ms = request.created_at_ms;

    std::string request_id = request.request_id;
    store_->put(request_id, std::move(request));

    spdlog::info("Settlement request created: {} (contract={}, spot={}, height={})",
                 request_id, contract_id, spot_price, current_height);

    return R::success(request_id);
}

Status SettlementEngine::validate_proof(const SettlementRequest& request,
                                        const SettlementProof& proof) const {
    const OptionContract& contract = request.contract;

    if (proof.option_id != contract.contract_id) {
        return Status::failure(ErrorCode::OPTION_ID_MISMATCH,
                               fmt::format("Proof is for {}, request is for {}",
                                           proof.option_id, contract.contract_id));
    }

    if (proof.commitment != contract.commitment) {
        return Status::failure(ErrorCode::COMMITMENT_MISMATCH,
                               fmt::format("Proof commitment {} does not match contract commitment {}",
                                           crypto::hex_encode(proof.commitment),
                                           crypto::hex_encode(contract.commitment)));
    }

    Amount expected = contract.settlement_amount(proof.spot_price);
    if (proof.settlement_amount != expected) {
        return Status::failure(ErrorCode::AMOUNT_MISMATCH,
                               fmt::format("Proof claims {} sats, recomputed {} at spot {}",
                                           proof.settlement_amount, expected, proof.spot_price));
    }

    bool itm = contract.is_in_the_money(proof.spot_price);
    if (proof.is_itm != itm) {
        return Status::failure(ErrorCode::ITM_FLAG_MISMATCH,
                               fmt::format("Proof ITM flag {} disagrees with recomputed {}",
                                           proof.is_itm, itm));
    }

    if (proof.spot_price != request.spot_price) {
        return Status::failure(ErrorCode::SPOT_PRICE_MISMATCH,
                               fmt::format("Proof spot {} differs from requested spot {}",
                                           proof.spot_price, request.spot_price));
    }

    if (proof.proof_bytes.size() > bitcoin::MAX_SCRIPT_ELEMENT_SIZE) {
        return Status::failure(ErrorCode::PROOF_TOO_LARGE,
                               fmt::format("Proof is {} bytes, witness element limit is {}",
                                           proof.proof_bytes.size(),
                                           bitcoin::MAX_SCRIPT_ELEMENT_SIZE));
    }

    return Status::success();
}

void SettlementEngine::fail_request(SettlementRequest& request, const Status& why) {
    request.status = SettlementStatus::FAILED;
    request.failure_code = why.error;
    request.failure_reason = why.reason;
    request.updated_at_ms = now_ms();
    store_->put(request.request_id, request);
    proof_rejections_++;

    spdlog::warn("SECURITY: settlement proof rejected for {} (contract={}): {}: {}",
                 request.request_id, request.contract.contract_id,
                 error_to_string(why.error), why.reason);
}

Status SettlementEngine::submit_proof(const std::string& request_id, const SettlementProof& proof) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto request = store_->get(request_id);
    if (!request) {
        return Status::failure(ErrorCode::REQUEST_NOT_FOUND, "Unknown request: " + request_id);
    }
    if (request->status == SettlementStatus::EXECUTED) {
        return Status::failure(ErrorCode::ALREADY_SETTLED, "Request already executed: " + request_id);
    }
    if (request->status != SettlementStatus::PENDING) {
        return Status::failure(ErrorCode::INVALID_REQUEST_STATE,
                               fmt::format("Request {} is {}, proofs are accepted only while PENDING",
                                           request_id, settlement_status_to_string(request->status)));
    }

    auto valid = validate_proof(*request, proof);
    if (!valid) {
        fail_request(*request, valid);
        return valid;
    }

    request->proof = proof;
    request->status = SettlementStatus::PROOF_SUBMITTED;
    request->updated_at_ms = now_ms();
    store_->put(request_id, *request);

    spdlog::info("Proof accepted for {}: itm={}, amount={}, spot={}",
                 request_id, proof.is_itm, proof.settlement_amount, proof.spot_price);

    return Status::success();
}

Result<SettlementTransaction> SettlementEngine::build_transaction(const SettlementRequest& request,
                                                                  const OptionContract& contract,
                                                                  const bitcoin::Script& payout_script,
                                                                  const bitcoin::Script& pool_script) const {
    using R = Result<SettlementTransaction>;
    const SettlementProof& proof = *request.proof;

    // The revealed leaf must be the one this contract's output commits to
    bitcoin::Script expected_leaf = ScriptBuilder::settlement_script(
        contract.keys.buyer, contract.keys.seller, contract.keys.verifier,
        contract.commitment, contract.terms.expiry_height);
    if (expected_leaf != contract.spend_info.settlement.script ||
        tapleaf_hash(expected_leaf) != contract.spend_info.settlement.leaf_hash) {
        return R::failure(ErrorCode::TAPROOT_CONSTRUCTION_FAILED,
                          "Stored settlement leaf does not match contract terms");
    }

    // Sibling in the control block
    bitcoin::Script expected_refund = script_builder_.refund_script(contract.keys.seller,
                                                                    contract.terms.expiry_height);
    if (tapleaf_hash(expected_refund) != contract.spend_info.refund.leaf_hash) {
        return R::failure(ErrorCode::TAPROOT_CONSTRUCTION_FAILED,
                          "Stored refund leaf does not match contract terms");
    }

    SettlementTransaction result;
    result.request_id = request.request_id;
    result.contract_id = contract.contract_id;
    result.in_the_money = proof.is_itm;
    result.input_value = contract.output_value();

    const Amount fee = config_.settlement_fee;
    const Amount payout = proof.is_itm ? proof.settlement_amount : 0;

    if (payout > 0 && payout < config_.dust_limit) {
        spdlog::warn("Payout of {} sats for {} is below the {} sat dust limit, output may not relay",
                     payout, contract.contract_id, config_.dust_limit);
    }

    if (result.input_value < payout + fee) {
        return R::failure(ErrorCode::INSUFFICIENT_FUNDS,
                          fmt::format("Output value {} cannot cover payout {} plus fee {}",
                                      result.input_value, payout, fee));
    }

    Amount remainder = result.input_value - payout - fee;

    bitcoin::Transaction& tx = result.tx;
    tx.version = 2;
    tx.lock_time = contract.terms.expiry_height;

    bitcoin::TxIn input;
    input.prevout = *contract.funding;
    input.sequence = bitcoin::SEQUENCE_ENABLE_LOCKTIME;
    tx.inputs.push_back(input);

    if (payout > 0) {
        tx.outputs.push_back(bitcoin::TxOut{payout, payout_script});
        result.payout_amount = payout;
    }
    // A dust remainder is left to the miner
    if (remainder >= config_.dust_limit) {
        tx.outputs.push_back(bitcoin::TxOut{remainder, pool_script});
        result.pool_amount = remainder;
    }
    if (tx.outputs.empty()) {
        return R::failure(ErrorCode::INSUFFICIENT_FUNDS,
                          fmt::format("Output value {} leaves nothing above dust after fee",
                                      result.input_value));
    }
    result.fee = result.input_value - result.payout_amount - result.pool_amount;

    // Signatures commit to the full transaction through the tapscript sighash
    std::vector<bitcoin::TxOut> spent{bitcoin::TxOut{result.input_value, contract.output_script}};
    result.sighash = bitcoin::taproot_script_path_sighash(
        tx, 0, spent, contract.spend_info.settlement.leaf_hash);

    result.txid = tx.txid_hex();
    result.hex = tx.to_hex();
    return R::success(std::move(result));
}

Result<SettlementTransaction> SettlementEngine::execute(const std::string& request_id,
                                                        const std::string& payout_address,
                                                        const std::string& pool_address) {
    using R = Result<SettlementTransaction>;

    SettlementRequest request;
    OptionContract contract;
    SettlementTransaction settlement;
    std::shared_ptr<SettlementSigner> signer;

    // Validate and build the unsigned spend
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto stored = store_->get(request_id);
        if (!stored) {
            return R::failure(ErrorCode::REQUEST_NOT_FOUND, "Unknown request: " + request_id);
        }
        request = std::move(*stored);
        if (request.status == SettlementStatus::EXECUTED) {
            return R::failure(ErrorCode::ALREADY_SETTLED, "Request already executed: " + request_id);
        }
        if (!request.is_open() || !request.proof) {
            return R::failure(ErrorCode::PROOF_NOT_SUBMITTED,
                              fmt::format("Request {} is {}, no accepted proof", request_id,
                                          settlement_status_to_string(request.status)));
        }

        const std::string& contract_id = request.contract.contract_id;
        auto current = registry_.get(contract_id);
        if (!current) {
            return R::failure(ErrorCode::CONTRACT_NOT_FOUND, "Unknown contract: " + contract_id);
        }
        contract = std::move(*current);
        if (!contract.is_active()) {
            return R::failure(ErrorCode::ALREADY_SETTLED, "Contract already settled: " + contract_id);
        }
        if (!contract.is_funded()) {
            return R::failure(ErrorCode::NOT_FUNDED, "No funding outpoint recorded for " + contract_id);
        }

        auto payout_script = bitcoin::address_to_script(network_, payout_address);
        if (!payout_script) {
            return R::failure(ErrorCode::INVALID_ADDRESS, "Invalid payout address: " + payout_address);
        }
        auto pool_script = bitcoin::address_to_script(network_, pool_address);
        if (!pool_script) {
            return R::failure(ErrorCode::INVALID_ADDRESS, "Invalid pool address: " + pool_address);
        }

        // Registry copy is authoritative; the request only holds a snapshot
        if (request.proof->commitment != contract.commitment) {
            Status mismatch = Status::failure(ErrorCode::COMMITMENT_MISMATCH,
                                              "Proof commitment does not match registry contract");
            fail_request(request, mismatch);
            return R::failure(mismatch);
        }

        if (request.status != SettlementStatus::VALIDATED) {
            request.status = SettlementStatus::VALIDATED;
            request.updated_at_ms = now_ms();
            store_->put(request_id, request);
        }

        auto built = build_transaction(request, contract, *payout_script, *pool_script);
        if (!built) {
            spdlog::warn("Settlement transaction for {} not built: {}", request_id, built.reason);
            return built;
        }
        settlement = std::move(built.value);
        signer = signer_;
    }

    // Key custody may block; no lock is held while signing
    Bytes verifier_sig;
    Bytes branch_sig;
    if (signer) {
        verifier_sig = signer->sign(SignerRole::VERIFIER, contract.contract_id, settlement.sighash);
        branch_sig = signer->sign(settlement.in_the_money ? SignerRole::BUYER : SignerRole::SELLER,
                                  contract.contract_id, settlement.sighash);
    } else {
        spdlog::debug("No signer configured, leaving signature slots empty for {}", request_id);
    }

    settlement.tx.inputs[0].witness = settlement_witness(contract.spend_info, branch_sig,
                                                         request.proof->is_itm, verifier_sig,
                                                         request.proof->proof_bytes,
                                                         request.proof->commitment);
    settlement.hex = settlement.tx.to_hex();

    // Commit: state may have moved while signing, so check again before funds move
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string& contract_id = contract.contract_id;
    auto stored = store_->get(request_id);
    if (!stored || stored->status == SettlementStatus::EXECUTED) {
        return R::failure(ErrorCode::ALREADY_SETTLED, "Request already executed: " + request_id);
    }
    if (stored->status != SettlementStatus::VALIDATED) {
        return R::failure(ErrorCode::INVALID_REQUEST_STATE,
                          fmt::format("Request {} became {} during signing", request_id,
                                      settlement_status_to_string(stored->status)));
    }
    auto current = registry_.get(contract_id);
    if (!current || !current->is_active()) {
        return R::failure(ErrorCode::ALREADY_SETTLED, "Contract already settled: " + contract_id);
    }

    const BlockHeight height = stored->created_height;
    Status moved = settlement.payout_amount > 0
        ? pool_.payout_settlement(contract_id, settlement.payout_amount, payout_address, height)
        : pool_.release_collateral(contract_id, contract.collateral, height);
    if (!moved) {
        spdlog::error("Pool rejected settlement of {}: {}", contract_id, moved.reason);
        return R::failure(moved);
    }

    auto settled = registry_.mark_settled(contract_id);
    if (!settled) {
        // Pool funds already moved; nothing left to retry on this request
        spdlog::critical("Contract {} paid out but could not be marked settled: {}",
                         contract_id, settled.reason);
    }

    stored->status = SettlementStatus::EXECUTED;
    stored->settlement_txid = settlement.txid;
    stored->updated_at_ms = now_ms();
    store_->put(request_id, *stored);
    total_paid_out_ += settlement.payout_amount;

    spdlog::info("Settlement executed: request={}, contract={}, itm={}, payout={}, pool={}, fee={}, txid={}",
                 request_id, contract_id, settlement.in_the_money, settlement.payout_amount,
                 settlement.pool_amount, settlement.fee, settlement.txid);

    return R::success(std::move(settlement));
}

std::optional<SettlementRequest> SettlementEngine::unfinished_request(const std::string& contract_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& request : store_->list()) {
        if (request.contract.contract_id == contract_id &&
            (request.status == SettlementStatus::PENDING || request.is_open())) {
            return std::move(request);
        }
    }
    return std::nullopt;
}

std::vector<std::string> SettlementEngine::process_expired(BlockHeight current_height) {
    std::vector<std::string> processed;

    std::shared_ptr<PriceFeed> feed;
    std::shared_ptr<ProofGenerator> generator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        feed = price_feed_;
        generator = proof_generator_;
    }
    if (!feed || !generator) {
        spdlog::warn("process_expired needs a price feed and a proof generator");
        return processed;
    }

    auto expired = registry_.get_expired(current_height);
    if (expired.empty()) {
        return processed;
    }
    spdlog::info("Processing {} expired contracts at height {}", expired.size(), current_height);

    for (const auto& contract : expired) {
        auto existing = unfinished_request(contract.contract_id);
        if (existing && existing->is_open()) {
            spdlog::debug("Skipping {}: settlement already awaiting execution", contract.contract_id);
            continue;
        }

        std::string request_id;
        Price spot_price = 0;
        if (existing) {
            // Proof generation failed on an earlier sweep
            request_id = existing->request_id;
            spot_price = existing->spot_price;
            spdlog::debug("Retrying proof for pending request {}", request_id);
        } else {
            auto quote = feed->latest();
            if (!quote) {
                spdlog::warn("No spot price available for {}", contract.contract_id);
                continue;
            }

            auto created = create_request(contract.contract_id, quote->price, current_height);
            if (!created) {
                spdlog::warn("Could not open settlement for {}: {}", contract.contract_id,
                             created.reason);
                continue;
            }
            request_id = created.value;
            spot_price = quote->price;
        }

        ProofJob job;
        job.option_id = contract.contract_id;
        job.kind = contract.terms.kind;
        job.strike_price = contract.terms.strike_price;
        job.spot_price = spot_price;
        job.quantity = contract.terms.quantity;
        job.collateral = contract.collateral;
        job.commitment = contract.commitment;
        job.block_height = current_height;

        auto proof = generator->generate(job);
        if (!proof) {
            spdlog::warn("Proof generation failed for {}", request_id);
            continue;
        }

        auto submitted = submit_proof(request_id, *proof);
        if (!submitted) {
            continue;
        }

        processed.push_back(request_id);
    }

    return processed;
}

std::optional<SettlementRequest> SettlementEngine::get_request(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_->get(request_id);
}

std::optional<SettlementStatus> SettlementEngine::status(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto request = store_->get(request_id);
    if (!request) {
        return std::nullopt;
    }
    return request->status;
}

std::vector<SettlementRequest> SettlementEngine::history(const std::string& contract_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SettlementRequest> result;
    for (auto& request : store_->list()) {
        if (request.contract.contract_id == contract_id) {
            result.push_back(std::move(request));
        }
    }
    return result;
}

EngineStats SettlementEngine::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    EngineStats stats;
    for (const auto& request : store_->list()) {
        stats.total_requests++;
        switch (request.status) {
            case SettlementStatus::PENDING: stats.pending++; break;
            case SettlementStatus::PROOF_SUBMITTED: stats.proof_submitted++; break;
            case SettlementStatus::VALIDATED: stats.validated++; break;
            case SettlementStatus::EXECUTED: stats.executed++; break;
            case SettlementStatus::FAILED: stats.failed++; break;
        }
    }
    stats.proof_rejections = proof_rejections_;
    stats.total_paid_out = total_paid_out_;
    return stats;
}

} // namespace btcfi
