#pragma once

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "common/result.hpp"
#include "config/config.hpp"
#include "bitcoin/transaction.hpp"
#include "contracts/option_contract.hpp"
#include "contracts/contract_registry.hpp"
#include "contracts/script_builder.hpp"
#include "pool/collateral_pool.hpp"
#include "settlement/price_feed.hpp"
#include "settlement/proof_generator.hpp"
#include "settlement/signer.hpp"
#include "storage/repository.hpp"

namespace btcfi {

struct SettlementRequest {
    std::string request_id;
    OptionContract contract;        // Snapshot taken at request creation
    Price spot_price{0};
    BlockHeight created_height{0};
    std::optional<SettlementProof> proof;
    SettlementStatus status{SettlementStatus::PENDING};
    ErrorCode failure_code{ErrorCode::NONE};
    std::string failure_reason;
    std::optional<std::string> settlement_txid;
    int64_t created_at_ms{0};
    int64_t updated_at_ms{0};

    // Proof accepted and waiting for execution
    bool is_open() const {
        return status == SettlementStatus::PROOF_SUBMITTED || status == SettlementStatus::VALIDATED;
    }
};

/**
 * Finalized spend of an option output through the settlement leaf.
 */
struct SettlementTransaction {
    std::string request_id;
    std::string contract_id;
    bitcoin::Transaction tx;
    std::string txid;
    std::string hex;
    bool in_the_money{false};
    Amount input_value{0};
    Amount payout_amount{0};    // To the buyer
    Amount pool_amount{0};      // Back to the pool
    Amount fee{0};              // Everything not assigned to an output
    Hash256 sighash{};          // Tapscript sighash both signatures commit to
};

struct EngineStats {
    size_t total_requests{0};
    size_t pending{0};
    size_t proof_submitted{0};
    size_t validated{0};
    size_t executed{0};
    size_t failed{0};
    size_t proof_rejections{0};
    Amount total_paid_out{0};
};

/**
 * Drives expired contracts through proof validation to payout.
 *
 * Request lifecycle: PENDING -> PROOF_SUBMITTED -> VALIDATED -> EXECUTED,
 * or PENDING -> FAILED when a proof disagrees with the engine's own
 * recomputation. execute validates and builds under the engine lock, signs
 * with no lock held, then re-checks request and contract state under the
 * lock before any funds move, so one of several racing executes wins and
 * the rest see ALREADY_SETTLED. Nested locks are always taken engine, then
 * registry, then pool.
 */
class SettlementEngine {
public:
    SettlementEngine(const SettlementConfig& config,
                     Network network,
                     CollateralPool& pool,
                     ContractRegistry& registry,
                     const ScriptBuilder& script_builder,
                     std::unique_ptr<Repository<SettlementRequest>> store = nullptr);

    // Collaborators
    void set_signer(std::shared_ptr<SettlementSigner> signer);
    void set_price_feed(std::shared_ptr<PriceFeed> feed);
    void set_proof_generator(std::shared_ptr<ProofGenerator> generator);

    Result<std::string> create_request(const std::string& contract_id, Price spot_price,
                                       BlockHeight current_height);

    Status submit_proof(const std::string& request_id, const SettlementProof& proof);

    Result<SettlementTransaction> execute(const std::string& request_id,
                                          const std::string& payout_address,
                                          const std::string& pool_address);

    // Request + proof for every expired contract without an open request;
    // a request left PENDING by a failed proof run is reused
    std::vector<std::string> process_expired(BlockHeight current_height);

    // Reads
    std::optional<SettlementRequest> get_request(const std::string& request_id) const;
    std::optional<SettlementStatus> status(const std::string& request_id) const;
    std::vector<SettlementRequest> history(const std::string& contract_id) const;
    EngineStats stats() const;

    const SettlementConfig& config() const { return config_; }

private:
    Status validate_proof(const SettlementRequest& request, const SettlementProof& proof) const;
    std::optional<SettlementRequest> unfinished_request(const std::string& contract_id) const;

    Result<SettlementTransaction> build_transaction(const SettlementRequest& request,
                                                    const OptionContract& contract,
                                                    const bitcoin::Script& payout_script,
                                                    const bitcoin::Script& pool_script) const;

    void fail_request(SettlementRequest& request, const Status& why);

    SettlementConfig config_;
    Network network_;
    CollateralPool& pool_;
    ContractRegistry& registry_;
    const ScriptBuilder& script_builder_;
    std::unique_ptr<Repository<SettlementRequest>> store_;

    std::shared_ptr<SettlementSigner> signer_;
    std::shared_ptr<PriceFeed> price_feed_;
    std::shared_ptr<ProofGenerator> proof_generator_;

    mutable std::mutex mutex_;
    size_t proof_rejections_{0};
    Amount total_paid_out_{0};
};

} // namespace btcfi
