#include <gtest/gtest.h>
#include <atomic>
#include <functional>
#include <thread>
#include <vector>
#include "settlement/settlement_engine.hpp"
#include "bitcoin/address.hpp"
#include "utils/crypto.hpp"
#include "test_helpers.hpp"

using namespace btcfi;

namespace {

class RecordingSigner : public SettlementSigner {
public:
    Bytes sign(SignerRole role, const std::string& contract_id, const Hash256& sighash) override {
        roles.push_back(role);
        contract_ids.push_back(contract_id);
        sighashes.push_back(sighash);
        return Bytes(64, static_cast<uint8_t>(0x10 + static_cast<int>(role)));
    }

    std::vector<SignerRole> roles;
    std::vector<std::string> contract_ids;
    std::vector<Hash256> sighashes;
};

// Stands in for a proof engine that can go offline
class OfflineCapableProofGenerator : public ProofGenerator {
public:
    explicit OfflineCapableProofGenerator(const Hash256& program_hash) : local_(program_hash) {}

    std::optional<SettlementProof> generate(const ProofJob& job) override {
        calls++;
        if (!online) {
            return std::nullopt;
        }
        return local_.generate(job);
    }

    bool online{false};
    int calls{0};

private:
    LocalProofGenerator local_;
};

// Executes a competing settlement while the first one is being signed
class InterleavingSigner : public SettlementSigner {
public:
    Bytes sign(SignerRole role, const std::string&, const Hash256&) override {
        if (on_first_sign) {
            auto action = std::move(on_first_sign);
            on_first_sign = nullptr;
            action();
        }
        return Bytes(64, static_cast<uint8_t>(0x10 + static_cast<int>(role)));
    }

    std::function<void()> on_first_sign;
};

} // namespace

class SettlementEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        crypto::parse_hash256(limits_.proof_program_hash, program_hash_);

        pool_ = std::make_unique<CollateralPool>(PoolConfig{});
        registry_ = std::make_unique<ContractRegistry>(limits_, Network::REGTEST, *pool_, builder_);
        engine_ = std::make_unique<SettlementEngine>(config_, Network::REGTEST, *pool_, *registry_,
                                                     builder_);
        generator_ = std::make_unique<LocalProofGenerator>(program_hash_);

        payout_address_ = bitcoin::encode_taproot_address(Network::REGTEST, testing_keys::buyer());
        pool_address_ = bitcoin::encode_taproot_address(Network::REGTEST, testing_keys::seller());

        ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    }

    std::string CreateCall(bool funded = true) {
        CreateOptionRequest request;
        request.holder = "alice";
        request.terms.kind = OptionKind::CALL;
        request.terms.strike_price = 7000000;
        request.terms.quantity = 10000000;
        request.terms.premium = 250000;
        request.terms.expiry_height = 800000;
        request.keys = ContractKeys{testing_keys::buyer(), testing_keys::seller(),
                                    testing_keys::verifier()};

        auto created = registry_->create(request, 799000);
        EXPECT_TRUE(created) << created.reason;
        if (funded) {
            OutPoint outpoint;
            outpoint.txid = crypto::sha256("funding-" + created.value);
            outpoint.vout = 0;
            EXPECT_TRUE(registry_->record_funding(created.value, outpoint, 10250000));
        }
        return created.value;
    }

    SettlementProof ProofFor(const std::string& contract_id, Price spot) {
        auto contract = registry_->get(contract_id);
        ProofJob job;
        job.option_id = contract_id;
        job.kind = contract->terms.kind;
        job.strike_price = contract->terms.strike_price;
        job.spot_price = spot;
        job.quantity = contract->terms.quantity;
        job.collateral = contract->collateral;
        job.commitment = contract->commitment;
        job.block_height = 800000;
        return *generator_->generate(job);
    }

    // Request with an accepted proof, ready to execute
    std::string OpenRequest(const std::string& contract_id, Price spot) {
        auto request = engine_->create_request(contract_id, spot, 800000);
        EXPECT_TRUE(request) << request.reason;
        auto submitted = engine_->submit_proof(request.value, ProofFor(contract_id, spot));
        EXPECT_TRUE(submitted) << submitted.reason;
        return request.value;
    }

    ContractLimits limits_;
    SettlementConfig config_;
    ScriptBuilder builder_{144};
    Hash256 program_hash_{};

    std::unique_ptr<CollateralPool> pool_;
    std::unique_ptr<ContractRegistry> registry_;
    std::unique_ptr<SettlementEngine> engine_;
    std::unique_ptr<LocalProofGenerator> generator_;

    std::string payout_address_;
    std::string pool_address_;
};

TEST_F(SettlementEngineTest, Execute_InTheMoneyCallPaysBuyer) {
    std::string id = CreateCall();
    std::string request_id = OpenRequest(id, 7500000);

    auto result = engine_->execute(request_id, payout_address_, pool_address_);
    ASSERT_TRUE(result) << result.reason;

    const SettlementTransaction& settlement = result.value;
    EXPECT_TRUE(settlement.in_the_money);
    EXPECT_EQ(settlement.input_value, 10250000u);
    EXPECT_EQ(settlement.payout_amount, 666666u);
    EXPECT_EQ(settlement.pool_amount, 9582334u);
    EXPECT_EQ(settlement.fee, 1000u);

    const bitcoin::Transaction& tx = settlement.tx;
    EXPECT_EQ(tx.version, 2);
    EXPECT_EQ(tx.lock_time, 800000u);
    ASSERT_EQ(tx.inputs.size(), 1u);
    EXPECT_EQ(tx.inputs[0].sequence, bitcoin::SEQUENCE_ENABLE_LOCKTIME);
    EXPECT_EQ(tx.inputs[0].prevout, *registry_->get(id)->funding);
    ASSERT_EQ(tx.outputs.size(), 2u);
    EXPECT_EQ(tx.outputs[0].value, 666666u);
    EXPECT_EQ(tx.outputs[0].script_pubkey,
              *bitcoin::address_to_script(Network::REGTEST, payout_address_));
    EXPECT_EQ(tx.outputs[1].value, 9582334u);
    EXPECT_EQ(settlement.txid, tx.txid_hex());

    const auto& witness = tx.inputs[0].witness;
    ASSERT_EQ(witness.size(), 7u);
    EXPECT_EQ(witness[1], Bytes{0x01});
    EXPECT_EQ(witness[6], registry_->get(id)->spend_info.settlement.control_block);

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.total_payout, 666666u);
    EXPECT_EQ(snap.locked_collateral, 0u);
    EXPECT_EQ(snap.available_liquidity, 99583334u);
    EXPECT_EQ(snap.total_liquidity, 99583334u);
    EXPECT_EQ(snap.active_options, 0u);

    EXPECT_EQ(registry_->get(id)->status, ContractStatus::SETTLED);

    auto request = engine_->get_request(request_id);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->status, SettlementStatus::EXECUTED);
    EXPECT_EQ(request->settlement_txid, settlement.txid);

    auto stats = engine_->stats();
    EXPECT_EQ(stats.executed, 1u);
    EXPECT_EQ(stats.total_paid_out, 666666u);
}

TEST_F(SettlementEngineTest, Execute_OutOfTheMoneyReturnsEverythingToPool) {
    std::string id = CreateCall();
    std::string request_id = OpenRequest(id, 6500000);

    auto result = engine_->execute(request_id, payout_address_, pool_address_);
    ASSERT_TRUE(result) << result.reason;

    EXPECT_FALSE(result.value.in_the_money);
    EXPECT_EQ(result.value.payout_amount, 0u);
    ASSERT_EQ(result.value.tx.outputs.size(), 1u);
    EXPECT_EQ(result.value.tx.outputs[0].value, 10249000u);
    EXPECT_TRUE(result.value.tx.inputs[0].witness[1].empty());

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.total_payout, 0u);
    EXPECT_EQ(snap.locked_collateral, 0u);
    EXPECT_EQ(snap.available_liquidity, 100250000u);
    EXPECT_EQ(snap.total_liquidity, 100250000u);
    EXPECT_EQ(registry_->get(id)->status, ContractStatus::SETTLED);
}

TEST_F(SettlementEngineTest, Execute_SubDustPayoutStillPaysBuyerExactly) {
    std::string id = CreateCall();
    // (7000300 - 7000000) * 1e7 / 7000300 = 428 sats, below the 546 dust limit
    std::string request_id = OpenRequest(id, 7000300);
    auto proof = engine_->get_request(request_id)->proof;
    ASSERT_TRUE(proof.has_value());
    ASSERT_TRUE(proof->is_itm);
    ASSERT_EQ(proof->settlement_amount, 428u);

    auto result = engine_->execute(request_id, payout_address_, pool_address_);
    ASSERT_TRUE(result) << result.reason;
    EXPECT_TRUE(result.value.in_the_money);
    EXPECT_EQ(result.value.payout_amount, proof->settlement_amount);

    const auto& outputs = result.value.tx.outputs;
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_EQ(outputs[0].value, 428u);
    EXPECT_EQ(outputs[1].value, 10250000u - 428 - 1000);

    PoolSnapshot snap = pool_->snapshot();
    EXPECT_EQ(snap.total_payout, proof->settlement_amount);
    EXPECT_EQ(snap.locked_collateral, 0u);
    EXPECT_EQ(snap.total_liquidity, 100250000u - 428);
    EXPECT_EQ(snap.available_liquidity, 100250000u - 428);

    auto events = pool_->history();
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[events.size() - 2].type, PoolEventType::SETTLEMENT_PAYOUT);
    EXPECT_EQ(events[events.size() - 2].amount, 428u);
    EXPECT_EQ(events[events.size() - 2].block_height, 800000u);
    EXPECT_EQ(events.back().amount, 10000000u - 428);
}

TEST_F(SettlementEngineTest, SubmitProof_CommitmentMismatchFailsRequest) {
    std::string id = CreateCall();
    auto request = engine_->create_request(id, 7500000, 800000);
    ASSERT_TRUE(request);

    SettlementProof proof = ProofFor(id, 7500000);
    proof.commitment[0] ^= 0x01;

    auto submitted = engine_->submit_proof(request.value, proof);
    EXPECT_EQ(submitted.error, ErrorCode::COMMITMENT_MISMATCH);

    auto stored = engine_->get_request(request.value);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, SettlementStatus::FAILED);
    EXPECT_EQ(stored->failure_code, ErrorCode::COMMITMENT_MISMATCH);
    EXPECT_FALSE(stored->proof.has_value());

    EXPECT_EQ(engine_->stats().proof_rejections, 1u);
    EXPECT_EQ(pool_->snapshot().locked_collateral, 10000000u);
    EXPECT_EQ(pool_->snapshot().total_payout, 0u);
    EXPECT_EQ(registry_->get(id)->status, ContractStatus::ACTIVE);

    // Terminal: no second proof, no execution
    EXPECT_EQ(engine_->submit_proof(request.value, ProofFor(id, 7500000)).error,
              ErrorCode::INVALID_REQUEST_STATE);
    EXPECT_EQ(engine_->execute(request.value, payout_address_, pool_address_).error,
              ErrorCode::PROOF_NOT_SUBMITTED);
}

TEST_F(SettlementEngineTest, SubmitProof_RejectsEveryTamperedField) {
    std::string id = CreateCall();

    auto submit = [&](SettlementProof proof) {
        auto request = engine_->create_request(id, 7500000, 800000);
        EXPECT_TRUE(request);
        return engine_->submit_proof(request.value, proof).error;
    };

    SettlementProof wrong_id = ProofFor(id, 7500000);
    wrong_id.option_id = "OPT-other";
    EXPECT_EQ(submit(wrong_id), ErrorCode::OPTION_ID_MISMATCH);

    SettlementProof inflated = ProofFor(id, 7500000);
    inflated.settlement_amount += 1;
    EXPECT_EQ(submit(inflated), ErrorCode::AMOUNT_MISMATCH);

    SettlementProof flipped = ProofFor(id, 7500000);
    flipped.is_itm = false;
    EXPECT_EQ(submit(flipped), ErrorCode::ITM_FLAG_MISMATCH);

    // Self-consistent proof at a different spot than requested
    SettlementProof other_spot = ProofFor(id, 8000000);
    EXPECT_EQ(submit(other_spot), ErrorCode::SPOT_PRICE_MISMATCH);

    SettlementProof oversized = ProofFor(id, 7500000);
    oversized.proof_bytes.assign(bitcoin::MAX_SCRIPT_ELEMENT_SIZE + 1, 0x00);
    EXPECT_EQ(submit(oversized), ErrorCode::PROOF_TOO_LARGE);

    auto stats = engine_->stats();
    EXPECT_EQ(stats.failed, 5u);
    EXPECT_EQ(stats.proof_rejections, 5u);
    EXPECT_EQ(pool_->snapshot().locked_collateral, 10000000u);
}

TEST_F(SettlementEngineTest, SubmitProof_UnknownRequest) {
    CreateCall();
    SettlementProof proof;
    EXPECT_EQ(engine_->submit_proof("SETTLE-missing", proof).error, ErrorCode::REQUEST_NOT_FOUND);
}

TEST_F(SettlementEngineTest, SubmitProof_SecondProofIsRejected) {
    std::string id = CreateCall();
    std::string request_id = OpenRequest(id, 7500000);

    EXPECT_EQ(engine_->submit_proof(request_id, ProofFor(id, 7500000)).error,
              ErrorCode::INVALID_REQUEST_STATE);

    ASSERT_TRUE(engine_->execute(request_id, payout_address_, pool_address_));
    EXPECT_EQ(engine_->submit_proof(request_id, ProofFor(id, 7500000)).error,
              ErrorCode::ALREADY_SETTLED);
}

TEST_F(SettlementEngineTest, CreateRequest_Preconditions) {
    std::string id = CreateCall();

    EXPECT_EQ(engine_->create_request("OPT-missing", 7500000, 800000).error,
              ErrorCode::CONTRACT_NOT_FOUND);
    EXPECT_EQ(engine_->create_request(id, 7500000, 799999).error, ErrorCode::NOT_EXPIRED);
    EXPECT_EQ(engine_->create_request(id, 0, 800000).error, ErrorCode::INVALID_SPOT_PRICE);
    EXPECT_EQ(engine_->stats().total_requests, 0u);

    auto request = engine_->create_request(id, 7500000, 800000);
    ASSERT_TRUE(request);
    EXPECT_EQ(request.value.rfind("SETTLE-" + id + "-", 0), 0u);
    EXPECT_EQ(engine_->status(request.value), SettlementStatus::PENDING);

    ASSERT_TRUE(registry_->mark_settled(id));
    EXPECT_EQ(engine_->create_request(id, 7500000, 800000).error, ErrorCode::NOT_ACTIVE);
}

TEST_F(SettlementEngineTest, Execute_TwiceIsAlreadySettled) {
    std::string id = CreateCall();
    std::string request_id = OpenRequest(id, 7500000);

    ASSERT_TRUE(engine_->execute(request_id, payout_address_, pool_address_));
    auto snap_after_first = pool_->snapshot();
    auto stats_after_first = engine_->stats();

    auto second = engine_->execute(request_id, payout_address_, pool_address_);
    EXPECT_EQ(second.error, ErrorCode::ALREADY_SETTLED);

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.total_payout, snap_after_first.total_payout);
    EXPECT_EQ(snap.total_liquidity, snap_after_first.total_liquidity);
    EXPECT_EQ(snap.available_liquidity, snap_after_first.available_liquidity);
    EXPECT_EQ(engine_->stats().total_paid_out, stats_after_first.total_paid_out);
    EXPECT_EQ(engine_->stats().executed, 1u);
}

TEST_F(SettlementEngineTest, Execute_SecondRequestForSettledContract) {
    std::string id = CreateCall();
    std::string first = OpenRequest(id, 7500000);
    std::string second = OpenRequest(id, 7500000);

    ASSERT_TRUE(engine_->execute(first, payout_address_, pool_address_));
    EXPECT_EQ(engine_->execute(second, payout_address_, pool_address_).error,
              ErrorCode::ALREADY_SETTLED);
    EXPECT_EQ(pool_->snapshot().total_payout, 666666u);
}

TEST_F(SettlementEngineTest, Execute_ConcurrentCallsPayOnce) {
    std::string id = CreateCall();
    std::vector<std::string> requests;
    for (int i = 0; i < 4; ++i) {
        requests.push_back(OpenRequest(id, 7500000));
    }

    std::atomic<int> successes{0};
    std::atomic<int> already_settled{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        const std::string request_id = requests[i % requests.size()];
        threads.emplace_back([&, request_id]() {
            auto result = engine_->execute(request_id, payout_address_, pool_address_);
            if (result) {
                successes++;
            } else if (result.error == ErrorCode::ALREADY_SETTLED) {
                already_settled++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(already_settled.load(), 7);

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.total_payout, 666666u);
    EXPECT_EQ(snap.total_liquidity, snap.available_liquidity + snap.locked_collateral);
    EXPECT_EQ(engine_->stats().total_paid_out, 666666u);
}

TEST_F(SettlementEngineTest, Execute_Preconditions) {
    EXPECT_EQ(engine_->execute("SETTLE-missing", payout_address_, pool_address_).error,
              ErrorCode::REQUEST_NOT_FOUND);

    std::string id = CreateCall();
    auto pending = engine_->create_request(id, 7500000, 800000);
    ASSERT_TRUE(pending);
    EXPECT_EQ(engine_->execute(pending.value, payout_address_, pool_address_).error,
              ErrorCode::PROOF_NOT_SUBMITTED);
}

TEST_F(SettlementEngineTest, Execute_RequiresFunding) {
    std::string id = CreateCall(false);
    std::string request_id = OpenRequest(id, 7500000);

    auto result = engine_->execute(request_id, payout_address_, pool_address_);
    EXPECT_EQ(result.error, ErrorCode::NOT_FUNDED);
    EXPECT_EQ(pool_->locked_for(id), 10000000u);
    EXPECT_EQ(engine_->status(request_id), SettlementStatus::PROOF_SUBMITTED);
}

TEST_F(SettlementEngineTest, Execute_InvalidAddressCanBeRetried) {
    std::string id = CreateCall();
    std::string request_id = OpenRequest(id, 7500000);

    std::string mainnet = bitcoin::encode_taproot_address(Network::MAINNET, testing_keys::buyer());
    EXPECT_EQ(engine_->execute(request_id, mainnet, pool_address_).error, ErrorCode::INVALID_ADDRESS);
    EXPECT_EQ(engine_->execute(request_id, payout_address_, "garbage").error,
              ErrorCode::INVALID_ADDRESS);
    EXPECT_EQ(engine_->status(request_id), SettlementStatus::PROOF_SUBMITTED);
    EXPECT_EQ(pool_->locked_for(id), 10000000u);

    EXPECT_TRUE(engine_->execute(request_id, payout_address_, pool_address_));
}

TEST_F(SettlementEngineTest, Execute_UnderfundedOutputCannotCoverPayout) {
    std::string id = CreateCall(false);
    OutPoint outpoint;
    outpoint.txid = crypto::sha256(std::string("short"));
    ASSERT_TRUE(registry_->record_funding(id, outpoint, 600000));

    std::string request_id = OpenRequest(id, 7500000);
    auto result = engine_->execute(request_id, payout_address_, pool_address_);
    EXPECT_EQ(result.error, ErrorCode::INSUFFICIENT_FUNDS);

    EXPECT_EQ(engine_->status(request_id), SettlementStatus::VALIDATED);
    EXPECT_EQ(pool_->snapshot().total_payout, 0u);
    EXPECT_EQ(registry_->get(id)->status, ContractStatus::ACTIVE);
}

TEST_F(SettlementEngineTest, Execute_SignerProvidesWitnessSignatures) {
    auto signer = std::make_shared<RecordingSigner>();
    engine_->set_signer(signer);

    std::string id = CreateCall();
    std::string request_id = OpenRequest(id, 7500000);

    auto result = engine_->execute(request_id, payout_address_, pool_address_);
    ASSERT_TRUE(result) << result.reason;

    ASSERT_EQ(signer->roles.size(), 2u);
    EXPECT_EQ(signer->roles[0], SignerRole::VERIFIER);
    EXPECT_EQ(signer->roles[1], SignerRole::BUYER);
    EXPECT_EQ(signer->contract_ids[0], id);

    const auto& witness = result.value.tx.inputs[0].witness;
    EXPECT_EQ(witness[0], Bytes(64, 0x10 + static_cast<int>(SignerRole::BUYER)));
    EXPECT_EQ(witness[2], Bytes(64, 0x10 + static_cast<int>(SignerRole::VERIFIER)));

    // Sighash covers the final transaction
    auto contract = registry_->get(id);
    std::vector<bitcoin::TxOut> spent{bitcoin::TxOut{result.value.input_value, contract->output_script}};
    Hash256 expected = bitcoin::taproot_script_path_sighash(
        result.value.tx, 0, spent, contract->spend_info.settlement.leaf_hash);
    EXPECT_EQ(result.value.sighash, expected);
    EXPECT_EQ(signer->sighashes[0], expected);
    EXPECT_EQ(signer->sighashes[1], expected);
}

TEST_F(SettlementEngineTest, Execute_SignsWithoutHoldingEngineLock) {
    auto signer = std::make_shared<InterleavingSigner>();
    engine_->set_signer(signer);

    std::string id = CreateCall();
    std::string first = OpenRequest(id, 7500000);
    std::string second = OpenRequest(id, 7500000);

    // Reads and a competing execute both run from inside the signer
    auto inner = Result<SettlementTransaction>::failure(ErrorCode::INVALID_REQUEST_STATE,
                                                        "signer never called");
    signer->on_first_sign = [&]() {
        EXPECT_EQ(engine_->status(first), SettlementStatus::VALIDATED);
        inner = engine_->execute(second, payout_address_, pool_address_);
    };

    auto outer = engine_->execute(first, payout_address_, pool_address_);

    ASSERT_TRUE(inner) << inner.reason;
    EXPECT_EQ(inner.value.payout_amount, 666666u);
    ASSERT_FALSE(outer);
    EXPECT_EQ(outer.error, ErrorCode::ALREADY_SETTLED);
    EXPECT_EQ(pool_->snapshot().total_payout, 666666u);
    EXPECT_EQ(engine_->stats().executed, 1u);
    EXPECT_EQ(engine_->status(first), SettlementStatus::VALIDATED);
}

TEST_F(SettlementEngineTest, Execute_OutOfTheMoneyAsksSellerToSign) {
    auto signer = std::make_shared<RecordingSigner>();
    engine_->set_signer(signer);

    std::string id = CreateCall();
    std::string request_id = OpenRequest(id, 6500000);
    ASSERT_TRUE(engine_->execute(request_id, payout_address_, pool_address_));

    ASSERT_EQ(signer->roles.size(), 2u);
    EXPECT_EQ(signer->roles[1], SignerRole::SELLER);
}

TEST_F(SettlementEngineTest, ProcessExpired_RequiresCollaborators) {
    CreateCall();
    EXPECT_TRUE(engine_->process_expired(800000).empty());
    EXPECT_EQ(engine_->stats().total_requests, 0u);
}

TEST_F(SettlementEngineTest, ProcessExpired_OpensAndProvesExpiredContracts) {
    auto feed = std::make_shared<StaticPriceFeed>(7500000);
    engine_->set_price_feed(feed);
    engine_->set_proof_generator(std::make_shared<LocalProofGenerator>(program_hash_));

    std::string id = CreateCall();

    EXPECT_TRUE(engine_->process_expired(799999).empty());

    auto processed = engine_->process_expired(800000);
    ASSERT_EQ(processed.size(), 1u);
    EXPECT_EQ(engine_->status(processed[0]), SettlementStatus::PROOF_SUBMITTED);

    // Open request exists, nothing new is created
    EXPECT_TRUE(engine_->process_expired(800001).empty());
    EXPECT_EQ(engine_->history(id).size(), 1u);

    ASSERT_TRUE(engine_->execute(processed[0], payout_address_, pool_address_));
    EXPECT_TRUE(engine_->process_expired(800002).empty());
    EXPECT_TRUE(registry_->get_expired(800002).empty());
}

TEST_F(SettlementEngineTest, ProcessExpired_SkipsWhenNoPrice) {
    auto feed = std::make_shared<StaticPriceFeed>(0);
    engine_->set_price_feed(feed);
    engine_->set_proof_generator(std::make_shared<LocalProofGenerator>(program_hash_));
    CreateCall();

    EXPECT_TRUE(engine_->process_expired(800000).empty());
    EXPECT_EQ(engine_->stats().total_requests, 0u);

    feed->set_price(6500000);
    EXPECT_EQ(engine_->process_expired(800000).size(), 1u);
}

TEST_F(SettlementEngineTest, ProcessExpired_ReusesPendingRequestWhileProverIsDown) {
    auto generator = std::make_shared<OfflineCapableProofGenerator>(program_hash_);
    auto feed = std::make_shared<StaticPriceFeed>(7500000);
    engine_->set_price_feed(feed);
    engine_->set_proof_generator(generator);
    std::string id = CreateCall();

    EXPECT_TRUE(engine_->process_expired(800000).empty());
    EXPECT_TRUE(engine_->process_expired(800000).empty());
    EXPECT_TRUE(engine_->process_expired(800001).empty());
    EXPECT_EQ(generator->calls, 3);

    EngineStats stats = engine_->stats();
    EXPECT_EQ(stats.total_requests, 1u);
    EXPECT_EQ(stats.pending, 1u);
    auto pending = engine_->history(id);
    ASSERT_EQ(pending.size(), 1u);

    // Retry keeps the spot of the original request
    feed->set_price(9000000);
    generator->online = true;
    auto processed = engine_->process_expired(800002);
    ASSERT_EQ(processed.size(), 1u);
    EXPECT_EQ(processed[0], pending[0].request_id);
    EXPECT_EQ(engine_->get_request(processed[0])->proof->spot_price, 7500000u);
    EXPECT_EQ(engine_->stats().total_requests, 1u);
}

TEST_F(SettlementEngineTest, ProcessExpired_RetriesAfterRejectedProof) {
    engine_->set_price_feed(std::make_shared<StaticPriceFeed>(7500000));
    engine_->set_proof_generator(std::make_shared<LocalProofGenerator>(program_hash_));

    std::string id = CreateCall();
    auto bad = engine_->create_request(id, 7500000, 800000);
    ASSERT_TRUE(bad);
    SettlementProof proof = ProofFor(id, 7500000);
    proof.settlement_amount = 1;
    ASSERT_FALSE(engine_->submit_proof(bad.value, proof));

    auto processed = engine_->process_expired(800000);
    ASSERT_EQ(processed.size(), 1u);
    EXPECT_NE(processed[0], bad.value);
    EXPECT_EQ(engine_->history(id).size(), 2u);
}
