#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"
#include "bitcoin/script.hpp"

namespace btcfi {
namespace bitcoin {

// Signals opt-in RBF and enables nLockTime
constexpr uint32_t SEQUENCE_ENABLE_LOCKTIME = 0xfffffffd;
constexpr uint32_t SEQUENCE_FINAL = 0xffffffff;

struct TxIn {
    OutPoint prevout;
    uint32_t sequence{SEQUENCE_FINAL};
    std::vector<Bytes> witness;
};

struct TxOut {
    Amount value{0};
    Script script_pubkey;
};

struct Transaction {
    int32_t version{2};
    std::vector<TxIn> inputs;
    std::vector<TxOut> outputs;
    uint32_t lock_time{0};

    bool has_witness() const;

    // BIP144 serialization; legacy layout when with_witness is false or no input has a witness
    Bytes serialize(bool with_witness = true) const;

    // dSHA256 of the non-witness serialization (internal byte order)
    Hash256 txid() const;

    // Txid in the usual reversed display order
    std::string txid_hex() const;

    std::string to_hex() const { return serialize_hex(true); }
    std::string serialize_hex(bool with_witness) const;

    Amount total_output() const;
};

/**
 * BIP341 signature hash for a tapscript spend with SIGHASH_DEFAULT, no annex
 * and no OP_CODESEPARATOR. spent_outputs must line up with tx.inputs.
 */
Hash256 taproot_script_path_sighash(const Transaction& tx,
                                    size_t input_index,
                                    const std::vector<TxOut>& spent_outputs,
                                    const Hash256& leaf_hash);

// Display-order hex to internal byte order
bool parse_txid_hex(const std::string& hex, Hash256& out);
std::string txid_to_hex(const Hash256& txid);

} // namespace bitcoin
} // namespace btcfi
