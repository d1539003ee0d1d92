#include "bitcoin/transaction.hpp"
#include "bitcoin/serialize.hpp"
#include "utils/crypto.hpp"
#include <algorithm>
#include <stdexcept>

namespace btcfi {
namespace bitcoin {

bool Transaction::has_witness() const {
    for (const auto& in : inputs) {
        if (!in.witness.empty()) {
            return true;
        }
    }
    return false;
}

Bytes Transaction::serialize(bool with_witness) const {
    const bool segwit = with_witness && has_witness();

    ByteWriter w;
    w.write_i32_le(version);
    if (segwit) {
        w.write_u8(0x00);  // marker
        w.write_u8(0x01);  // flag
    }

    w.write_compact_size(inputs.size());
    for (const auto& in : inputs) {
        w.write_hash(in.prevout.txid);
        w.write_u32_le(in.prevout.vout);
        w.write_compact_size(0);  // empty scriptSig
        w.write_u32_le(in.sequence);
    }

    w.write_compact_size(outputs.size());
    for (const auto& out : outputs) {
        w.write_u64_le(out.value);
        w.write_var_bytes(out.script_pubkey.bytes());
    }

    if (segwit) {
        for (const auto& in : inputs) {
            w.write_compact_size(in.witness.size());
            for (const auto& item : in.witness) {
                w.write_var_bytes(item);
            }
        }
    }

    w.write_u32_le(lock_time);
    return w.release();
}

Hash256 Transaction::txid() const {
    return crypto::sha256d(serialize(false));
}

std::string Transaction::txid_hex() const {
    return txid_to_hex(txid());
}

std::string Transaction::serialize_hex(bool with_witness) const {
    return crypto::hex_encode(serialize(with_witness));
}

Amount Transaction::total_output() const {
    Amount total = 0;
    for (const auto& out : outputs) {
        total += out.value;
    }
    return total;
}

Hash256 taproot_script_path_sighash(const Transaction& tx,
                                    size_t input_index,
                                    const std::vector<TxOut>& spent_outputs,
                                    const Hash256& leaf_hash) {
    if (input_index >= tx.inputs.size() || spent_outputs.size() != tx.inputs.size()) {
        throw std::invalid_argument("sighash: spent outputs do not match transaction inputs");
    }

    ByteWriter prevouts, amounts, script_pubkeys, sequences, outputs;
    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        prevouts.write_hash(tx.inputs[i].prevout.txid);
        prevouts.write_u32_le(tx.inputs[i].prevout.vout);
        amounts.write_u64_le(spent_outputs[i].value);
        script_pubkeys.write_var_bytes(spent_outputs[i].script_pubkey.bytes());
        sequences.write_u32_le(tx.inputs[i].sequence);
    }
    for (const auto& out : tx.outputs) {
        outputs.write_u64_le(out.value);
        outputs.write_var_bytes(out.script_pubkey.bytes());
    }

    ByteWriter msg;
    msg.write_u8(0x00);  // epoch
    msg.write_u8(0x00);  // SIGHASH_DEFAULT
    msg.write_i32_le(tx.version);
    msg.write_u32_le(tx.lock_time);
    msg.write_hash(crypto::sha256(prevouts.data()));
    msg.write_hash(crypto::sha256(amounts.data()));
    msg.write_hash(crypto::sha256(script_pubkeys.data()));
    msg.write_hash(crypto::sha256(sequences.data()));
    msg.write_hash(crypto::sha256(outputs.data()));
    msg.write_u8(0x02);  // spend_type: ext_flag = 1, no annex
    msg.write_u32_le(static_cast<uint32_t>(input_index));

    // Tapscript extension
    msg.write_hash(leaf_hash);
    msg.write_u8(0x00);  // key_version
    msg.write_u32_le(0xffffffff);  // codesep_pos

    return crypto::tagged_hash("TapSighash", msg.data());
}

bool parse_txid_hex(const std::string& hex, Hash256& out) {
    if (!crypto::parse_hash256(hex, out)) {
        return false;
    }
    std::reverse(out.begin(), out.end());
    return true;
}

std::string txid_to_hex(const Hash256& txid) {
    Hash256 display = txid;
    std::reverse(display.begin(), display.end());
    return crypto::hex_encode(display);
}

} // namespace bitcoin
} // namespace btcfi
