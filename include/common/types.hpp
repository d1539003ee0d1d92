#pragma once

#include <array>
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace btcfi {

// Time helpers
using WallClock = std::chrono::time_point<std::chrono::system_clock>;

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Monetary amounts are integer satoshis, prices are integer smallest price units (cents)
using Amount = uint64_t;
using Price = uint64_t;
using BlockHeight = uint32_t;

using Bytes = std::vector<uint8_t>;
using Hash256 = std::array<uint8_t, 32>;
using XOnlyPubKey = std::array<uint8_t, 32>;

constexpr Amount COIN = 100000000;

// Option kind
enum class OptionKind {
    CALL,
    PUT
};

inline std::string option_kind_to_string(OptionKind k) {
    return k == OptionKind::CALL ? "CALL" : "PUT";
}

// Contract status (monotonic: ACTIVE -> SETTLED)
enum class ContractStatus {
    ACTIVE,
    SETTLED
};

inline std::string contract_status_to_string(ContractStatus s) {
    switch (s) {
        case ContractStatus::ACTIVE: return "ACTIVE";
        case ContractStatus::SETTLED: return "SETTLED";
    }
    return "UNKNOWN";
}

// Settlement request lifecycle
enum class SettlementStatus {
    PENDING,          // Created, waiting for a proof
    PROOF_SUBMITTED,  // Proof passed validation and is stored
    VALIDATED,        // Re-checked against the registry at execution time
    EXECUTED,         // Funds moved, contract settled (terminal)
    FAILED            // Proof rejected (terminal)
};

inline std::string settlement_status_to_string(SettlementStatus s) {
    switch (s) {
        case SettlementStatus::PENDING: return "PENDING";
        case SettlementStatus::PROOF_SUBMITTED: return "PROOF_SUBMITTED";
        case SettlementStatus::VALIDATED: return "VALIDATED";
        case SettlementStatus::EXECUTED: return "EXECUTED";
        case SettlementStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

// Bitcoin network (selects the bech32 human readable part)
enum class Network {
    MAINNET,
    TESTNET,
    SIGNET,
    REGTEST
};

inline std::string network_to_string(Network n) {
    switch (n) {
        case Network::MAINNET: return "mainnet";
        case Network::TESTNET: return "testnet";
        case Network::SIGNET: return "signet";
        case Network::REGTEST: return "regtest";
    }
    return "unknown";
}

inline std::string bech32_hrp(Network n) {
    switch (n) {
        case Network::MAINNET: return "bc";
        case Network::TESTNET: return "tb";
        case Network::SIGNET: return "tb";
        case Network::REGTEST: return "bcrt";
    }
    return "bc";
}

// Reference to a transaction output. Txid is kept in internal (little-endian) byte order.
struct OutPoint {
    Hash256 txid{};
    uint32_t vout{0};

    bool operator==(const OutPoint& other) const {
        return txid == other.txid && vout == other.vout;
    }
};

} // namespace btcfi
