#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace btcfi {

struct PoolConfig {
    Amount min_deposit{10000};                    // Smallest accepted LP deposit (sats)
};

struct ContractLimits {
    Price max_strike{1000000000000ULL};           // Sanity ceiling on strike
    Amount min_quantity{10000};                   // Smallest notional (sats)
    Amount max_quantity{10000000000ULL};          // 100 BTC
    uint32_t max_premium_bps{5000};               // Premium <= 50% of notional value
    uint32_t max_expiry_horizon{52560};           // ~1 year of blocks
    Price reference_unit_price{100000000};        // Price units per BTC for put collateral

    // Hash of the proof program every commitment binds to
    std::string proof_program_hash{"38b86064d300272bb05d3ac49fa40d1a2a1e5059ea1c58e97a55120a137c0762"};
};

struct SettlementConfig {
    uint32_t refund_grace_period{144};            // Blocks after expiry before seller refund
    Amount settlement_fee{1000};                  // Flat fee for the settlement tx (sats)
    Amount dust_limit{546};                       // Outputs below this are dropped
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    Network network{Network::REGTEST};

    PoolConfig pool;
    ContractLimits contracts;
    SettlementConfig settlement;
    LoggingConfig logging;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Parsed proof_program_hash (throws if malformed)
    Hash256 program_hash() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

std::optional<Network> parse_network(const std::string& name);

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace btcfi
