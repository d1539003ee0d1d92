#include "config/config.hpp"
#include "utils/crypto.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace btcfi {

void to_json(nlohmann::json& j, const PoolConfig& c) {
    j = nlohmann::json{
        {"min_deposit", c.min_deposit}
    };
}

void from_json(const nlohmann::json& j, PoolConfig& c) {
    if (j.contains("min_deposit")) j.at("min_deposit").get_to(c.min_deposit);
}

void to_json(nlohmann::json& j, const ContractLimits& c) {
    j = nlohmann::json{
        {"max_strike", c.max_strike},
        {"min_quantity", c.min_quantity},
        {"max_quantity", c.max_quantity},
        {"max_premium_bps", c.max_premium_bps},
        {"max_expiry_horizon", c.max_expiry_horizon},
        {"reference_unit_price", c.reference_unit_price},
        {"proof_program_hash", c.proof_program_hash}
    };
}

void from_json(const nlohmann::json& j, ContractLimits& c) {
    if (j.contains("max_strike")) j.at("max_strike").get_to(c.max_strike);
    if (j.contains("min_quantity")) j.at("min_quantity").get_to(c.min_quantity);
    if (j.contains("max_quantity")) j.at("max_quantity").get_to(c.max_quantity);
    if (j.contains("max_premium_bps")) j.at("max_premium_bps").get_to(c.max_premium_bps);
    if (j.contains("max_expiry_horizon")) j.at("max_expiry_horizon").get_to(c.max_expiry_horizon);
    if (j.contains("reference_unit_price")) j.at("reference_unit_price").get_to(c.reference_unit_price);
    if (j.contains("proof_program_hash")) j.at("proof_program_hash").get_to(c.proof_program_hash);
}

void to_json(nlohmann::json& j, const SettlementConfig& c) {
    j = nlohmann::json{
        {"refund_grace_period", c.refund_grace_period},
        {"settlement_fee", c.settlement_fee},
        {"dust_limit", c.dust_limit}
    };
}

void from_json(const nlohmann::json& j, SettlementConfig& c) {
    if (j.contains("refund_grace_period")) j.at("refund_grace_period").get_to(c.refund_grace_period);
    if (j.contains("settlement_fee")) j.at("settlement_fee").get_to(c.settlement_fee);
    if (j.contains("dust_limit")) j.at("dust_limit").get_to(c.dust_limit);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

std::optional<Network> parse_network(const std::string& name) {
    if (name == "mainnet" || name == "main") return Network::MAINNET;
    if (name == "testnet" || name == "test") return Network::TESTNET;
    if (name == "signet") return Network::SIGNET;
    if (name == "regtest") return Network::REGTEST;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"network", network_to_string(c.network)},
        {"pool", c.pool},
        {"contracts", c.contracts},
        {"settlement", c.settlement},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("network")) {
        std::string name = j.at("network").get<std::string>();
        auto network = parse_network(name);
        if (!network) {
            throw std::runtime_error("Unknown network: " + name);
        }
        c.network = *network;
    }
    if (j.contains("pool")) j.at("pool").get_to(c.pool);
    if (j.contains("contracts")) j.at("contracts").get_to(c.contracts);
    if (j.contains("settlement")) j.at("settlement").get_to(c.settlement);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (pool.min_deposit == 0) {
        spdlog::error("pool.min_deposit must be positive");
        return false;
    }

    if (contracts.max_strike == 0) {
        spdlog::error("contracts.max_strike must be positive");
        return false;
    }

    if (contracts.min_quantity == 0 || contracts.min_quantity > contracts.max_quantity) {
        spdlog::error("contracts quantity range is empty");
        return false;
    }

    if (contracts.max_premium_bps == 0 || contracts.max_premium_bps > 10000) {
        spdlog::error("contracts.max_premium_bps must be in (0, 10000]");
        return false;
    }

    if (contracts.max_expiry_horizon == 0) {
        spdlog::error("contracts.max_expiry_horizon must be positive");
        return false;
    }

    if (contracts.reference_unit_price == 0) {
        spdlog::error("contracts.reference_unit_price must be positive");
        return false;
    }

    Hash256 parsed{};
    if (!crypto::parse_hash256(contracts.proof_program_hash, parsed)) {
        spdlog::error("contracts.proof_program_hash must be 32 bytes of hex");
        return false;
    }

    if (settlement.settlement_fee < settlement.dust_limit) {
        spdlog::warn("settlement_fee is below the dust limit, settlement may relay poorly");
    }

    if (settlement.refund_grace_period == 0) {
        spdlog::warn("refund_grace_period is 0, seller can refund as soon as the option expires");
    }

    return true;
}

Hash256 Config::program_hash() const {
    Hash256 hash{};
    if (!crypto::parse_hash256(contracts.proof_program_hash, hash)) {
        throw std::runtime_error("Malformed proof_program_hash: " + contracts.proof_program_hash);
    }
    return hash;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace btcfi
