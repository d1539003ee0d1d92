#include <iostream>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "bitcoin/address.hpp"
#include "contracts/script_builder.hpp"
#include "contracts/contract_registry.hpp"
#include "pool/collateral_pool.hpp"
#include "settlement/settlement_engine.hpp"
#include "settlement/price_feed.hpp"
#include "settlement/proof_generator.hpp"
#include "monitoring/status_report.hpp"
#include "utils/crypto.hpp"

using namespace btcfi;

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/btcfi.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("btcfi", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

// Well-known x-only points (G, 2G, 3G) standing in for wallet keys
XOnlyPubKey demo_key(const std::string& hex) {
    XOnlyPubKey key{};
    if (!crypto::parse_hash256(hex, key)) {
        throw std::runtime_error("Bad demo key: " + hex);
    }
    return key;
}

// End-to-end run: fund the pool, write a call, settle it in the money
int run_demo(const Config& config) {
    const XOnlyPubKey buyer = demo_key("79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    const XOnlyPubKey seller = demo_key("c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5");
    const XOnlyPubKey verifier = demo_key("f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9");

    ScriptBuilder script_builder(config.settlement.refund_grace_period);
    CollateralPool pool(config.pool);
    ContractRegistry registry(config.contracts, config.network, pool, script_builder);
    SettlementEngine engine(config.settlement, config.network, pool, registry, script_builder);

    const Price settlement_spot = 7500000;
    auto feed = std::make_shared<StaticPriceFeed>(settlement_spot);
    engine.set_price_feed(feed);
    engine.set_proof_generator(std::make_shared<LocalProofGenerator>(config.program_hash()));

    const BlockHeight created_at = 799000;
    auto deposit = pool.add_liquidity("lp-demo", COIN, created_at);
    if (!deposit) {
        spdlog::error("Demo deposit failed: {}", deposit.reason);
        return 1;
    }

    CreateOptionRequest request;
    request.terms.kind = OptionKind::CALL;
    request.terms.strike_price = 7000000;
    request.terms.quantity = 10000000;
    request.terms.premium = 250000;
    request.terms.expiry_height = 800000;
    request.keys = ContractKeys{buyer, seller, verifier};

    auto created = registry.create(request, created_at);
    if (!created) {
        spdlog::error("Demo option rejected: {} ({})", error_to_string(created.error), created.reason);
        return 1;
    }
    const std::string& contract_id = created.value;
    auto contract = registry.get(contract_id);

    // Funding transaction is built by the wallet; only its outpoint is tracked here
    OutPoint funding;
    funding.txid = crypto::sha256(std::string("demo-funding-") + contract_id);
    funding.vout = 0;
    auto funded = registry.record_funding(contract_id, funding,
                                          contract->collateral + contract->terms.premium);
    if (!funded) {
        spdlog::error("Demo funding failed: {}", funded.reason);
        return 1;
    }

    auto processed = engine.process_expired(request.terms.expiry_height);
    if (processed.empty()) {
        spdlog::error("No settlement produced for {}", contract_id);
        return 1;
    }

    std::string payout_address = bitcoin::encode_taproot_address(config.network, buyer);
    std::string pool_address = bitcoin::encode_taproot_address(config.network, seller);

    for (const auto& request_id : processed) {
        auto settled = engine.execute(request_id, payout_address, pool_address);
        if (!settled) {
            spdlog::error("Settlement {} failed: {} ({})", request_id,
                          error_to_string(settled.error), settled.reason);
            return 1;
        }
        std::cout << "Settlement txid: " << settled.value.txid << "\n";
        std::cout << "Settlement tx:   " << settled.value.hex << "\n";
    }

    std::cout << build_status_report(pool, registry, engine).dump(2) << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"btcfi-node - Bitcoin option settlement and collateral engine"};

    std::string config_path = "configs/btcfi.json";
    std::string log_level;
    std::string network_name;
    std::string write_config_path;
    bool demo = false;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--log-level", log_level, "Override log level (debug, info, warn, error)");
    app.add_option("--network", network_name, "Override network (mainnet, testnet, signet, regtest)");
    app.add_option("--write-config", write_config_path, "Write the effective configuration and exit");
    app.add_flag("--demo", demo, "Run an end-to-end option lifecycle against in-memory state");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "btcfi-node v0.1.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    // Precedence: command line, then environment, then file
    std::string env_level = Config::get_env("BTCFI_LOG_LEVEL");
    if (!env_level.empty()) {
        config.logging.log_level = env_level;
    }
    if (!log_level.empty()) {
        config.logging.log_level = log_level;
    }
    if (!network_name.empty()) {
        auto network = parse_network(network_name);
        if (!network) {
            std::cerr << "Unknown network: " << network_name << "\n";
            return 1;
        }
        config.network = *network;
    }

    if (!write_config_path.empty()) {
        try {
            config.save(write_config_path);
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
        std::cout << "Configuration written to " << write_config_path << "\n";
        return 0;
    }

    setup_logging(config.logging);
    spdlog::info("btcfi-node starting on {}", network_to_string(config.network));

    if (!demo) {
        nlohmann::json effective = config;
        std::cout << effective.dump(2) << std::endl;
        spdlog::info("No action requested; use --demo to run a settlement lifecycle");
        return 0;
    }

    try {
        return run_demo(config);
    } catch (const std::exception& e) {
        spdlog::critical("Demo aborted: {}", e.what());
        return 1;
    }
}
