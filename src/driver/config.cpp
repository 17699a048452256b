// config.cpp - loading, validation and derived values of config_t

#include <cstdlib>
#include <fstream>
#include "fanout/ascii_reader.hpp"
#include "fanout/ascii_writer.hpp"
#include "fanout/driver/config.hpp"

namespace fanout::driver {

namespace {

void require_non_negative(int value, const char* name) {
    if (value < 0) {
        throw config_error(std::string(name) + " must not be negative, got " + std::to_string(value));
    }
}

void require_keypair(const std::string& text, const std::string& name) {
    try {
        (void)keypair_t::parse(text);
    } catch (const std::runtime_error& e) {
        throw config_error(name + ": " + e.what());
    }
}

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

auto read_config(std::istream& is) -> config_t {
    auto reader = ascii_reader(is);
    auto config = config_t{};
    std::apply([&reader](auto&&... fields) {
        (deserialize(reader, fields.name, fields.value), ...);
    }, config.fields());
    validate(config);
    return config;
}

auto load_config(const std::filesystem::path& path) -> config_t {
    auto file = std::ifstream(path);
    if (!file) {
        throw config_error("cannot open config file: " + path.string());
    }
    try {
        return read_config(file);
    } catch (const config_error&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw config_error("cannot parse config file " + path.string() + ": " + e.what());
    }
}

void write_config(std::ostream& os, const config_t& config) {
    auto writer = ascii_writer(os);
    std::apply([&writer](auto&&... fields) {
        (serialize(writer, fields.name, fields.value), ...);
    }, config.fields());
}

void validate(const config_t& config) {
    if (config.ledger.state.empty()) {
        throw config_error("ledger.state must name a file");
    }
    require_non_negative(config.ledger.latency_ms, "ledger.latency_ms");
    require_non_negative(config.ledger.confirm_ms, "ledger.confirm_ms");
    require_non_negative(config.ledger.finalize_ms, "ledger.finalize_ms");

    if (config.ledger.finalize_ms < config.ledger.confirm_ms) {
        throw config_error("ledger.finalize_ms must not be less than ledger.confirm_ms");
    }
    require_non_negative(config.worker.lanes, "worker.lanes");
    require_non_negative(config.worker.batch_size, "worker.batch_size");

    if (config.worker.poll_ms < 1) {
        throw config_error("worker.poll_ms must be at least 1");
    }
    if (config.worker.timeout_ms < 1) {
        throw config_error("worker.timeout_ms must be at least 1");
    }
    if (!config.token.owner.empty()) {
        require_keypair(config.token.owner, "token.owner");
    }
    if (!config.token.mint.empty()) {
        require_keypair(config.token.mint, "token.mint");
    }
    for (std::size_t i = 0; i < config.wallets.size(); ++i) {
        require_keypair(config.wallets[i], "wallets[" + std::to_string(i) + "]");
    }
    for (const auto* cases : {&config.test.sols, &config.test.tokens}) {
        for (const auto& c : *cases) {
            if (!(c.amount > 0.0)) {
                throw config_error("test transfer amount must be positive, got " + std::to_string(c.amount));
            }
        }
    }
}

auto resolve_config_path(const std::optional<std::string>& cli_value) -> std::filesystem::path {
    if (cli_value) {
        return *cli_value;
    }
    if (const char* env = std::getenv(config_env_var)) {
        if (*env != '\0') {
            return env;
        }
    }
    throw config_error(std::string("no config file: pass --config <path> or set ") + config_env_var);
}

// =============================================================================
// Derived values
// =============================================================================

auto wallet_keypairs(const config_t& config) -> std::vector<keypair_t> {
    auto keypairs = std::vector<keypair_t>{};
    keypairs.reserve(config.wallets.size());
    for (const auto& text : config.wallets) {
        keypairs.push_back(keypair_t::parse(text));
    }
    return keypairs;
}

auto token_owner(const config_t& config) -> keypair_t {
    if (config.token.owner.empty()) {
        throw config_error("token.owner is not configured");
    }
    return keypair_t::parse(config.token.owner);
}

auto token_mint(const config_t& config) -> keypair_t {
    if (config.token.mint.empty()) {
        throw config_error("token.mint is not configured");
    }
    return keypair_t::parse(config.token.mint);
}

auto ledger_options(const config_t& config) -> ledger::ledger_options_t {
    return ledger::ledger_options_t{
        std::chrono::milliseconds(config.ledger.latency_ms),
        std::chrono::milliseconds(config.ledger.confirm_ms),
        std::chrono::milliseconds(config.ledger.finalize_ms),
    };
}

auto worker_lanes(const config_t& config) -> std::optional<std::size_t> {
    if (config.worker.lanes == 0) return std::nullopt;
    return static_cast<std::size_t>(config.worker.lanes);
}

auto worker_batch_size(const config_t& config) -> std::optional<std::size_t> {
    if (config.worker.batch_size == 0) return std::nullopt;
    return static_cast<std::size_t>(config.worker.batch_size);
}

} // namespace fanout::driver
