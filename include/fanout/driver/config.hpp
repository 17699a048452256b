#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>
#include "../ledger/local_ledger.hpp"
#include "../parallel/worker.hpp"
#include "../serialize.hpp"
#include "../wallet.hpp"

namespace fanout::driver {

using parallel::config_error;

// Environment variable consulted when --config is not given
inline constexpr const char* config_env_var = "FANOUT_CONFIG_FILE";

// =============================================================================
// Configuration sections
// =============================================================================

struct ledger_config_t {
    std::string state = "ledger.state";
    int latency_ms = 20;
    int confirm_ms = 400;
    int finalize_ms = 1200;

    auto fields() const {
        return std::make_tuple(field("state", state), field("latency_ms", latency_ms),
                               field("confirm_ms", confirm_ms), field("finalize_ms", finalize_ms));
    }
    auto fields() {
        return std::make_tuple(field("state", state), field("latency_ms", latency_ms),
                               field("confirm_ms", confirm_ms), field("finalize_ms", finalize_ms));
    }
};

struct worker_config_t {
    int lanes = 0;          // 0 = hardware parallelism
    int batch_size = 0;     // 0 = lane count
    int poll_ms = 100;
    int timeout_ms = 30000;

    auto fields() const {
        return std::make_tuple(field("lanes", lanes), field("batch_size", batch_size),
                               field("poll_ms", poll_ms), field("timeout_ms", timeout_ms));
    }
    auto fields() {
        return std::make_tuple(field("lanes", lanes), field("batch_size", batch_size),
                               field("poll_ms", poll_ms), field("timeout_ms", timeout_ms));
    }
};

struct token_config_t {
    std::string owner;
    std::string mint;

    auto fields() const { return std::make_tuple(field("owner", owner), field("mint", mint)); }
    auto fields() { return std::make_tuple(field("owner", owner), field("mint", mint)); }
};

struct transfer_case_t {
    int from = 0;
    int to = 0;
    double amount = 0.0;

    auto fields() const { return std::make_tuple(field("from", from), field("to", to), field("amount", amount)); }
    auto fields() { return std::make_tuple(field("from", from), field("to", to), field("amount", amount)); }
};

struct test_config_t {
    std::vector<transfer_case_t> sols;
    std::vector<transfer_case_t> tokens;

    auto fields() const { return std::make_tuple(field("sols", sols), field("tokens", tokens)); }
    auto fields() { return std::make_tuple(field("sols", sols), field("tokens", tokens)); }
};

struct config_t {
    ledger_config_t ledger;
    worker_config_t worker;
    token_config_t token;
    test_config_t test;
    std::vector<std::string> wallets;

    auto fields() const {
        return std::make_tuple(field("ledger", ledger), field("worker", worker), field("token", token),
                               field("test", test), field("wallets", wallets));
    }
    auto fields() {
        return std::make_tuple(field("ledger", ledger), field("worker", worker), field("token", token),
                               field("test", test), field("wallets", wallets));
    }
};

// =============================================================================
// Loading
// =============================================================================

// Parse and validate; missing sections keep their defaults
auto read_config(std::istream& is) -> config_t;
auto load_config(const std::filesystem::path& path) -> config_t;
void write_config(std::ostream& os, const config_t& config);

// Throws config_error describing the first invalid value
void validate(const config_t& config);

// --config value if given, else $FANOUT_CONFIG_FILE
auto resolve_config_path(const std::optional<std::string>& cli_value) -> std::filesystem::path;

// =============================================================================
// Derived values
// =============================================================================

auto wallet_keypairs(const config_t& config) -> std::vector<keypair_t>;
auto token_owner(const config_t& config) -> keypair_t;
auto token_mint(const config_t& config) -> keypair_t;
auto ledger_options(const config_t& config) -> ledger::ledger_options_t;

// nullopt defers to the worker's own defaults
auto worker_lanes(const config_t& config) -> std::optional<std::size_t>;
auto worker_batch_size(const config_t& config) -> std::optional<std::size_t>;

} // namespace fanout::driver
