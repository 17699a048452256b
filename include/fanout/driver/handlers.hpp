#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "command.hpp"
#include "config.hpp"
#include "console.hpp"
#include "../ledger/ledger.hpp"
#include "../parallel/worker.hpp"
#include "../wallet.hpp"

namespace fanout::driver {

// =============================================================================
// Result rows
// =============================================================================

// A failed request leaves the value empty and the reason in `error`

struct balance_row_t {
    std::size_t index;
    pubkey_t account;
    std::optional<std::uint64_t> amount;
    std::string error;
};

struct airdrop_row_t {
    std::size_t index;
    pubkey_t account;
    std::optional<ledger::signature_t> signature;
    std::string error;
};

struct transfer_summary_t {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
};

// =============================================================================
// handlers_t - executes the commands that need a configuration
// =============================================================================
//
// Batched ledger requests go through parallel::worker_t, sized from the
// worker section of the config. Output goes through a console_t so that
// lines printed by concurrent jobs do not interleave.

class handlers_t {
public:
    handlers_t(const config_t& config, std::shared_ptr<ledger::ledger_client_t> client, console_t& console);

    handlers_t(const handlers_t&) = delete;
    handlers_t& operator=(const handlers_t&) = delete;

    void execute(const command_t& command);

    // --- Batched operations (also used by the handlers below) ---

    // Rows are sorted by wallet index. Each job reports its own failure to
    // the console and records it in its row.
    auto sol_balances() -> std::vector<balance_row_t>;
    auto token_balances() -> std::vector<balance_row_t>;

    // Every wallet, then the token owner if one is configured
    auto airdrop(double sols, bool confirm) -> std::vector<airdrop_row_t>;

    auto transfer_sols() -> transfer_summary_t;
    auto transfer_tokens() -> transfer_summary_t;

private:
    const config_t& config_;
    std::shared_ptr<ledger::ledger_client_t> client_;
    console_t& console_;
    std::vector<keypair_t> wallets_;

    template<parallel::Job J>
    auto make_worker() const -> parallel::worker_t<J>;

    // Wait for each airdrop in `rows` to be confirmed, at most batch_size
    // polls in flight. Returns the number confirmed.
    auto confirm_all(const std::vector<airdrop_row_t>& rows) -> std::size_t;

    template<typename Send>
    auto run_transfers(const std::vector<transfer_case_t>& cases, const char* unit, Send send) -> transfer_summary_t;

    void handle(const cmd::wallet_generate& c);
    void handle(const cmd::wallet_read& c);
    void handle(const cmd::wallet_list& c);
    void handle(const cmd::wallet_save& c);
    void handle(const cmd::show_config& c);
    void handle(const cmd::balances& c);
    void handle(const cmd::airdrop& c);
    void handle(const cmd::token_deploy& c);
    void handle(const cmd::token_mint& c);
    void handle(const cmd::token_balances& c);
    void handle(const cmd::test_transfer_sols& c);
    void handle(const cmd::test_transfer_tokens& c);
    void handle(const cmd::help& c);
};

// =============================================================================
// Commands that run without a configuration
// =============================================================================

void generate_wallets(const cmd::wallet_generate& c, console_t& console);
void read_wallet(const cmd::wallet_read& c, console_t& console);
void print_usage(console_t& console);

// =============================================================================
// Entry point
// =============================================================================

// A relative ledger state path is taken relative to the config file
auto ledger_state_path(const std::filesystem::path& config_path, const config_t& config) -> std::filesystem::path;

// Load config and ledger state as needed, execute, persist the ledger.
// Exceptions propagate to the caller.
void run(const invocation_t& invocation, console_t& console);

} // namespace fanout::driver
