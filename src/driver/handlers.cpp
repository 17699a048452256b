// handlers.cpp - command execution

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <optional>
#include <sstream>
#include "fanout/driver/handlers.hpp"
#include "fanout/ledger/local_ledger.hpp"
#include "fanout/parallel/job.hpp"

namespace fanout::driver {

using parallel::async_job;
using parallel::job_t;
using parallel::worker_t;

namespace {

auto format_amount(double value, int precision) -> std::string {
    auto ss = std::ostringstream{};
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

auto format_sol(std::uint64_t lamports) -> std::string {
    return format_amount(lamports_to_sol(lamports), 9);
}

auto format_tokens(std::uint64_t subunits) -> std::string {
    return format_amount(subunits_to_coins(subunits), token_decimals);
}

auto elapsed_ms(std::chrono::steady_clock::time_point since) -> long long {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now() - since).count();
}

auto wallet_label(std::size_t index, const pubkey_t& account) -> std::string {
    return "[" + std::to_string(index) + "] " + account.to_string();
}

void sort_by_index(auto& rows) {
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.index < b.index; });
}

} // anonymous namespace

// =============================================================================
// handlers_t
// =============================================================================

handlers_t::handlers_t(const config_t& config, std::shared_ptr<ledger::ledger_client_t> client, console_t& console)
    : config_(config)
    , client_(std::move(client))
    , console_(console)
    , wallets_(wallet_keypairs(config)) {}

void handlers_t::execute(const command_t& command) {
    std::visit([this](const auto& c) { handle(c); }, command);
}

template<parallel::Job J>
auto handlers_t::make_worker() const -> worker_t<J> {
    if (auto lanes = worker_lanes(config_)) {
        return worker_t<J>(*lanes);
    }
    return worker_t<J>();
}

// =============================================================================
// Batched operations
// =============================================================================

auto handlers_t::sol_balances() -> std::vector<balance_row_t> {
    auto worker = make_worker<job_t<balance_row_t>>();

    for (std::size_t i = 0; i < wallets_.size(); ++i) {
        worker.push(async_job([client = client_, i, account = wallets_[i].pubkey(), &console = console_] {
            auto row = balance_row_t{i, account, std::nullopt, {}};
            try {
                row.amount = client->balance(account).get();
            } catch (const ledger::ledger_error& e) {
                row.error = e.what();
                console.error(wallet_label(i, account) + ": error: " + row.error);
            }
            return row;
        }));
    }
    auto rows = std::move(worker).run_all_joined_and_collect_results();
    sort_by_index(rows);
    return rows;
}

auto handlers_t::token_balances() -> std::vector<balance_row_t> {
    auto mint = token_mint(config_).pubkey();
    auto rows = std::vector<balance_row_t>(wallets_.size());
    auto worker = make_worker<job_t<void>>();

    // Each job fills its own row; a wallet without a token account shows zero
    for (std::size_t i = 0; i < wallets_.size(); ++i) {
        worker.push(async_job([client = client_, mint, i, account = wallets_[i].pubkey(), row = &rows[i], &console = console_] {
            *row = balance_row_t{i, account, 0, {}};
            try {
                row->amount = client->token_balance(mint, account).get();
            } catch (const ledger::ledger_error& e) {
                console.warn(wallet_label(i, account) + ": " + e.what());
            }
        }));
    }
    std::move(worker).run_single_threaded(worker_batch_size(config_));
    return rows;
}

auto handlers_t::airdrop(double sols, bool confirm) -> std::vector<airdrop_row_t> {
    auto targets = std::vector<pubkey_t>{};
    for (const auto& kp : wallets_) {
        targets.push_back(kp.pubkey());
    }
    if (!config_.token.owner.empty()) {
        targets.push_back(token_owner(config_).pubkey());
    }
    auto lamports = sol_to_lamports(sols);
    auto worker = make_worker<job_t<airdrop_row_t>>();

    for (std::size_t i = 0; i < targets.size(); ++i) {
        worker.push(async_job([client = client_, i, account = targets[i], lamports, &console = console_] {
            auto row = airdrop_row_t{i, account, std::nullopt, {}};
            try {
                row.signature = client->request_airdrop(account, lamports).get();
            } catch (const ledger::ledger_error& e) {
                row.error = e.what();
                console.error(wallet_label(i, account) + ": error: " + row.error);
            }
            return row;
        }));
    }
    auto rows = std::move(worker).run_all_joined_and_collect_results();
    sort_by_index(rows);

    if (confirm) {
        auto confirmed = confirm_all(rows);
        console_.info(std::to_string(confirmed) + " of " + std::to_string(rows.size()) + " airdrops confirmed");
    }
    return rows;
}

auto handlers_t::confirm_all(const std::vector<airdrop_row_t>& rows) -> std::size_t {
    auto poll = std::chrono::milliseconds(config_.worker.poll_ms);
    auto timeout = std::chrono::milliseconds(config_.worker.timeout_ms);
    auto confirmed = std::atomic<std::size_t>{0};
    auto worker = make_worker<job_t<void>>();

    for (const auto& row : rows) {
        if (!row.signature) {
            continue;
        }
        auto label = wallet_label(row.index, row.account);

        worker.push(async_job([client = client_, sig = *row.signature, label, poll, timeout, &confirmed, &console = console_] {
            auto start = std::chrono::steady_clock::now();
            try {
                ledger::wait_for_commitment(*client, sig, ledger::commitment_t::confirmed, poll, timeout);
                console.info(label + ": confirmed after " + std::to_string(elapsed_ms(start)) + " ms");
                ++confirmed;
            } catch (const ledger::ledger_error& e) {
                console.error(label + ": error: " + e.what());
            }
        }));
    }
    std::move(worker).run_single_threaded(worker_batch_size(config_));
    return confirmed;
}

template<typename Send>
auto handlers_t::run_transfers(const std::vector<transfer_case_t>& cases, const char* unit, Send send)
    -> transfer_summary_t
{
    auto poll = std::chrono::milliseconds(config_.worker.poll_ms);
    auto timeout = std::chrono::milliseconds(config_.worker.timeout_ms);
    auto succeeded = std::atomic<std::size_t>{0};
    auto failed = std::atomic<std::size_t>{0};
    auto summary = transfer_summary_t{};
    auto worker = make_worker<job_t<void>>();
    auto num_wallets = static_cast<int>(wallets_.size());

    for (std::size_t i = 0; i < cases.size(); ++i) {
        const auto& c = cases[i];

        if (c.from < 0 || c.from >= num_wallets || c.to < 0 || c.to >= num_wallets || c.from == c.to) {
            console_.warn("transfer " + std::to_string(i) + ": invalid wallet indices "
                + std::to_string(c.from) + " -> " + std::to_string(c.to) + ", skipped");
            ++summary.skipped;
            continue;
        }
        const auto& sender = wallets_[c.from];
        auto receiver = wallets_[c.to].pubkey();
        auto label = "transfer " + std::to_string(i) + ": " + std::to_string(c.from) + " -> "
            + std::to_string(c.to) + " " + format_amount(c.amount, 6) + " " + unit;

        worker.push(async_job([this, &succeeded, &failed, send, sender, receiver, amount = c.amount, label, poll, timeout] {
            try {
                auto start = std::chrono::steady_clock::now();
                auto sig = send(sender, receiver, amount).get();
                auto sent_ms = elapsed_ms(start);
                ledger::wait_for_commitment(*client_, sig, ledger::commitment_t::confirmed, poll, timeout);
                auto confirmed_ms = elapsed_ms(start);
                ledger::wait_for_commitment(*client_, sig, ledger::commitment_t::finalized, poll, timeout);
                auto finalized_ms = elapsed_ms(start);

                console_.print(label + " " + sig.text
                    + " sent " + std::to_string(sent_ms) + " ms"
                    + ", confirmed " + std::to_string(confirmed_ms) + " ms"
                    + ", finalized " + std::to_string(finalized_ms) + " ms");
                ++succeeded;
            } catch (const std::exception& e) {
                console_.error(label + " failed: " + e.what());
                ++failed;
            }
        }));
    }
    std::move(worker).run();

    summary.succeeded = succeeded;
    summary.failed = failed;
    return summary;
}

auto handlers_t::transfer_sols() -> transfer_summary_t {
    return run_transfers(config_.test.sols, "SOL",
        [client = client_](const keypair_t& sender, const pubkey_t& receiver, double amount) {
            return client->transfer(sender, receiver, sol_to_lamports(amount));
        });
}

auto handlers_t::transfer_tokens() -> transfer_summary_t {
    auto mint = token_mint(config_).pubkey();
    return run_transfers(config_.test.tokens, "tokens",
        [client = client_, mint](const keypair_t& sender, const pubkey_t& receiver, double amount) {
            return client->token_transfer(mint, sender, receiver, coins_to_subunits(amount));
        });
}

// =============================================================================
// Command handlers
// =============================================================================

void handlers_t::handle(const cmd::wallet_generate& c) {
    generate_wallets(c, console_);
}

void handlers_t::handle(const cmd::wallet_read& c) {
    read_wallet(c, console_);
}

void handlers_t::handle(const cmd::wallet_list& c) {
    auto show_pubkey = c.pubkey || !c.keypair;
    auto show_keypair = c.keypair || !c.pubkey;

    for (std::size_t i = 0; i < wallets_.size(); ++i) {
        auto line = "[" + std::to_string(i) + "]";
        if (show_pubkey) line += " " + wallets_[i].pubkey().to_string();
        if (show_keypair) line += " " + wallets_[i].to_string();
        console_.print(line);
    }
}

void handlers_t::handle(const cmd::wallet_save& c) {
    for (const auto& path : save_keypair_files(c.target, wallets_)) {
        console_.print(path.string());
    }
    console_.info("saved " + std::to_string(wallets_.size()) + " wallets to " + c.target);
}

void handlers_t::handle(const cmd::show_config&) {
    auto ss = std::ostringstream{};
    write_config(ss, config_);
    auto text = ss.str();
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    console_.print(text);
}

void handlers_t::handle(const cmd::balances&) {
    auto total = std::uint64_t{0};
    auto known = std::size_t{0};
    for (const auto& row : sol_balances()) {
        if (row.amount) {
            console_.print(wallet_label(row.index, row.account) + " " + format_sol(*row.amount) + " SOL");
            total += *row.amount;
            ++known;
        }
    }
    console_.info("total " + format_sol(total) + " SOL in " + std::to_string(known) + " of "
        + std::to_string(wallets_.size()) + " wallets");
}

void handlers_t::handle(const cmd::airdrop& c) {
    for (const auto& row : airdrop(c.sols, c.confirm)) {
        if (row.signature) {
            console_.print(wallet_label(row.index, row.account) + " " + row.signature->text);
        }
    }
}

void handlers_t::handle(const cmd::token_deploy&) {
    auto owner = token_owner(config_);
    auto mint = token_mint(config_);
    auto sig = client_->create_mint(owner, mint, token_decimals).get();
    console_.print(mint.pubkey().to_string() + " " + sig.text);
    console_.info("deployed mint " + mint.pubkey().to_string() + " owned by " + owner.pubkey().to_string());
}

void handlers_t::handle(const cmd::token_mint& c) {
    auto owner = token_owner(config_);
    auto mint = token_mint(config_).pubkey();
    auto holder = pubkey_t::parse(c.holder);
    auto sig = client_->mint_to(mint, owner, holder, coins_to_subunits(c.amount)).get();
    console_.print(sig.text);
    console_.info("minted " + format_amount(c.amount, token_decimals) + " tokens to " + holder.to_string());
}

void handlers_t::handle(const cmd::token_balances&) {
    for (const auto& row : token_balances()) {
        console_.print(wallet_label(row.index, row.account) + " " + format_tokens(row.amount.value_or(0)));
    }
}

void handlers_t::handle(const cmd::test_transfer_sols&) {
    auto s = transfer_sols();
    console_.info(std::to_string(s.succeeded) + " succeeded, " + std::to_string(s.failed) + " failed, "
        + std::to_string(s.skipped) + " skipped");
}

void handlers_t::handle(const cmd::test_transfer_tokens&) {
    auto s = transfer_tokens();
    console_.info(std::to_string(s.succeeded) + " succeeded, " + std::to_string(s.failed) + " failed, "
        + std::to_string(s.skipped) + " skipped");
}

void handlers_t::handle(const cmd::help&) {
    print_usage(console_);
}

// =============================================================================
// Commands that run without a configuration
// =============================================================================

void generate_wallets(const cmd::wallet_generate& c, console_t& console) {
    auto keypairs = generate_keypairs(c.count);

    for (const auto& kp : keypairs) {
        console.print(kp.to_string());
    }
    if (c.save_to) {
        save_keypair_files(*c.save_to, keypairs);
        console.info("saved " + std::to_string(keypairs.size()) + " wallets to " + *c.save_to);
    }
}

void read_wallet(const cmd::wallet_read& c, console_t& console) {
    auto kp = read_keypair_file(c.path);
    console.print(kp.to_string());
    console.info("pubkey " + kp.pubkey().to_string());
}

void print_usage(console_t& console) {
    auto text = std::string(usage_text);
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    console.print(text);
}

// =============================================================================
// Entry point
// =============================================================================

auto ledger_state_path(const std::filesystem::path& config_path, const config_t& config) -> std::filesystem::path {
    auto state = std::filesystem::path(config.ledger.state);
    if (state.is_absolute()) {
        return state;
    }
    return config_path.parent_path() / state;
}

void run(const invocation_t& invocation, console_t& console) {
    const auto& command = invocation.command;

    if (!needs_config(command)) {
        if (auto generate = std::get_if<cmd::wallet_generate>(&command)) {
            generate_wallets(*generate, console);
        } else if (auto read = std::get_if<cmd::wallet_read>(&command)) {
            read_wallet(*read, console);
        } else {
            print_usage(console);
        }
        return;
    }
    auto config_path = resolve_config_path(invocation.config_file);
    auto config = load_config(config_path);
    auto state_path = ledger_state_path(config_path, config);
    auto ledger = std::make_shared<ledger::local_ledger_t>(ledger_options(config));
    ledger->load_file(state_path);

    auto handlers = handlers_t(config, ledger, console);

    // Requests applied before a failure are still persisted
    try {
        handlers.execute(command);
    } catch (...) {
        ledger->save_file(state_path);
        throw;
    }
    ledger->save_file(state_path);
}

} // namespace fanout::driver
