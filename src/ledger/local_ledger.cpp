// local_ledger.cpp - implementation of local_ledger_t

#include <fstream>
#include <thread>
#include "fanout/ascii_reader.hpp"
#include "fanout/ascii_writer.hpp"
#include "fanout/ledger/local_ledger.hpp"

namespace fanout::ledger {

namespace {

auto to_ms(std::chrono::system_clock::time_point t) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

auto from_ms(std::int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

void require_funds(std::uint64_t available, std::uint64_t needed, const pubkey_t& account, const char* what) {
    if (available < needed) {
        throw ledger_error("insufficient " + std::string(what) + " in " + account.to_string()
            + ": have " + std::to_string(available) + ", need " + std::to_string(needed));
    }
}

} // anonymous namespace

local_ledger_t::local_ledger_t(ledger_options_t options)
    : options_(options)
    , rng_(std::random_device{}())
{
}

// =============================================================================
// Request plumbing
// =============================================================================

template<typename F>
auto local_ledger_t::serve(F request) -> std::future<decltype(request())> {
    return std::async(std::launch::async, [this, request = std::move(request)]() mutable {
        std::this_thread::sleep_for(options_.latency);
        auto lock = std::lock_guard<std::mutex>(mutex_);
        return request();
    });
}

void local_ledger_t::charge_fee(const pubkey_t& payer) {
    auto it = lamports_.find(payer);
    require_funds(it == lamports_.end() ? 0 : it->second, fee_lamports, payer, "lamports for fee");
    it->second -= fee_lamports;
}

auto local_ledger_t::record_transaction(std::string memo) -> signature_t {
    static constexpr const char* digits = "0123456789abcdef";
    auto sig = signature_t{};

    do {
        sig.text.clear();
        for (int i = 0; i < 4; ++i) {
            auto word = rng_();
            for (int j = 0; j < 16; ++j) {
                sig.text += digits[word & 0x0f];
                word >>= 4;
            }
        }
    } while (transactions_.count(sig));

    transactions_.emplace(sig, transaction_info_t{clock_t::now(), std::move(memo)});
    return sig;
}

// =============================================================================
// Accounts
// =============================================================================

auto local_ledger_t::balance(const pubkey_t& account) -> std::future<std::uint64_t> {
    return serve([this, account] {
        auto it = lamports_.find(account);
        return it == lamports_.end() ? std::uint64_t(0) : it->second;
    });
}

auto local_ledger_t::request_airdrop(const pubkey_t& account, std::uint64_t lamports) -> std::future<signature_t> {
    return serve([this, account, lamports] {
        if (lamports == 0) {
            throw ledger_error("airdrop amount must be positive");
        }
        lamports_[account] += lamports;
        return record_transaction("airdrop");
    });
}

auto local_ledger_t::transfer(const keypair_t& sender,
                              const pubkey_t& receiver,
                              std::uint64_t lamports,
                              std::optional<std::string> memo) -> std::future<signature_t>
{
    return serve([this, from = sender.pubkey(), receiver, lamports, memo = std::move(memo)] {
        if (from == receiver) {
            throw ledger_error("sender and receiver are the same account " + from.to_string());
        }
        auto available = lamports_.count(from) ? lamports_[from] : std::uint64_t(0);
        require_funds(available, lamports + fee_lamports, from, "lamports");
        lamports_[from] -= lamports + fee_lamports;
        lamports_[receiver] += lamports;
        return record_transaction(memo.value_or(""));
    });
}

auto local_ledger_t::signature_status(const signature_t& sig) -> std::future<std::optional<commitment_t>> {
    return serve([this, sig]() -> std::optional<commitment_t> {
        auto it = transactions_.find(sig);
        if (it == transactions_.end()) {
            return std::nullopt;
        }
        auto age = clock_t::now() - it->second.applied_at;
        if (age >= options_.finalize_after) return commitment_t::finalized;
        if (age >= options_.confirm_after) return commitment_t::confirmed;
        return commitment_t::processed;
    });
}

// =============================================================================
// Tokens
// =============================================================================

auto local_ledger_t::create_mint(const keypair_t& owner, const keypair_t& mint, int decimals) -> std::future<signature_t> {
    return serve([this, owner = owner.pubkey(), mint = mint.pubkey(), decimals] {
        if (decimals < 0 || decimals > 18) {
            throw ledger_error("invalid token decimals " + std::to_string(decimals));
        }
        if (mints_.count(mint)) {
            throw ledger_error("mint " + mint.to_string() + " already exists");
        }
        charge_fee(owner);
        mints_.emplace(mint, mint_info_t{owner, decimals, 0});
        return record_transaction("create mint");
    });
}

auto local_ledger_t::mint_to(const pubkey_t& mint,
                             const keypair_t& owner,
                             const pubkey_t& holder,
                             std::uint64_t amount) -> std::future<signature_t>
{
    return serve([this, mint, owner = owner.pubkey(), holder, amount] {
        auto it = mints_.find(mint);
        if (it == mints_.end()) {
            throw ledger_error("unknown mint " + mint.to_string());
        }
        if (it->second.owner != owner) {
            throw ledger_error(owner.to_string() + " is not the mint authority of " + mint.to_string());
        }
        charge_fee(owner);
        it->second.supply += amount;
        tokens_[{mint, holder}] += amount;
        return record_transaction("mint to");
    });
}

auto local_ledger_t::token_balance(const pubkey_t& mint, const pubkey_t& holder) -> std::future<std::uint64_t> {
    return serve([this, mint, holder] {
        auto it = tokens_.find({mint, holder});
        if (it == tokens_.end()) {
            throw ledger_error("no token account for " + holder.to_string() + " on mint " + mint.to_string());
        }
        return it->second;
    });
}

auto local_ledger_t::token_transfer(const pubkey_t& mint,
                                    const keypair_t& sender,
                                    const pubkey_t& receiver,
                                    std::uint64_t amount) -> std::future<signature_t>
{
    return serve([this, mint, from = sender.pubkey(), receiver, amount] {
        if (!mints_.count(mint)) {
            throw ledger_error("unknown mint " + mint.to_string());
        }
        auto it = tokens_.find({mint, from});
        if (it == tokens_.end()) {
            throw ledger_error("no token account for " + from.to_string() + " on mint " + mint.to_string());
        }
        require_funds(it->second, amount, from, "tokens");
        charge_fee(from);
        it->second -= amount;
        tokens_[{mint, receiver}] += amount;
        return record_transaction("token transfer");
    });
}

// =============================================================================
// Persistence
// =============================================================================

auto local_ledger_t::state() const -> ledger_state_t {
    auto lock = std::lock_guard<std::mutex>(mutex_);
    auto s = ledger_state_t{};

    for (const auto& [account, lamports] : lamports_) {
        s.accounts.push_back({account.to_string(), lamports});
    }
    for (const auto& [mint, info] : mints_) {
        s.mints.push_back({mint.to_string(), info.owner.to_string(), info.decimals, info.supply});
    }
    for (const auto& [key, amount] : tokens_) {
        s.token_accounts.push_back({key.first.to_string(), key.second.to_string(), amount});
    }
    for (const auto& [sig, info] : transactions_) {
        s.transactions.push_back({sig.text, to_ms(info.applied_at), info.memo});
    }
    return s;
}

void local_ledger_t::restore(const ledger_state_t& s) {
    auto lamports = std::map<pubkey_t, std::uint64_t>{};
    auto mints = std::map<pubkey_t, mint_info_t>{};
    auto tokens = std::map<std::pair<pubkey_t, pubkey_t>, std::uint64_t>{};
    auto transactions = std::map<signature_t, transaction_info_t>{};

    for (const auto& a : s.accounts) {
        lamports[pubkey_t::parse(a.address)] = a.lamports;
    }
    for (const auto& m : s.mints) {
        mints[pubkey_t::parse(m.address)] = mint_info_t{pubkey_t::parse(m.owner), m.decimals, m.supply};
    }
    for (const auto& t : s.token_accounts) {
        tokens[{pubkey_t::parse(t.mint), pubkey_t::parse(t.holder)}] = t.amount;
    }
    for (const auto& t : s.transactions) {
        transactions[signature_t{t.signature}] = transaction_info_t{from_ms(t.applied_at_ms), t.memo};
    }

    auto lock = std::lock_guard<std::mutex>(mutex_);
    lamports_ = std::move(lamports);
    mints_ = std::move(mints);
    tokens_ = std::move(tokens);
    transactions_ = std::move(transactions);
}

void local_ledger_t::load(std::istream& is) {
    auto reader = ascii_reader(is);
    auto s = ledger_state_t{};
    std::apply([&reader](auto&&... fields) {
        (deserialize(reader, fields.name, fields.value), ...);
    }, s.fields());
    restore(s);
}

void local_ledger_t::save(std::ostream& os) const {
    auto writer = ascii_writer(os);
    auto s = state();
    std::apply([&writer](auto&&... fields) {
        (serialize(writer, fields.name, fields.value), ...);
    }, s.fields());
}

void local_ledger_t::load_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return;
    }
    auto file = std::ifstream(path);
    if (!file) {
        throw std::runtime_error("cannot read ledger state: " + path.string());
    }
    try {
        load(file);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("cannot parse ledger state " + path.string() + ": " + e.what());
    }
}

void local_ledger_t::save_file(const std::filesystem::path& path) const {
    auto tmp = path;
    tmp += ".tmp";
    {
        auto file = std::ofstream(tmp);
        if (!file) {
            throw std::runtime_error("cannot write ledger state: " + tmp.string());
        }
        save(file);
        if (!file) {
            throw std::runtime_error("failed writing ledger state: " + tmp.string());
        }
    }
    std::filesystem::rename(tmp, path);
}

} // namespace fanout::ledger
