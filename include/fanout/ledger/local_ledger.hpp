#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <map>
#include <mutex>
#include <ostream>
#include <random>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include "ledger.hpp"
#include "../serialize.hpp"

namespace fanout::ledger {

// =============================================================================
// Persisted records
// =============================================================================

struct account_record_t {
    std::string address;
    std::uint64_t lamports = 0;

    auto fields() const { return std::make_tuple(field("address", address), field("lamports", lamports)); }
    auto fields() { return std::make_tuple(field("address", address), field("lamports", lamports)); }
};

struct mint_record_t {
    std::string address;
    std::string owner;
    int decimals = 0;
    std::uint64_t supply = 0;

    auto fields() const {
        return std::make_tuple(field("address", address), field("owner", owner),
                               field("decimals", decimals), field("supply", supply));
    }
    auto fields() {
        return std::make_tuple(field("address", address), field("owner", owner),
                               field("decimals", decimals), field("supply", supply));
    }
};

struct token_record_t {
    std::string mint;
    std::string holder;
    std::uint64_t amount = 0;

    auto fields() const { return std::make_tuple(field("mint", mint), field("holder", holder), field("amount", amount)); }
    auto fields() { return std::make_tuple(field("mint", mint), field("holder", holder), field("amount", amount)); }
};

struct transaction_record_t {
    std::string signature;
    std::int64_t applied_at_ms = 0;
    std::string memo;

    auto fields() const {
        return std::make_tuple(field("signature", signature), field("applied_at_ms", applied_at_ms), field("memo", memo));
    }
    auto fields() {
        return std::make_tuple(field("signature", signature), field("applied_at_ms", applied_at_ms), field("memo", memo));
    }
};

struct ledger_state_t {
    std::vector<account_record_t> accounts;
    std::vector<mint_record_t> mints;
    std::vector<token_record_t> token_accounts;
    std::vector<transaction_record_t> transactions;

    auto fields() const {
        return std::make_tuple(field("accounts", accounts), field("mints", mints),
                               field("token_accounts", token_accounts), field("transactions", transactions));
    }
    auto fields() {
        return std::make_tuple(field("accounts", accounts), field("mints", mints),
                               field("token_accounts", token_accounts), field("transactions", transactions));
    }
};

// =============================================================================
// local_ledger_t - in-process ledger with simulated latency and commitment
// =============================================================================
//
// Each request is served on a thread of its own after `latency`, then applied
// atomically under one mutex. A transaction is processed when applied,
// confirmed `confirm_after` later and finalized `finalize_after` later.

struct ledger_options_t {
    std::chrono::milliseconds latency{20};
    std::chrono::milliseconds confirm_after{400};
    std::chrono::milliseconds finalize_after{1200};
};

class local_ledger_t : public ledger_client_t {
public:
    explicit local_ledger_t(ledger_options_t options = {});

    auto balance(const pubkey_t& account) -> std::future<std::uint64_t> override;
    auto request_airdrop(const pubkey_t& account, std::uint64_t lamports) -> std::future<signature_t> override;
    auto transfer(const keypair_t& sender,
                  const pubkey_t& receiver,
                  std::uint64_t lamports,
                  std::optional<std::string> memo = std::nullopt) -> std::future<signature_t> override;
    auto signature_status(const signature_t& sig) -> std::future<std::optional<commitment_t>> override;

    auto create_mint(const keypair_t& owner, const keypair_t& mint, int decimals) -> std::future<signature_t> override;
    auto mint_to(const pubkey_t& mint,
                 const keypair_t& owner,
                 const pubkey_t& holder,
                 std::uint64_t amount) -> std::future<signature_t> override;
    auto token_balance(const pubkey_t& mint, const pubkey_t& holder) -> std::future<std::uint64_t> override;
    auto token_transfer(const pubkey_t& mint,
                        const keypair_t& sender,
                        const pubkey_t& receiver,
                        std::uint64_t amount) -> std::future<signature_t> override;

    // --- Persistence ---

    auto state() const -> ledger_state_t;
    void restore(const ledger_state_t& state);

    void load(std::istream& is);
    void save(std::ostream& os) const;

    // A missing file leaves the ledger empty
    void load_file(const std::filesystem::path& path);
    void save_file(const std::filesystem::path& path) const;

private:
    using clock_t = std::chrono::system_clock;

    struct mint_info_t {
        pubkey_t owner;
        int decimals;
        std::uint64_t supply;
    };

    struct transaction_info_t {
        clock_t::time_point applied_at;
        std::string memo;
    };

    ledger_options_t options_;
    mutable std::mutex mutex_;
    std::mt19937_64 rng_;
    std::map<pubkey_t, std::uint64_t> lamports_;
    std::map<pubkey_t, mint_info_t> mints_;
    std::map<std::pair<pubkey_t, pubkey_t>, std::uint64_t> tokens_;
    std::map<signature_t, transaction_info_t> transactions_;

    template<typename F>
    auto serve(F request) -> std::future<decltype(request())>;

    // Called with mutex_ held
    void charge_fee(const pubkey_t& payer);
    auto record_transaction(std::string memo) -> signature_t;
};

} // namespace fanout::ledger
