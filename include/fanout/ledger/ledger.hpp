#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>
#include "../wallet.hpp"

namespace fanout::ledger {

// =============================================================================
// Types
// =============================================================================

// Commitment a transaction has reached, weakest first
enum class commitment_t { processed, confirmed, finalized };

inline const char* to_string(commitment_t c) {
    switch (c) {
        case commitment_t::processed: return "processed";
        case commitment_t::confirmed: return "confirmed";
        case commitment_t::finalized: return "finalized";
    }
    return "unknown";
}

struct signature_t {
    std::string text;

    auto to_string() const -> const std::string& { return text; }
    auto operator<=>(const signature_t&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const signature_t& sig) {
    return os << sig.text;
}

// Fee charged to the signer of every transaction except airdrops
inline constexpr std::uint64_t fee_lamports = 5000;

class ledger_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// =============================================================================
// ledger_client_t - asynchronous ledger requests
// =============================================================================
//
// Every request returns immediately; failures surface as ledger_error from
// the future's get(). Implementations are safe to share between threads.

struct ledger_client_t {
    virtual ~ledger_client_t() = default;

    // Accounts
    virtual auto balance(const pubkey_t& account) -> std::future<std::uint64_t> = 0;
    virtual auto request_airdrop(const pubkey_t& account, std::uint64_t lamports) -> std::future<signature_t> = 0;
    virtual auto transfer(const keypair_t& sender,
                          const pubkey_t& receiver,
                          std::uint64_t lamports,
                          std::optional<std::string> memo = std::nullopt) -> std::future<signature_t> = 0;

    // Unknown signatures yield nullopt
    virtual auto signature_status(const signature_t& sig) -> std::future<std::optional<commitment_t>> = 0;

    // Tokens
    virtual auto create_mint(const keypair_t& owner, const keypair_t& mint, int decimals) -> std::future<signature_t> = 0;
    virtual auto mint_to(const pubkey_t& mint,
                         const keypair_t& owner,
                         const pubkey_t& holder,
                         std::uint64_t amount) -> std::future<signature_t> = 0;
    virtual auto token_balance(const pubkey_t& mint, const pubkey_t& holder) -> std::future<std::uint64_t> = 0;
    virtual auto token_transfer(const pubkey_t& mint,
                                const keypair_t& sender,
                                const pubkey_t& receiver,
                                std::uint64_t amount) -> std::future<signature_t> = 0;
};

// =============================================================================
// Confirmation polling
// =============================================================================

// Blocks the calling thread, querying every `poll` until the transaction
// reaches `target`. Throws ledger_error on unknown signature or timeout.
inline void wait_for_commitment(ledger_client_t& client,
                                const signature_t& sig,
                                commitment_t target,
                                std::chrono::milliseconds poll,
                                std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto status = client.signature_status(sig).get();
        if (!status) {
            throw ledger_error("unknown transaction " + sig.text);
        }
        if (*status >= target) {
            return;
        }
        if (std::chrono::steady_clock::now() + poll > deadline) {
            throw ledger_error("transaction " + sig.text + " not " + to_string(target)
                + " within " + std::to_string(timeout.count()) + " ms");
        }
        std::this_thread::sleep_for(poll);
    }
}

} // namespace fanout::ledger
