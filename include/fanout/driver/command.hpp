#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fanout::driver {

// =============================================================================
// Command structs
// =============================================================================

namespace cmd {

struct wallet_generate {
    std::size_t count;
    std::optional<std::string> save_to;
};

struct wallet_read {
    std::string path;
};

struct wallet_list {
    bool pubkey = false;
    bool keypair = false;
};

struct wallet_save {
    std::string target;
};

struct show_config {};

struct balances {};

struct airdrop {
    double sols;
    bool confirm = false;
};

struct token_deploy {};

struct token_mint {
    std::string holder;
    double amount;
};

struct token_balances {};

struct test_transfer_sols {};

struct test_transfer_tokens {};

struct help {};

} // namespace cmd

using command_t = std::variant<
    cmd::wallet_generate,
    cmd::wallet_read,
    cmd::wallet_list,
    cmd::wallet_save,
    cmd::show_config,
    cmd::balances,
    cmd::airdrop,
    cmd::token_deploy,
    cmd::token_mint,
    cmd::token_balances,
    cmd::test_transfer_sols,
    cmd::test_transfer_tokens,
    cmd::help
>;

// =============================================================================
// Command-line parsing
// =============================================================================

struct invocation_t {
    std::optional<std::string> config_file;
    command_t command;
};

struct parsed_args_t {
    std::optional<invocation_t> invocation;
    std::string error;
};

extern const char* usage_text;

// Arguments without the program name
auto parse_args(const std::vector<std::string>& args) -> parsed_args_t;

// Commands that run before any configuration is loaded
auto needs_config(const command_t& command) -> bool;

} // namespace fanout::driver
