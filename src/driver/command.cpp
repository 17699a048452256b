// command.cpp - command-line parsing

#include <cstdlib>
#include <stdexcept>
#include "fanout/driver/command.hpp"

namespace fanout::driver {

const char* usage_text = R"(usage: fanout [--config <file>] <command>

  ---------------------------------------------------------------------------
  Wallets
  ---------------------------------------------------------------------------
    wallet generate <count> [dir]  - Generate keypairs, optionally saving
                                     them as id000000.json, ... in dir
    wallet read <file>             - Print a keypair file in string form
    wallet list [--pubkey] [--keypair]
                                   - List configured wallets
    wallet save <dir>              - Save configured wallets as keypair files

  ---------------------------------------------------------------------------
  Ledger
  ---------------------------------------------------------------------------
    show-config                    - Print the loaded configuration
    balances                       - SOL balance of every wallet
    airdrop <sols> [--confirm]     - Airdrop to every wallet and the token
                                     owner, optionally waiting for
                                     confirmation

  ---------------------------------------------------------------------------
  Tokens
  ---------------------------------------------------------------------------
    token deploy                   - Create the configured mint
    token mint <holder> <amount>   - Mint tokens to a holder address
    token balances                 - Token balance of every wallet

  ---------------------------------------------------------------------------
  Batched transfers (cases from the config's test section)
  ---------------------------------------------------------------------------
    test transfer sols
    test transfer tokens

  The config file is taken from --config (-c), else from $FANOUT_CONFIG_FILE.
)";

namespace {

// Cursor over the arguments of one invocation
struct arg_cursor_t {
    const std::vector<std::string>& args;
    std::size_t pos = 0;

    auto done() const -> bool { return pos >= args.size(); }

    auto next(const char* what) -> std::string {
        if (done()) {
            throw std::invalid_argument(std::string("missing ") + what);
        }
        return args[pos++];
    }

    auto next_optional() -> std::optional<std::string> {
        if (done()) return std::nullopt;
        return args[pos++];
    }

    void finish() const {
        if (!done()) {
            throw std::invalid_argument("unexpected argument '" + args[pos] + "'");
        }
    }
};

auto to_count(const std::string& s) -> std::size_t {
    char* end = nullptr;
    auto value = std::strtoll(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || value < 0) {
        throw std::invalid_argument("expected a non-negative count, got '" + s + "'");
    }
    return static_cast<std::size_t>(value);
}

auto to_amount(const std::string& s) -> double {
    char* end = nullptr;
    auto value = std::strtod(s.c_str(), &end);
    if (s.empty() || *end != '\0' || !(value > 0.0)) {
        throw std::invalid_argument("expected a positive amount, got '" + s + "'");
    }
    return value;
}

auto parse_wallet(arg_cursor_t& cur) -> command_t {
    auto sub = cur.next("wallet subcommand");

    if (sub == "generate") {
        auto c = cmd::wallet_generate{to_count(cur.next("count")), cur.next_optional()};
        cur.finish();
        return c;
    }
    if (sub == "read") {
        auto c = cmd::wallet_read{cur.next("keypair file")};
        cur.finish();
        return c;
    }
    if (sub == "list") {
        auto c = cmd::wallet_list{};
        while (auto flag = cur.next_optional()) {
            if (*flag == "--pubkey") c.pubkey = true;
            else if (*flag == "--keypair") c.keypair = true;
            else throw std::invalid_argument("unknown flag '" + *flag + "'");
        }
        return c;
    }
    if (sub == "save") {
        auto c = cmd::wallet_save{cur.next("target dir")};
        cur.finish();
        return c;
    }
    throw std::invalid_argument("unknown wallet subcommand '" + sub + "'");
}

auto parse_token(arg_cursor_t& cur) -> command_t {
    auto sub = cur.next("token subcommand");

    if (sub == "deploy") {
        cur.finish();
        return cmd::token_deploy{};
    }
    if (sub == "mint") {
        auto holder = cur.next("holder");
        auto c = cmd::token_mint{holder, to_amount(cur.next("amount"))};
        cur.finish();
        return c;
    }
    if (sub == "balances") {
        cur.finish();
        return cmd::token_balances{};
    }
    throw std::invalid_argument("unknown token subcommand '" + sub + "'");
}

auto parse_test(arg_cursor_t& cur) -> command_t {
    auto sub = cur.next("test subcommand");
    if (sub != "transfer") {
        throw std::invalid_argument("unknown test subcommand '" + sub + "'");
    }
    auto what = cur.next("transfer kind");
    cur.finish();

    if (what == "sols") return cmd::test_transfer_sols{};
    if (what == "tokens") return cmd::test_transfer_tokens{};
    throw std::invalid_argument("unknown transfer kind '" + what + "'");
}

auto parse_command(arg_cursor_t& cur) -> command_t {
    auto name = cur.next("command");

    if (name == "wallet") return parse_wallet(cur);
    if (name == "token") return parse_token(cur);
    if (name == "test") return parse_test(cur);

    if (name == "airdrop") {
        auto c = cmd::airdrop{to_amount(cur.next("amount of SOL")), false};
        while (auto flag = cur.next_optional()) {
            if (*flag == "--confirm") c.confirm = true;
            else throw std::invalid_argument("unknown flag '" + *flag + "'");
        }
        return c;
    }
    cur.finish();

    if (name == "show-config") return cmd::show_config{};
    if (name == "balances") return cmd::balances{};
    if (name == "help" || name == "--help" || name == "-h") return cmd::help{};
    throw std::invalid_argument("unknown command '" + name + "'");
}

} // anonymous namespace

auto parse_args(const std::vector<std::string>& args) -> parsed_args_t {
    auto config_file = std::optional<std::string>{};
    auto rest = std::vector<std::string>{};

    try {
        // Global options may appear anywhere before the command's own arguments
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config" || args[i] == "-c") {
                if (i + 1 >= args.size()) {
                    throw std::invalid_argument("missing value for " + args[i]);
                }
                config_file = args[++i];
            } else if (args[i].rfind("--config=", 0) == 0) {
                config_file = args[i].substr(9);
            } else {
                rest.push_back(args[i]);
            }
        }
        auto cur = arg_cursor_t{rest};
        auto command = parse_command(cur);
        return {invocation_t{config_file, std::move(command)}, ""};
    } catch (const std::invalid_argument& e) {
        return {std::nullopt, e.what()};
    }
}

auto needs_config(const command_t& command) -> bool {
    return !(std::holds_alternative<cmd::wallet_generate>(command)
          || std::holds_alternative<cmd::wallet_read>(command)
          || std::holds_alternative<cmd::help>(command));
}

} // namespace fanout::driver
