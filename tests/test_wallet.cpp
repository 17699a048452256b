#include <cassert>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "fanout/wallet.hpp"

using namespace fanout;

template<typename F>
auto throws_runtime_error(F f) -> bool {
    try {
        f();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

void test_amount_conversions() {
    assert(sol_to_lamports(1.0) == 1'000'000'000);
    assert(sol_to_lamports(0.5) == 500'000'000);
    assert(sol_to_lamports(0.0) == 0);
    assert(sol_to_lamports(-3.0) == 0);
    assert(lamports_to_sol(250'000'000) == 0.25);

    assert(coins_to_subunits(10.0) == 10'000'000);
    assert(coins_to_subunits(0.0000019) == 1);
    assert(subunits_to_coins(1'500'000) == 1.5);

    std::cout << "test_amount_conversions: PASSED\n";
}

void test_keypair_string_form() {
    auto kp = keypair_t::generate();
    auto text = kp.to_string();
    assert(text.size() == 128);
    assert(keypair_t::parse(text) == kp);

    // Upper-case hex is accepted too
    auto upper = text;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    assert(keypair_t::parse(upper) == kp);

    // The public key is the second half
    auto pk = kp.pubkey();
    assert(pk.to_string() == text.substr(64));
    assert(pubkey_t::parse(pk.to_string()) == pk);

    auto ss = std::ostringstream{};
    ss << pk;
    assert(ss.str() == pk.to_string());

    assert(throws_runtime_error([] { (void)keypair_t::parse("abc"); }));
    assert(throws_runtime_error([] { (void)pubkey_t::parse(std::string(64, 'z')); }));

    std::cout << "test_keypair_string_form: PASSED\n";
}

void test_generated_keypairs_differ() {
    auto keypairs = generate_keypairs(8);
    assert(keypairs.size() == 8);

    auto distinct = std::set<std::string>{};
    for (const auto& kp : keypairs) {
        distinct.insert(kp.to_string());
    }
    assert(distinct.size() == 8);

    std::cout << "test_generated_keypairs_differ: PASSED\n";
}

void test_keypair_from_bytes() {
    auto values = std::vector<int>(64, 7);
    auto kp = keypair_t::from_bytes(values);
    assert(kp.bytes[0] == 7);
    assert(kp.bytes[63] == 7);

    assert(throws_runtime_error([] { (void)keypair_t::from_bytes(std::vector<int>(63, 1)); }));
    assert(throws_runtime_error([] { (void)keypair_t::from_bytes(std::vector<int>(64, 256)); }));

    std::cout << "test_keypair_from_bytes: PASSED\n";
}

void test_keypair_files() {
    auto dir = std::filesystem::temp_directory_path() / "fanout_test_wallets";
    std::filesystem::remove_all(dir);

    auto keypairs = generate_keypairs(3);
    assert(throws_runtime_error([&] { (void)save_keypair_files(dir, keypairs); }));

    std::filesystem::create_directories(dir);
    auto paths = save_keypair_files(dir, keypairs);
    assert(paths.size() == 3);
    assert(paths[0].filename() == "id000000.json");
    assert(paths[2].filename() == "id000002.json");

    for (std::size_t i = 0; i < keypairs.size(); ++i) {
        assert(read_keypair_file(paths[i]) == keypairs[i]);
    }

    // Written as a JSON array of byte values
    auto file = std::ifstream(paths[0]);
    auto contents = std::string(std::istreambuf_iterator<char>(file), {});
    assert(contents.front() == '[');
    assert(contents.back() == ']');

    {
        auto bad = std::ofstream(dir / "bad.json");
        bad << "[1, 2, 3]";
    }
    assert(throws_runtime_error([&] { (void)read_keypair_file(dir / "bad.json"); }));
    assert(throws_runtime_error([&] { (void)read_keypair_file(dir / "missing.json"); }));

    std::filesystem::remove_all(dir);
    std::cout << "test_keypair_files: PASSED\n";
}

int main() {
    test_amount_conversions();
    test_keypair_string_form();
    test_generated_keypairs_differ();
    test_keypair_from_bytes();
    test_keypair_files();

    std::cout << "\nAll wallet tests passed.\n";
    return 0;
}
