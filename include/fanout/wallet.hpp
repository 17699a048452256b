#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "ascii_reader.hpp"

namespace fanout {

// =============================================================================
// Amounts
// =============================================================================

inline constexpr std::uint64_t lamports_per_sol = 1'000'000'000;
inline constexpr int token_decimals = 6;

// Fractions of a lamport are dropped; non-positive amounts are zero
inline auto sol_to_lamports(double sol) -> std::uint64_t {
    if (!(sol > 0.0)) return 0;
    return static_cast<std::uint64_t>(std::floor(sol * static_cast<double>(lamports_per_sol)));
}

inline auto lamports_to_sol(std::uint64_t lamports) -> double {
    return static_cast<double>(lamports) / static_cast<double>(lamports_per_sol);
}

inline auto coins_to_subunits(double amount) -> std::uint64_t {
    if (!(amount > 0.0)) return 0;
    return static_cast<std::uint64_t>(std::floor(amount * std::pow(10.0, token_decimals)));
}

inline auto subunits_to_coins(std::uint64_t subunits) -> double {
    return static_cast<double>(subunits) / std::pow(10.0, token_decimals);
}

// =============================================================================
// Hex helpers
// =============================================================================

namespace detail {

template<std::size_t N>
auto hex_encode(const std::array<std::uint8_t, N>& bytes) -> std::string {
    static constexpr const char* digits = "0123456789abcdef";
    std::string s;
    s.reserve(2 * N);
    for (auto b : bytes) {
        s += digits[b >> 4];
        s += digits[b & 0x0f];
    }
    return s;
}

inline auto hex_digit(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template<std::size_t N>
auto hex_decode(const std::string& s, const char* what) -> std::array<std::uint8_t, N> {
    if (s.size() != 2 * N) {
        throw std::runtime_error(std::string(what) + ": expected " + std::to_string(2 * N)
            + " hex digits, got " + std::to_string(s.size()));
    }
    std::array<std::uint8_t, N> bytes{};
    for (std::size_t i = 0; i < N; ++i) {
        auto hi = hex_digit(s[2 * i]);
        auto lo = hex_digit(s[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::runtime_error(std::string(what) + ": invalid hex digit in '" + s + "'");
        }
        bytes[i] = static_cast<std::uint8_t>(hi << 4 | lo);
    }
    return bytes;
}

} // namespace detail

// =============================================================================
// Public key (account address)
// =============================================================================

struct pubkey_t {
    std::array<std::uint8_t, 32> bytes{};

    static auto parse(const std::string& s) -> pubkey_t {
        return pubkey_t{detail::hex_decode<32>(s, "public key")};
    }

    auto to_string() const -> std::string { return detail::hex_encode(bytes); }

    auto operator<=>(const pubkey_t&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const pubkey_t& pk) {
    return os << pk.to_string();
}

// =============================================================================
// Keypair: 32 secret bytes followed by the 32 public key bytes
// =============================================================================

struct keypair_t {
    std::array<std::uint8_t, 64> bytes{};

    static auto generate() -> keypair_t {
        auto rd = std::random_device{};
        auto kp = keypair_t{};
        for (auto& b : kp.bytes) {
            b = static_cast<std::uint8_t>(rd() & 0xff);
        }
        return kp;
    }

    static auto parse(const std::string& s) -> keypair_t {
        return keypair_t{detail::hex_decode<64>(s, "keypair")};
    }

    static auto from_bytes(const std::vector<int>& values) -> keypair_t {
        if (values.size() != 64) {
            throw std::runtime_error("keypair: expected 64 bytes, got " + std::to_string(values.size()));
        }
        auto kp = keypair_t{};
        for (std::size_t i = 0; i < 64; ++i) {
            if (values[i] < 0 || values[i] > 255) {
                throw std::runtime_error("keypair: byte out of range: " + std::to_string(values[i]));
            }
            kp.bytes[i] = static_cast<std::uint8_t>(values[i]);
        }
        return kp;
    }

    auto pubkey() const -> pubkey_t {
        auto pk = pubkey_t{};
        std::copy(bytes.begin() + 32, bytes.end(), pk.bytes.begin());
        return pk;
    }

    auto to_string() const -> std::string { return detail::hex_encode(bytes); }

    auto operator==(const keypair_t&) const -> bool = default;
};

inline std::ostream& operator<<(std::ostream& os, const keypair_t& kp) {
    return os << kp.to_string();
}

inline auto generate_keypairs(std::size_t count) -> std::vector<keypair_t> {
    auto keypairs = std::vector<keypair_t>{};
    keypairs.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        keypairs.push_back(keypair_t::generate());
    }
    return keypairs;
}

// =============================================================================
// Keypair files: JSON array of the 64 byte values
// =============================================================================

inline void write_keypair_file(const std::filesystem::path& path, const keypair_t& kp) {
    auto file = std::ofstream(path);
    if (!file) {
        throw std::runtime_error("cannot write keypair file: " + path.string());
    }
    file << "[";
    for (std::size_t i = 0; i < kp.bytes.size(); ++i) {
        if (i > 0) file << ",";
        file << static_cast<int>(kp.bytes[i]);
    }
    file << "]";
    if (!file) {
        throw std::runtime_error("failed writing keypair file: " + path.string());
    }
}

inline auto read_keypair_file(const std::filesystem::path& path) -> keypair_t {
    auto file = std::ifstream(path);
    if (!file) {
        throw std::runtime_error("cannot read keypair file: " + path.string());
    }
    auto values = std::vector<int>{};
    try {
        auto reader = ascii_reader(file);
        if (!reader.read(values)) {
            throw std::runtime_error("expected a byte array");
        }
        return keypair_t::from_bytes(values);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("cannot parse keypair file " + path.string() + ": " + e.what());
    }
}

// File names are id000000.json, id000001.json, ... in keypair order
inline auto save_keypair_files(const std::filesystem::path& dir, const std::vector<keypair_t>& keypairs)
    -> std::vector<std::filesystem::path>
{
    if (!std::filesystem::is_directory(dir)) {
        throw std::runtime_error("invalid wallet save dir: " + dir.string());
    }
    auto paths = std::vector<std::filesystem::path>{};
    for (std::size_t i = 0; i < keypairs.size(); ++i) {
        auto name = std::ostringstream{};
        name << "id" << std::setw(6) << std::setfill('0') << i << ".json";
        auto path = dir / name.str();
        write_keypair_file(path, keypairs[i]);
        paths.push_back(path);
    }
    return paths;
}

} // namespace fanout
