#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "safeshred/shred_status.hpp"

namespace CryptoPP {
class RandomNumberGenerator;
}

namespace safeshred {

enum class PatternKind {
    Fixed,
    Random
};

struct PassPattern {
    PatternKind kind = PatternKind::Random;
    std::uint8_t value = 0x00U;

    static PassPattern Fixed(const std::uint8_t byte) { return PassPattern{PatternKind::Fixed, byte}; }
    static PassPattern Random() { return PassPattern{PatternKind::Random, 0x00U}; }
};

bool operator==(const PassPattern& lhs, const PassPattern& rhs);

// Pass i of n uses a random fill when random_final is set and i == n,
// otherwise cycle[(i - 1) % cycle.size()]. An empty cycle randomizes every pass.
struct PatternPolicy {
    std::vector<PassPattern> cycle = {PassPattern::Fixed(0x00U), PassPattern::Fixed(0xFFU)};
    bool random_final = true;

    PassPattern PatternFor(std::size_t pass, std::size_t total_passes) const;
};

// Accepts a comma separated list of "zero", "ones", "random" or "0xNN".
ShredStatus ParsePatternPolicy(std::string_view text, PatternPolicy& out_policy);

std::string Describe(const PassPattern& pattern);

void FillPattern(
    const PassPattern& pattern,
    std::uint8_t* buffer,
    std::size_t length,
    CryptoPP::RandomNumberGenerator& rng);

// Zeroes the buffer with a store the optimizer may not elide.
void WipeBuffer(std::vector<std::uint8_t>& buffer);

// Lowercase hex of `entropy_bytes` random bytes, usable as a file name.
std::string RandomEntryName(std::size_t entropy_bytes, CryptoPP::RandomNumberGenerator& rng);

}  // namespace safeshred
