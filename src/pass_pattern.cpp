#include "safeshred/pass_pattern.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "cryptlib.h"
#include "filters.h"
#include "hex.h"
#include "misc.h"

namespace safeshred {

namespace {

std::string_view Trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return value;
}

int HexValue(const char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool ParseToken(std::string_view token, PassPattern& out_pattern) {
    std::string lowered(token);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "zero" || lowered == "zeros") {
        out_pattern = PassPattern::Fixed(0x00U);
        return true;
    }
    if (lowered == "ones") {
        out_pattern = PassPattern::Fixed(0xFFU);
        return true;
    }
    if (lowered == "random") {
        out_pattern = PassPattern::Random();
        return true;
    }
    if (lowered.size() == 4 && lowered[0] == '0' && lowered[1] == 'x') {
        const int hi = HexValue(lowered[2]);
        const int lo = HexValue(lowered[3]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out_pattern = PassPattern::Fixed(static_cast<std::uint8_t>((hi << 4) | lo));
        return true;
    }
    return false;
}

}  // namespace

bool operator==(const PassPattern& lhs, const PassPattern& rhs) {
    if (lhs.kind != rhs.kind) {
        return false;
    }
    return lhs.kind == PatternKind::Random || lhs.value == rhs.value;
}

PassPattern PatternPolicy::PatternFor(const std::size_t pass, const std::size_t total_passes) const {
    if (random_final && pass == total_passes) {
        return PassPattern::Random();
    }
    if (cycle.empty() || pass == 0) {
        return PassPattern::Random();
    }
    return cycle[(pass - 1) % cycle.size()];
}

ShredStatus ParsePatternPolicy(const std::string_view text, PatternPolicy& out_policy) {
    std::vector<PassPattern> cycle;
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t comma = text.find(',', start);
        const std::size_t end = comma == std::string_view::npos ? text.size() : comma;
        const std::string_view token = Trim(text.substr(start, end - start));
        PassPattern pattern;
        if (token.empty() || !ParseToken(token, pattern)) {
            return ShredStatus::InvalidArgument;
        }
        cycle.push_back(pattern);
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }

    out_policy.cycle = std::move(cycle);
    return ShredStatus::Ok;
}

std::string Describe(const PassPattern& pattern) {
    if (pattern.kind == PatternKind::Random) {
        return "random";
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out = "0x";
    out.push_back(kHex[(pattern.value >> 4U) & 0x0FU]);
    out.push_back(kHex[pattern.value & 0x0FU]);
    return out;
}

void FillPattern(
    const PassPattern& pattern,
    std::uint8_t* buffer,
    const std::size_t length,
    CryptoPP::RandomNumberGenerator& rng) {
    if (length == 0) {
        return;
    }
    if (pattern.kind == PatternKind::Random) {
        rng.GenerateBlock(buffer, length);
        return;
    }
    std::fill(buffer, buffer + length, pattern.value);
}

void WipeBuffer(std::vector<std::uint8_t>& buffer) {
    if (buffer.empty()) {
        return;
    }
    CryptoPP::memset_z(buffer.data(), 0, buffer.size());
}

std::string RandomEntryName(const std::size_t entropy_bytes, CryptoPP::RandomNumberGenerator& rng) {
    std::vector<std::uint8_t> raw(entropy_bytes, 0U);
    if (!raw.empty()) {
        rng.GenerateBlock(raw.data(), raw.size());
    }

    std::string name;
    CryptoPP::HexEncoder encoder(new CryptoPP::StringSink(name), false);
    encoder.Put(raw.data(), raw.size());
    encoder.MessageEnd();
    WipeBuffer(raw);
    return name;
}

}  // namespace safeshred
