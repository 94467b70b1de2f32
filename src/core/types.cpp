// LOCKVAULT - Core Types Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/core/types.h"
#include "lockvault/core/hex.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lockvault {

// ============================================================================
// Amount Formatting
// ============================================================================

int64_t MulDiv(int64_t a, int64_t b, int64_t c) {
    if (a < 0 || b < 0 || c <= 0 || (a > c && b > c)) {
        throw std::invalid_argument("MulDiv: operands out of range");
    }
    if (a > b) {
        std::swap(a, b);
    }
    if (a == c) {
        return b;
    }

    // Shift-and-add over the bits of b, keeping q * c + r == a * (b so far)
    // with r < c
    const uint64_t ua = static_cast<uint64_t>(a);
    const uint64_t ub = static_cast<uint64_t>(b);
    const uint64_t uc = static_cast<uint64_t>(c);
    uint64_t q = 0;
    uint64_t r = 0;
    for (int bit = 62; bit >= 0; --bit) {
        q <<= 1;
        if (r >= uc - r) {
            r -= uc - r;
            ++q;
        } else {
            r += r;
        }
        if ((ub >> bit) & 1) {
            if (r >= uc - ua) {
                r -= uc - ua;
                ++q;
            } else {
                r += ua;
            }
        }
    }
    return static_cast<int64_t>(q);
}

std::string FormatAmount(Amount amount, int decimals) {
    bool negative = amount < 0;
    // Work in unsigned space so MIN_INT64 does not overflow on negation
    uint64_t magnitude = negative ? static_cast<uint64_t>(-(amount + 1)) + 1
                                  : static_cast<uint64_t>(amount);

    uint64_t whole = magnitude / static_cast<uint64_t>(COIN);
    uint64_t frac = magnitude % static_cast<uint64_t>(COIN);

    std::ostringstream oss;
    oss << (negative ? "-" : "") << whole;

    if (decimals > 0) {
        std::ostringstream fracStream;
        fracStream << std::setfill('0') << std::setw(8) << frac;
        oss << "." << fracStream.str().substr(0, std::min(decimals, 8));
    }

    return oss.str();
}

std::optional<Amount> ParseAmount(const std::string& str) {
    std::string s = str;

    // Remove digit group separators
    s.erase(std::remove(s.begin(), s.end(), ','), s.end());
    s.erase(std::remove(s.begin(), s.end(), '_'), s.end());

    if (s.empty()) {
        return std::nullopt;
    }

    size_t dotPos = s.find('.');
    std::string wholePart = (dotPos != std::string::npos) ? s.substr(0, dotPos) : s;
    std::string fracPart = (dotPos != std::string::npos) ? s.substr(dotPos + 1) : "";

    if (wholePart.empty() && fracPart.empty()) {
        return std::nullopt;
    }
    if (fracPart.size() > 8) {
        return std::nullopt;
    }

    auto allDigits = [](const std::string& part) {
        return std::all_of(part.begin(), part.end(),
                           [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    };
    if (!allDigits(wholePart) || !allDigits(fracPart)) {
        return std::nullopt;
    }
    if (wholePart.size() > 11) {
        return std::nullopt;
    }

    while (fracPart.size() < 8) {
        fracPart += '0';
    }

    int64_t whole = wholePart.empty() ? 0 : std::stoll(wholePart);
    int64_t frac = std::stoll(fracPart);
    if (whole > MAX_MONEY / COIN) {
        return std::nullopt;
    }

    Amount amount = whole * COIN + frac;
    if (!MoneyRange(amount)) {
        return std::nullopt;
    }
    return amount;
}

std::string FormatBps(int bps) {
    std::ostringstream oss;
    oss << (bps / BPS_DENOMINATOR) << "."
        << std::setfill('0') << std::setw(4) << (bps % BPS_DENOMINATOR) << "x";
    return oss.str();
}

// ============================================================================
// Address
// ============================================================================

std::string Address::ToHex() const {
    return BytesToHex(bytes_.data(), SIZE);
}

std::optional<Address> Address::Parse(const std::string& str) {
    std::string hex = str;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    if (hex.size() != SIZE * 2 || !IsValidHex(hex)) {
        return std::nullopt;
    }

    std::vector<HexByte> raw = HexToBytes(hex);
    Address addr;
    std::copy(raw.begin(), raw.end(), addr.bytes_.begin());
    return addr;
}

Address Address::FromLabel(const std::string& label) {
    // FNV-1a seed expanded with splitmix64 steps
    uint64_t state = 0xcbf29ce484222325ULL;
    for (char c : label) {
        state ^= static_cast<uint8_t>(c);
        state *= 0x100000001b3ULL;
    }

    std::array<Byte, SIZE> bytes;
    for (size_t i = 0; i < SIZE; i += 8) {
        state += 0x9e3779b97f4a7c15ULL;
        uint64_t z = state;
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        z ^= (z >> 31);
        for (size_t j = 0; j < 8 && i + j < SIZE; ++j) {
            bytes[i + j] = static_cast<Byte>(z >> (8 * j));
        }
    }

    return Address(bytes);
}

} // namespace lockvault
