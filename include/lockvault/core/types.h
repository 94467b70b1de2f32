// LOCKVAULT - Core Types Header
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Token amounts, timestamps and account addresses.

#ifndef LOCKVAULT_CORE_TYPES_H
#define LOCKVAULT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <optional>
#include <string>

namespace lockvault {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in base units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Duration in seconds
using Duration = int64_t;

/// Constants
constexpr Amount COIN = 100000000LL;                 // 1 token = 10^8 base units
constexpr Amount MAX_MONEY = 10000000000LL * COIN;   // 10 billion tokens

/// Basis point denominator (10000 bps = 100% = 1.0x)
constexpr int BPS_DENOMINATOR = 10000;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

/**
 * floor(a * b / c) without an intermediate that can overflow.
 * Requires a >= 0, b >= 0, c > 0 and one of a, b not above c, so the result
 * never exceeds the other factor. Throws std::invalid_argument otherwise.
 */
int64_t MulDiv(int64_t a, int64_t b, int64_t c);

/// Format an amount as a decimal token string ("12.50000000")
std::string FormatAmount(Amount amount, int decimals = 8);

/// Parse a decimal token string into base units
std::optional<Amount> ParseAmount(const std::string& str);

/// Format basis points as a multiplier ("1.0500x")
std::string FormatBps(int bps);

// ============================================================================
// Address
// ============================================================================

/// Account identity on the token ledger and in the vault (20 raw bytes)
class Address {
public:
    static constexpr size_t SIZE = 20;

    Address() noexcept { bytes_.fill(0); }
    explicit Address(const std::array<Byte, SIZE>& bytes) noexcept : bytes_(bytes) {}

    /// The zero address is never a valid account or role
    bool IsNull() const noexcept {
        for (Byte b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    Byte& operator[](size_t idx) { return bytes_[idx]; }
    const Byte& operator[](size_t idx) const { return bytes_[idx]; }

    Byte* data() noexcept { return bytes_.data(); }
    const Byte* data() const noexcept { return bytes_.data(); }

    bool operator==(const Address& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const Address& other) const noexcept { return bytes_ != other.bytes_; }
    bool operator<(const Address& other) const noexcept { return bytes_ < other.bytes_; }

    /// Parse a 40-character hex address, accepting an optional "0x" prefix
    static std::optional<Address> Parse(const std::string& str);

    /// Deterministic address derived from a label (tests and scripted runs)
    static Address FromLabel(const std::string& label);

    /// Lowercase hex without prefix
    std::string ToHex() const;

    /// "0x" prefixed hex form
    std::string ToString() const { return "0x" + ToHex(); }

private:
    std::array<Byte, SIZE> bytes_;
};

} // namespace lockvault

#endif // LOCKVAULT_CORE_TYPES_H
