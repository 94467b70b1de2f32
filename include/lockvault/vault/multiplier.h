// LOCKVAULT - Reward Multiplier Table
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Maps (staked amount, effective lockup) to a reward multiplier in basis
// points (10000 = 1.0x). Amount tiers select a row; the lockup is linearly
// interpolated between duration breakpoints within that row.

#ifndef LOCKVAULT_VAULT_MULTIPLIER_H
#define LOCKVAULT_VAULT_MULTIPLIER_H

#include "lockvault/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lockvault {

namespace util {
class ConfigManager;
struct ConfigParseResult;
}

namespace vault {

// ============================================================================
// Multiplier Constants
// ============================================================================

/// 1.0x in basis points
constexpr int BASE_MULTIPLIER = 10000;

/// Default combined cap (1.5x)
constexpr int DEFAULT_MULTIPLIER_CEILING = 15000;

// ============================================================================
// Multiplier Tier
// ============================================================================

/// One row of the table: applies to amounts >= threshold
struct MultiplierTier {
    Amount threshold{0};
    std::vector<int> multipliers;   // One entry per duration breakpoint

    bool operator==(const MultiplierTier& other) const {
        return threshold == other.threshold && multipliers == other.multipliers;
    }
};

// ============================================================================
// Multiplier Table
// ============================================================================

/**
 * Immutable multiplier lookup table.
 *
 * A valid table is monotonic non-decreasing along both axes, so
 * Calculate() is monotonic in amount for a fixed lockup and in lockup
 * for a fixed amount.
 */
class MultiplierTable {
public:
    /// Builds the default 30/90/180/365-day table
    MultiplierTable();

    /// Throws std::invalid_argument if the table is not valid
    MultiplierTable(std::vector<int64_t> durations,
                    std::vector<MultiplierTier> tiers,
                    int ceiling = DEFAULT_MULTIPLIER_CEILING);

    /// Describe the first structural problem, or nullopt if usable
    static std::optional<std::string> Validate(const std::vector<int64_t>& durations,
                                               const std::vector<MultiplierTier>& tiers,
                                               int ceiling);

    static MultiplierTable Default();

    /**
     * Multiplier in basis points for the given amount and lockup (seconds).
     * Returns 0 for a zero or negative amount.
     */
    int Calculate(Amount amount, int64_t lockup) const;

    const std::vector<int64_t>& GetDurations() const { return durations_; }
    const std::vector<MultiplierTier>& GetTiers() const { return tiers_; }
    int GetCeiling() const { return ceiling_; }

    /// Multi-line human-readable dump
    std::string ToString() const;

private:
    const MultiplierTier& SelectTier(Amount amount) const;
    int Interpolate(const std::vector<int>& row, int64_t lockup) const;

    std::vector<int64_t> durations_;
    std::vector<MultiplierTier> tiers_;
    int ceiling_{DEFAULT_MULTIPLIER_CEILING};
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * Parse a "tier" config value: "<threshold>:<m1>/<m2>/..."
 * The threshold is a token amount (whole tokens or decimals).
 */
std::optional<MultiplierTier> ParseTierSpec(const std::string& spec);

/**
 * Build a table from the [multiplier] config section.
 * Keys that are absent keep their default; "tier" entries, when present,
 * replace the default rows entirely.
 */
util::ConfigParseResult LoadMultiplierTable(const util::ConfigManager& config,
                                            MultiplierTable& table);

} // namespace vault
} // namespace lockvault

#endif // LOCKVAULT_VAULT_MULTIPLIER_H
