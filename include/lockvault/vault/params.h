// LOCKVAULT - Vault Parameters
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#ifndef LOCKVAULT_VAULT_PARAMS_H
#define LOCKVAULT_VAULT_PARAMS_H

#include "lockvault/core/types.h"
#include "lockvault/vault/multiplier.h"

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
// Default Parameters
// ============================================================================

/// Smallest stake, top-up and early-exit request (1 token)
constexpr Amount DEFAULT_MINIMUM_STAKE = 1 * COIN;

/// Largest position per user (10,000 tokens)
constexpr Amount DEFAULT_MAXIMUM_STAKE = 10000 * COIN;

/// Wait between requesting and completing a normal unstake (2 days)
constexpr int64_t DEFAULT_COOLDOWN_PERIOD = 2 * 86400;

/// Wait between requesting and completing an early unstake (7 days)
constexpr int64_t DEFAULT_EARLY_COOLDOWN_PERIOD = 7 * 86400;

/// Early-exit penalty (10%)
constexpr int DEFAULT_EARLY_PENALTY_BPS = 1000;

/// Smallest accepted lockup extension (7 days)
constexpr int64_t DEFAULT_MINIMUM_LOCKUP_INCREASE = 7 * 86400;

/// Largest accepted lockup extension (365 days)
constexpr int64_t DEFAULT_MAXIMUM_LOCKUP = 365 * 86400;

// ============================================================================
// Vault Parameters
// ============================================================================

struct VaultParams {
    Amount minimumStake{DEFAULT_MINIMUM_STAKE};

    /// Initial per-user maximum; adjustable at runtime by the admin
    Amount maximumStake{DEFAULT_MAXIMUM_STAKE};

    int64_t cooldownPeriod{DEFAULT_COOLDOWN_PERIOD};
    int64_t earlyUnstakeCooldownPeriod{DEFAULT_EARLY_COOLDOWN_PERIOD};
    int earlyUnstakePenaltyBps{DEFAULT_EARLY_PENALTY_BPS};

    int64_t minimumLockupIncrease{DEFAULT_MINIMUM_LOCKUP_INCREASE};
    int64_t maximumLockup{DEFAULT_MAXIMUM_LOCKUP};

    /// Durations accepted by a fresh stake
    std::vector<int64_t> lockupPeriods{30 * 86400, 90 * 86400, 180 * 86400, 365 * 86400};

    MultiplierTable multipliers;

    bool IsValidLockup(int64_t lockup) const;

    /// First inconsistency found, or nullopt
    std::optional<std::string> Validate() const;
};

/**
 * Fill params from the [vault] and [multiplier] config sections.
 * Absent keys keep the value already in params.
 */
util::ConfigParseResult LoadVaultParams(const util::ConfigManager& config,
                                        VaultParams& params);

/// Register every vault key with the config validator
void AllowVaultConfigKeys(util::ConfigManager& config);

} // namespace vault
} // namespace lockvault

#endif // LOCKVAULT_VAULT_PARAMS_H
