// LOCKVAULT - Staking Position
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// One record per user. A position exists while amount > 0; there is no
// separate existence flag and no history.

#ifndef LOCKVAULT_VAULT_POSITION_H
#define LOCKVAULT_VAULT_POSITION_H

#include "lockvault/core/serialize.h"
#include "lockvault/core/types.h"
#include "lockvault/vault/combiner.h"

#include <cstdint>
#include <string>

namespace lockvault {
namespace vault {

// ============================================================================
// Position
// ============================================================================

struct Position {
    /// Principal, including anything requested for withdrawal
    Amount amount{0};

    /// Synthetic start and duration; amount matures at their sum
    Timestamp weightedStartTime{0};
    int64_t effectiveLockupPeriod{0};

    /// Cached multiplier for (amount, effectiveLockupPeriod)
    int effectiveMultiplier{0};

    /// Normal exit request, drawn from the matured portion
    Timestamp cooldownStart{0};
    Amount cooldownAmount{0};

    /// Early exit request, drawn from the locked portion
    Timestamp earlyUnstakeCooldownStart{0};
    Amount earlyUnstakeCooldownAmount{0};

    Timestamp lastUpdateTime{0};

    bool HasStake() const { return amount > 0; }

    bool IsEmpty() const {
        return amount == 0 && cooldownAmount == 0 && earlyUnstakeCooldownAmount == 0;
    }

    bool InCooldown() const { return cooldownAmount > 0; }
    bool InEarlyCooldown() const { return earlyUnstakeCooldownAmount > 0; }

    LockTiming Timing() const { return {weightedStartTime, effectiveLockupPeriod}; }

    Timestamp UnlockTime() const { return weightedStartTime + effectiveLockupPeriod; }
    bool IsMatured(Timestamp now) const { return now >= UnlockTime(); }

    /// Amount not committed to either cooldown
    Amount Available() const { return amount - cooldownAmount - earlyUnstakeCooldownAmount; }

    /// Available amount once matured, else 0
    Amount Unlocked(Timestamp now) const { return IsMatured(now) ? Available() : 0; }

    /// Available amount while still locked, else 0
    Amount Locked(Timestamp now) const { return IsMatured(now) ? 0 : Available(); }

    /// Structural invariants (amounts non-negative, cooldowns exclusive and covered)
    bool IsConsistent() const;

    std::string ToString() const;

    bool operator==(const Position& other) const;
    bool operator!=(const Position& other) const { return !(*this == other); }
};

// ============================================================================
// Vault State
// ============================================================================

/// Global aggregate and administrative settings
struct VaultState {
    Amount totalStaked{0};
    Amount totalInCooldown{0};
    Amount totalInEarlyCooldown{0};
    Amount maximumStake{0};
    Address treasury;
    Address qualityControlCaller;
    bool paused{false};

    bool operator==(const VaultState& other) const;
    bool operator!=(const VaultState& other) const { return !(*this == other); }
};

// ============================================================================
// Serialization
// ============================================================================

/// Record format version written ahead of each position
constexpr uint8_t POSITION_VERSION = 1;
constexpr uint8_t VAULT_STATE_VERSION = 1;

template<typename Stream>
void Serialize(Stream& s, const Position& pos) {
    lockvault::Serialize(s, POSITION_VERSION);
    lockvault::Serialize(s, pos.amount);
    lockvault::Serialize(s, pos.weightedStartTime);
    lockvault::Serialize(s, pos.effectiveLockupPeriod);
    lockvault::Serialize(s, static_cast<int32_t>(pos.effectiveMultiplier));
    lockvault::Serialize(s, pos.cooldownStart);
    lockvault::Serialize(s, pos.cooldownAmount);
    lockvault::Serialize(s, pos.earlyUnstakeCooldownStart);
    lockvault::Serialize(s, pos.earlyUnstakeCooldownAmount);
    lockvault::Serialize(s, pos.lastUpdateTime);
}

template<typename Stream>
void Unserialize(Stream& s, Position& pos) {
    uint8_t version = 0;
    lockvault::Unserialize(s, version);
    if (version != POSITION_VERSION) {
        throw std::ios_base::failure("Unserialize(Position): unknown version");
    }
    int32_t multiplier = 0;
    lockvault::Unserialize(s, pos.amount);
    lockvault::Unserialize(s, pos.weightedStartTime);
    lockvault::Unserialize(s, pos.effectiveLockupPeriod);
    lockvault::Unserialize(s, multiplier);
    lockvault::Unserialize(s, pos.cooldownStart);
    lockvault::Unserialize(s, pos.cooldownAmount);
    lockvault::Unserialize(s, pos.earlyUnstakeCooldownStart);
    lockvault::Unserialize(s, pos.earlyUnstakeCooldownAmount);
    lockvault::Unserialize(s, pos.lastUpdateTime);
    pos.effectiveMultiplier = multiplier;
}

template<typename Stream>
void Serialize(Stream& s, const VaultState& state) {
    lockvault::Serialize(s, VAULT_STATE_VERSION);
    lockvault::Serialize(s, state.totalStaked);
    lockvault::Serialize(s, state.totalInCooldown);
    lockvault::Serialize(s, state.totalInEarlyCooldown);
    lockvault::Serialize(s, state.maximumStake);
    lockvault::Serialize(s, state.treasury);
    lockvault::Serialize(s, state.qualityControlCaller);
    lockvault::Serialize(s, state.paused);
}

template<typename Stream>
void Unserialize(Stream& s, VaultState& state) {
    uint8_t version = 0;
    lockvault::Unserialize(s, version);
    if (version != VAULT_STATE_VERSION) {
        throw std::ios_base::failure("Unserialize(VaultState): unknown version");
    }
    lockvault::Unserialize(s, state.totalStaked);
    lockvault::Unserialize(s, state.totalInCooldown);
    lockvault::Unserialize(s, state.totalInEarlyCooldown);
    lockvault::Unserialize(s, state.maximumStake);
    lockvault::Unserialize(s, state.treasury);
    lockvault::Unserialize(s, state.qualityControlCaller);
    lockvault::Unserialize(s, state.paused);
}

} // namespace vault
} // namespace lockvault

#endif // LOCKVAULT_VAULT_POSITION_H
