// LOCKVAULT - Staking Position Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/vault/position.h"

#include "lockvault/util/time.h"

#include <sstream>

namespace lockvault {
namespace vault {

bool Position::IsConsistent() const {
    if (amount < 0 || cooldownAmount < 0 || earlyUnstakeCooldownAmount < 0) {
        return false;
    }
    if (cooldownAmount > 0 && earlyUnstakeCooldownAmount > 0) {
        return false;
    }
    return cooldownAmount + earlyUnstakeCooldownAmount <= amount;
}

std::string Position::ToString() const {
    if (IsEmpty()) {
        return "Position(empty)";
    }

    std::ostringstream oss;
    oss << "Position(amount=" << FormatAmount(amount)
        << ", start=" << util::FormatTimestamp(weightedStartTime)
        << ", lockup=" << util::FormatDuration(util::Seconds{effectiveLockupPeriod})
        << ", multiplier=" << FormatBps(effectiveMultiplier);
    if (InCooldown()) {
        oss << ", cooldown=" << FormatAmount(cooldownAmount)
            << "@" << util::FormatTimestamp(cooldownStart);
    }
    if (InEarlyCooldown()) {
        oss << ", earlyCooldown=" << FormatAmount(earlyUnstakeCooldownAmount)
            << "@" << util::FormatTimestamp(earlyUnstakeCooldownStart);
    }
    oss << ")";
    return oss.str();
}

bool Position::operator==(const Position& other) const {
    return amount == other.amount &&
           weightedStartTime == other.weightedStartTime &&
           effectiveLockupPeriod == other.effectiveLockupPeriod &&
           effectiveMultiplier == other.effectiveMultiplier &&
           cooldownStart == other.cooldownStart &&
           cooldownAmount == other.cooldownAmount &&
           earlyUnstakeCooldownStart == other.earlyUnstakeCooldownStart &&
           earlyUnstakeCooldownAmount == other.earlyUnstakeCooldownAmount &&
           lastUpdateTime == other.lastUpdateTime;
}

bool VaultState::operator==(const VaultState& other) const {
    return totalStaked == other.totalStaked &&
           totalInCooldown == other.totalInCooldown &&
           totalInEarlyCooldown == other.totalInEarlyCooldown &&
           maximumStake == other.maximumStake &&
           treasury == other.treasury &&
           qualityControlCaller == other.qualityControlCaller &&
           paused == other.paused;
}

} // namespace vault
} // namespace lockvault
