// LOCKVAULT - Weighted-Average Lockup Combiner
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Merges an existing lock (start, duration, amount) with a top-up or a
// duration extension into a single new (start, duration) pair. The result
// never shortens the lock duration.

#ifndef LOCKVAULT_VAULT_COMBINER_H
#define LOCKVAULT_VAULT_COMBINER_H

#include "lockvault/core/types.h"

#include <cstdint>

namespace lockvault {
namespace vault {

/// Why a combination was refused
enum class CombineStatus {
    OK,
    ZERO_AMOUNT,         // Existing amount or top-up is zero
    ZERO_DURATION,       // Existing duration or extension is zero
    OVERFLOW,            // Amount sum or timestamp leaves the representable range
    INVALID_RESULT,      // Shorter than before, or dated wrongly
};

const char* CombineStatusToString(CombineStatus status);

/// Lock timing as stored on a position
struct LockTiming {
    Timestamp start{0};
    int64_t duration{0};

    Timestamp Maturity() const { return start + duration; }

    bool operator==(const LockTiming& other) const {
        return start == other.start && duration == other.duration;
    }
};

struct CombineResult {
    CombineStatus status{CombineStatus::OK};
    LockTiming timing;

    bool ok() const { return status == CombineStatus::OK; }
};

/// Seconds left until the lock matures (0 once matured)
int64_t RemainingLockup(const LockTiming& lock, Timestamp now);

/**
 * Amount top-up.
 *
 * The existing amount keeps its remaining time, the new amount gets a fresh
 * copy of the current duration, and the merged remaining time is their
 * amount-weighted average:
 *
 *   merged   = (remaining * amount + duration * delta) / (amount + delta)
 *   duration' = max(duration, merged)
 *   start'    = now + merged - duration'
 */
CombineResult CombineAmount(const LockTiming& lock, Amount amount, Amount delta,
                            Timestamp now);

/**
 * Duration extension.
 *
 * extension <= remaining: the lock is unchanged.
 * extension >  remaining: start' = now, duration' = extension, refused with
 * INVALID_RESULT when that is shorter than the current duration.
 *
 * Applying an extension x before a top-up therefore ends exactly x from
 * now; the reverse order ends at least that late.
 */
CombineResult CombineExtension(const LockTiming& lock, Amount amount, int64_t extension,
                               Timestamp now);

} // namespace vault
} // namespace lockvault

#endif // LOCKVAULT_VAULT_COMBINER_H
