// LOCKVAULT - Weighted-Average Lockup Combiner Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/vault/combiner.h"

#include <algorithm>
#include <limits>

namespace lockvault {
namespace vault {

namespace {

constexpr int64_t kInt64Max = std::numeric_limits<int64_t>::max();

// now + offset, false if it leaves the int64 range
bool AddTime(Timestamp now, int64_t offset, Timestamp& out) {
    if ((offset > 0 && now > kInt64Max - offset) ||
        (offset < 0 && now < std::numeric_limits<int64_t>::min() - offset)) {
        return false;
    }
    out = now + offset;
    return true;
}

} // namespace

const char* CombineStatusToString(CombineStatus status) {
    switch (status) {
        case CombineStatus::OK:             return "ok";
        case CombineStatus::ZERO_AMOUNT:    return "zero amount";
        case CombineStatus::ZERO_DURATION:  return "zero duration";
        case CombineStatus::OVERFLOW:       return "arithmetic overflow";
        case CombineStatus::INVALID_RESULT: return "invalid combination";
        default:                            return "unknown";
    }
}

int64_t RemainingLockup(const LockTiming& lock, Timestamp now) {
    Timestamp maturity = 0;
    if (!AddTime(lock.start, lock.duration, maturity)) {
        return lock.duration > 0 ? kInt64Max : 0;
    }
    if (maturity <= now) {
        return 0;
    }
    if (now < 0 && maturity > kInt64Max + now) {
        return kInt64Max;
    }
    return maturity - now;
}

CombineResult CombineAmount(const LockTiming& lock, Amount amount, Amount delta,
                            Timestamp now) {
    CombineResult result;

    if (amount <= 0 || delta <= 0) {
        result.status = CombineStatus::ZERO_AMOUNT;
        return result;
    }
    if (lock.duration <= 0) {
        result.status = CombineStatus::ZERO_DURATION;
        return result;
    }
    if (amount > MAX_MONEY || delta > MAX_MONEY - amount) {
        result.status = CombineStatus::OVERFLOW;
        return result;
    }
    Amount total = amount + delta;

    // (remaining * amount + duration * delta) / total, written as the
    // shorter leg plus a weighted share of the gap so nothing overflows
    int64_t remaining = RemainingLockup(lock, now);
    int64_t merged;
    if (remaining <= lock.duration) {
        merged = remaining + MulDiv(lock.duration - remaining, delta, total);
    } else {
        merged = lock.duration + MulDiv(remaining - lock.duration, amount, total);
    }

    int64_t newDuration = std::max(lock.duration, merged);
    Timestamp newStart = 0;
    Timestamp maturity = 0;
    if (!AddTime(now, merged - newDuration, newStart) || !AddTime(now, merged, maturity)) {
        result.status = CombineStatus::OVERFLOW;
        return result;
    }

    result.timing.start = newStart;
    result.timing.duration = newDuration;
    if (result.timing.start > now || maturity < now) {
        result.status = CombineStatus::INVALID_RESULT;
    }
    return result;
}

CombineResult CombineExtension(const LockTiming& lock, Amount amount, int64_t extension,
                               Timestamp now) {
    CombineResult result;

    if (amount <= 0) {
        result.status = CombineStatus::ZERO_AMOUNT;
        return result;
    }
    if (lock.duration <= 0 || extension <= 0) {
        result.status = CombineStatus::ZERO_DURATION;
        return result;
    }

    // Remaining time already covers the extension: timing is unchanged
    if (extension <= RemainingLockup(lock, now)) {
        result.timing = lock;
        return result;
    }

    // The extension dominates and the lock restarts now, which must not
    // shorten the duration
    if (extension < lock.duration) {
        result.status = CombineStatus::INVALID_RESULT;
        return result;
    }
    Timestamp maturity = 0;
    if (!AddTime(now, extension, maturity)) {
        result.status = CombineStatus::OVERFLOW;
        return result;
    }
    result.timing.start = now;
    result.timing.duration = extension;
    return result;
}

} // namespace vault
} // namespace lockvault
