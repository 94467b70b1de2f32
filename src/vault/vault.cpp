// LOCKVAULT - Staking Vault Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/vault/vault.h"

#include "lockvault/token/ledger.h"
#include "lockvault/util/logging.h"
#include "lockvault/util/time.h"
#include "lockvault/vault/combiner.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace lockvault {
namespace vault {

// ============================================================================
// Error and Event Names
// ============================================================================

const char* VaultErrorToString(VaultError error) {
    switch (error) {
        case VaultError::OK:                            return "ok";
        case VaultError::ZERO_ADDRESS:                  return "zero address";
        case VaultError::ZERO_AMOUNT:                   return "zero amount";
        case VaultError::AMOUNT_BELOW_MINIMUM:          return "amount below minimum";
        case VaultError::AMOUNT_ABOVE_MAXIMUM:          return "amount above maximum";
        case VaultError::INVALID_LOCKUP_PERIOD:         return "invalid lockup period";
        case VaultError::LOCKUP_INCREASE_TOO_SMALL:     return "lockup increase too small";
        case VaultError::LOCKUP_INCREASE_TOO_LARGE:     return "lockup increase too large";
        case VaultError::NO_STAKE_FOUND:                return "no stake found";
        case VaultError::STAKE_ALREADY_EXISTS:          return "stake already exists";
        case VaultError::COOLDOWN_IN_PROGRESS:          return "cooldown in progress";
        case VaultError::EARLY_COOLDOWN_IN_PROGRESS:    return "early unstake cooldown in progress";
        case VaultError::NO_COOLDOWN:                   return "no cooldown";
        case VaultError::NO_EARLY_COOLDOWN:             return "no early unstake cooldown";
        case VaultError::AMOUNT_EXCEEDS_AVAILABLE:      return "amount exceeds available";
        case VaultError::AMOUNT_EXCEEDS_COOLDOWN:       return "amount exceeds cooldown amount";
        case VaultError::AMOUNT_EXCEEDS_EARLY_COOLDOWN: return "amount exceeds early cooldown amount";
        case VaultError::LOCKUP_COMPLETED:              return "lockup already completed";
        case VaultError::INSUFFICIENT_EXCESS:           return "insufficient excess custody";
        case VaultError::PAUSED:                        return "paused";
        case VaultError::NOT_PAUSED:                    return "not paused";
        case VaultError::STAKE_STILL_LOCKED:            return "stake still locked";
        case VaultError::COOLDOWN_NOT_COMPLETE:         return "cooldown not complete";
        case VaultError::EARLY_COOLDOWN_NOT_COMPLETE:   return "early unstake cooldown not complete";
        case VaultError::UNAUTHORIZED:                  return "unauthorized";
        case VaultError::ARITHMETIC_OVERFLOW:           return "arithmetic overflow";
        case VaultError::INVALID_COMBINATION:           return "invalid combination";
        case VaultError::TRANSFER_FAILED:               return "token transfer failed";
        case VaultError::STORAGE_ERROR:                 return "storage error";
        default:                                        return "unknown";
    }
}

const char* VaultEventTypeToString(VaultEventType type) {
    switch (type) {
        case VaultEventType::Staked:                return "Staked";
        case VaultEventType::AmountIncreased:       return "AmountIncreased";
        case VaultEventType::LockupIncreased:       return "LockupIncreased";
        case VaultEventType::UnstakeInitiated:      return "UnstakeInitiated";
        case VaultEventType::Unstaked:              return "Unstaked";
        case VaultEventType::EarlyUnstakeInitiated: return "EarlyUnstakeInitiated";
        case VaultEventType::EarlyUnstaked:         return "EarlyUnstaked";
        case VaultEventType::QAPenalty:             return "QAPenalty";
        case VaultEventType::Paused:                return "Paused";
        case VaultEventType::Unpaused:              return "Unpaused";
        case VaultEventType::TreasuryUpdated:       return "TreasuryUpdated";
        case VaultEventType::QACallerUpdated:       return "QACallerUpdated";
        case VaultEventType::MaximumStakeUpdated:   return "MaximumStakeUpdated";
        case VaultEventType::EmergencyWithdraw:     return "EmergencyWithdraw";
        default:                                    return "Unknown";
    }
}

std::string VaultEvent::ToString() const {
    std::ostringstream oss;
    oss << VaultEventTypeToString(type) << "(user=" << user.ToString();
    if (amount != 0) {
        oss << ", amount=" << FormatAmount(amount);
    }
    if (secondaryAmount != 0) {
        oss << ", secondary=" << FormatAmount(secondaryAmount);
    }
    if (lockup != 0) {
        oss << ", lockup=" << util::FormatDuration(util::Seconds{lockup});
    }
    if (multiplier != 0) {
        oss << ", multiplier=" << FormatBps(multiplier);
    }
    oss << ")";
    return oss.str();
}

namespace {

VaultError FromCombineStatus(CombineStatus status) {
    switch (status) {
        case CombineStatus::OK:             return VaultError::OK;
        case CombineStatus::ZERO_AMOUNT:    return VaultError::ZERO_AMOUNT;
        case CombineStatus::ZERO_DURATION:  return VaultError::INVALID_LOCKUP_PERIOD;
        case CombineStatus::OVERFLOW:       return VaultError::ARITHMETIC_OVERFLOW;
        default:                            return VaultError::INVALID_COMBINATION;
    }
}

VaultParams ValidatedParams(VaultParams params) {
    if (auto err = params.Validate()) {
        throw std::invalid_argument("invalid vault parameters: " + *err);
    }
    return params;
}

const Address& NonNull(const Address& addr, const char* what) {
    if (addr.IsNull()) {
        throw std::invalid_argument(std::string(what) + " address must not be zero");
    }
    return addr;
}

// bps <= 10000 keeps the share at or below amount
Amount PenaltyShare(Amount amount, int bps) {
    return MulDiv(amount, bps, BPS_DENOMINATOR);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

StakingVault::StakingVault(VaultParams params, const VaultRoles& roles,
                           token::TokenLedger& ledger, const Address& vaultAddress,
                           std::unique_ptr<VaultDB> db)
    : params_(ValidatedParams(std::move(params)))
    , admin_(NonNull(roles.admin, "admin"))
    , vaultAddress_(NonNull(vaultAddress, "vault"))
    , ledger_(ledger)
    , db_(std::move(db)) {
    NonNull(roles.treasury, "treasury");
    NonNull(roles.qualityControlCaller, "quality-control caller");
    if (!db_) {
        throw std::invalid_argument("StakingVault: no vault database");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (auto stored = db_->ReadState()) {
        state_ = *stored;
        positions_ = db_->LoadAllPositions();

        std::string problem = CheckInvariantsLocked(false);
        if (!problem.empty()) {
            throw std::runtime_error("stored vault state is inconsistent: " + problem);
        }
        RefreshMultipliersLocked();

        LOG_INFO(util::LogCategory::VAULT)
            << "Loaded vault: " << positions_.size() << " positions, total staked "
            << FormatAmount(state_.totalStaked) << (state_.paused ? " (paused)" : "");
        return;
    }

    state_.maximumStake = params_.maximumStake;
    state_.treasury = roles.treasury;
    state_.qualityControlCaller = roles.qualityControlCaller;

    db::Status s = db_->WriteBatch({}, state_);
    if (!s.ok()) {
        throw std::runtime_error("cannot initialise vault store: " + s.ToString());
    }
    LOG_INFO(util::LogCategory::VAULT) << "Initialised new vault at " << vaultAddress_.ToString();
}

StakingVault::~StakingVault() = default;

void StakingVault::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    eventCallback_ = std::move(callback);
}

// Multipliers follow the configured table; a changed table re-prices
// stored positions on load
void StakingVault::RefreshMultipliersLocked() {
    std::vector<std::pair<Address, Position>> changed;
    for (auto& [user, pos] : positions_) {
        Position repriced = pos;
        Reprice(repriced);
        if (repriced.effectiveMultiplier != pos.effectiveMultiplier) {
            changed.emplace_back(user, repriced);
        }
    }
    if (changed.empty()) {
        return;
    }

    db::Status s = db_->WriteBatch(changed, state_);
    if (!s.ok()) {
        throw std::runtime_error("cannot persist re-priced positions: " + s.ToString());
    }
    for (const auto& [user, pos] : changed) {
        positions_[user] = pos;
    }
    LOG_WARN(util::LogCategory::VAULT) << "Multiplier table changed; re-priced "
                                       << changed.size() << " positions";
}

// ============================================================================
// Operation Plumbing
// ============================================================================

VaultError StakingVault::Run(const char* op, const Address& who, const Body& body) {
    Mutation m;
    EventCallback callback;
    VaultError err;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        m.state = state_;
        err = body(util::GetTime(), m);
        if (err == VaultError::OK) {
            err = CommitLocked(m);
        }
        callback = eventCallback_;
    }

    if (err != VaultError::OK) {
        LOG_DEBUG(util::LogCategory::VAULT) << op << " rejected for " << who.ToString()
                                            << ": " << VaultErrorToString(err);
        return err;
    }

    for (const auto& event : m.events) {
        LogEvent(event);
        if (callback) {
            callback(event);
        }
    }
    return err;
}

VaultError StakingVault::CommitLocked(Mutation& m) {
    std::vector<TokenMove> done;
    for (const auto& move : m.moves) {
        if (!ExecuteMove(move)) {
            LOG_ERROR(util::LogCategory::VAULT)
                << "Token " << (move.kind == TokenMove::Kind::Pull ? "pull from " : "push to ")
                << move.account.ToString() << " of " << FormatAmount(move.amount) << " failed";
            RollbackMoves(done);
            return VaultError::TRANSFER_FAILED;
        }
        done.push_back(move);
    }

    std::vector<std::pair<Address, Position>> records(m.positions.begin(), m.positions.end());
    if (!db_->WriteBatch(records, m.state).ok()) {
        RollbackMoves(done);
        return VaultError::STORAGE_ERROR;
    }

    for (const auto& [user, pos] : m.positions) {
        if (pos.IsEmpty()) {
            positions_.erase(user);
        } else {
            positions_[user] = pos;
        }
    }
    state_ = m.state;
    return VaultError::OK;
}

// A ledger that throws is treated as a refused movement
bool StakingVault::ExecuteMove(const TokenMove& move) {
    try {
        if (move.kind == TokenMove::Kind::Pull) {
            return ledger_.TransferFrom(vaultAddress_, move.account, vaultAddress_, move.amount);
        }
        return ledger_.Transfer(vaultAddress_, move.account, move.amount);
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::VAULT) << "Token ledger error: " << e.what();
        return false;
    }
}

bool StakingVault::ReverseMove(const TokenMove& move) {
    try {
        if (move.kind == TokenMove::Kind::Pull) {
            Amount allowance = ledger_.Allowance(move.account, vaultAddress_);
            return ledger_.Transfer(vaultAddress_, move.account, move.amount) &&
                   ledger_.Approve(move.account, vaultAddress_, allowance + move.amount);
        }
        return ledger_.Transfer(move.account, vaultAddress_, move.amount);
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::VAULT) << "Token ledger error: " << e.what();
        return false;
    }
}

void StakingVault::RollbackMoves(const std::vector<TokenMove>& done) {
    for (auto it = done.rbegin(); it != done.rend(); ++it) {
        if (!ReverseMove(*it)) {
            LOG_ERROR(util::LogCategory::VAULT)
                << "Could not reverse token movement for " << it->account.ToString()
                << " of " << FormatAmount(it->amount);
        }
    }
}

Position& StakingVault::Working(Mutation& m, const Address& user) const {
    auto it = m.positions.find(user);
    if (it != m.positions.end()) {
        return it->second;
    }
    return m.positions.emplace(user, PositionLocked(user)).first->second;
}

Position StakingVault::PositionLocked(const Address& user) const {
    auto it = positions_.find(user);
    return it == positions_.end() ? Position{} : it->second;
}

void StakingVault::Reprice(Position& pos) const {
    pos.effectiveMultiplier = params_.multipliers.Calculate(pos.amount,
                                                            pos.effectiveLockupPeriod);
}

VaultError StakingVault::CheckCanPull(const Address& user, Amount amount) const {
    if (ledger_.Allowance(user, vaultAddress_) < amount || ledger_.BalanceOf(user) < amount) {
        return VaultError::TRANSFER_FAILED;
    }
    return VaultError::OK;
}

VaultEvent StakingVault::MakeEvent(VaultEventType type, const Address& user, Timestamp now) {
    VaultEvent event;
    event.type = type;
    event.user = user;
    event.timestamp = now;
    return event;
}

void StakingVault::LogEvent(const VaultEvent& event) {
    switch (event.type) {
        case VaultEventType::Paused:
        case VaultEventType::Unpaused:
        case VaultEventType::TreasuryUpdated:
        case VaultEventType::QACallerUpdated:
        case VaultEventType::MaximumStakeUpdated:
        case VaultEventType::EmergencyWithdraw:
            LOG_WARN(util::LogCategory::VAULT) << event.ToString();
            break;
        default:
            LOG_INFO(util::LogCategory::VAULT) << event.ToString();
            break;
    }
}

// ============================================================================
// Stake / Increase
// ============================================================================

VaultError StakingVault::Stake(const Address& user, Amount amount, int64_t lockup) {
    return Run("stake", user, [&](Timestamp now, Mutation& m) {
        if (m.state.paused) return VaultError::PAUSED;
        if (user.IsNull()) return VaultError::ZERO_ADDRESS;
        if (amount <= 0) return VaultError::ZERO_AMOUNT;
        if (amount < params_.minimumStake) return VaultError::AMOUNT_BELOW_MINIMUM;
        if (amount > m.state.maximumStake) return VaultError::AMOUNT_ABOVE_MAXIMUM;
        if (!params_.IsValidLockup(lockup)) return VaultError::INVALID_LOCKUP_PERIOD;

        Position& pos = Working(m, user);
        if (pos.HasStake()) return VaultError::STAKE_ALREADY_EXISTS;
        if (!MoneyRange(m.state.totalStaked + amount)) return VaultError::ARITHMETIC_OVERFLOW;

        VaultError pull = CheckCanPull(user, amount);
        if (pull != VaultError::OK) return pull;

        pos = Position{};
        pos.amount = amount;
        pos.weightedStartTime = now;
        pos.effectiveLockupPeriod = lockup;
        pos.lastUpdateTime = now;
        Reprice(pos);

        m.state.totalStaked += amount;
        m.moves.push_back({TokenMove::Kind::Pull, user, amount});

        VaultEvent event = MakeEvent(VaultEventType::Staked, user, now);
        event.amount = amount;
        event.lockup = lockup;
        event.multiplier = pos.effectiveMultiplier;
        m.events.push_back(event);
        return VaultError::OK;
    });
}

VaultError StakingVault::ApplyAmountIncrease(Mutation& m, const Address& user, Amount delta,
                                             Timestamp now) {
    Position& pos = Working(m, user);
    if (pos.amount + delta > m.state.maximumStake) return VaultError::AMOUNT_ABOVE_MAXIMUM;
    if (!MoneyRange(m.state.totalStaked + delta)) return VaultError::ARITHMETIC_OVERFLOW;

    CombineResult combined = CombineAmount(pos.Timing(), pos.amount, delta, now);
    if (!combined.ok()) {
        return FromCombineStatus(combined.status);
    }

    pos.amount += delta;
    pos.weightedStartTime = combined.timing.start;
    pos.effectiveLockupPeriod = combined.timing.duration;
    pos.lastUpdateTime = now;
    Reprice(pos);

    m.state.totalStaked += delta;
    m.moves.push_back({TokenMove::Kind::Pull, user, delta});

    VaultEvent event = MakeEvent(VaultEventType::AmountIncreased, user, now);
    event.amount = delta;
    event.secondaryAmount = pos.amount;
    event.lockup = pos.effectiveLockupPeriod;
    event.multiplier = pos.effectiveMultiplier;
    m.events.push_back(event);
    return VaultError::OK;
}

VaultError StakingVault::ApplyLockupIncrease(Mutation& m, const Address& user, int64_t extension,
                                             Timestamp now) {
    Position& pos = Working(m, user);

    CombineResult combined = CombineExtension(pos.Timing(), pos.amount, extension, now);
    if (!combined.ok()) {
        return FromCombineStatus(combined.status);
    }

    pos.weightedStartTime = combined.timing.start;
    pos.effectiveLockupPeriod = combined.timing.duration;
    pos.lastUpdateTime = now;
    Reprice(pos);

    VaultEvent event = MakeEvent(VaultEventType::LockupIncreased, user, now);
    event.amount = pos.amount;
    event.secondaryAmount = extension;
    event.lockup = pos.effectiveLockupPeriod;
    event.multiplier = pos.effectiveMultiplier;
    m.events.push_back(event);
    return VaultError::OK;
}

VaultError StakingVault::IncreaseAmount(const Address& user, Amount delta) {
    return Run("increase-amount", user, [&](Timestamp now, Mutation& m) {
        if (m.state.paused) return VaultError::PAUSED;
        if (user.IsNull()) return VaultError::ZERO_ADDRESS;
        if (delta <= 0) return VaultError::ZERO_AMOUNT;
        if (delta < params_.minimumStake) return VaultError::AMOUNT_BELOW_MINIMUM;

        const Position& pos = Working(m, user);
        if (!pos.HasStake()) return VaultError::NO_STAKE_FOUND;
        if (pos.InCooldown()) return VaultError::COOLDOWN_IN_PROGRESS;
        if (pos.InEarlyCooldown()) return VaultError::EARLY_COOLDOWN_IN_PROGRESS;

        VaultError pull = CheckCanPull(user, delta);
        if (pull != VaultError::OK) return pull;

        return ApplyAmountIncrease(m, user, delta, now);
    });
}

VaultError StakingVault::IncreaseLockup(const Address& user, int64_t extension) {
    return Run("increase-lockup", user, [&](Timestamp now, Mutation& m) {
        if (m.state.paused) return VaultError::PAUSED;
        if (user.IsNull()) return VaultError::ZERO_ADDRESS;
        if (extension < params_.minimumLockupIncrease) return VaultError::LOCKUP_INCREASE_TOO_SMALL;
        if (extension > params_.maximumLockup) return VaultError::LOCKUP_INCREASE_TOO_LARGE;

        const Position& pos = Working(m, user);
        if (!pos.HasStake()) return VaultError::NO_STAKE_FOUND;
        if (pos.InCooldown()) return VaultError::COOLDOWN_IN_PROGRESS;
        if (pos.InEarlyCooldown()) return VaultError::EARLY_COOLDOWN_IN_PROGRESS;

        return ApplyLockupIncrease(m, user, extension, now);
    });
}

VaultError StakingVault::IncreaseStake(const Address& user, Amount delta, int64_t extension) {
    return Run("increase-stake", user, [&](Timestamp now, Mutation& m) {
        if (m.state.paused) return VaultError::PAUSED;
        if (user.IsNull()) return VaultError::ZERO_ADDRESS;
        if (delta <= 0) return VaultError::ZERO_AMOUNT;
        if (delta < params_.minimumStake) return VaultError::AMOUNT_BELOW_MINIMUM;
        if (extension < params_.minimumLockupIncrease) return VaultError::LOCKUP_INCREASE_TOO_SMALL;
        if (extension > params_.maximumLockup) return VaultError::LOCKUP_INCREASE_TOO_LARGE;

        const Position& pos = Working(m, user);
        if (!pos.HasStake()) return VaultError::NO_STAKE_FOUND;
        if (pos.InCooldown()) return VaultError::COOLDOWN_IN_PROGRESS;
        if (pos.InEarlyCooldown()) return VaultError::EARLY_COOLDOWN_IN_PROGRESS;

        VaultError pull = CheckCanPull(user, delta);
        if (pull != VaultError::OK) return pull;

        VaultError err = ApplyLockupIncrease(m, user, extension, now);
        if (err != VaultError::OK) return err;
        return ApplyAmountIncrease(m, user, delta, now);
    });
}

// ============================================================================
// Unstake Lifecycle
// ============================================================================

VaultError StakingVault::InitiateUnstake(const Address& user, Amount amount) {
    return Run("initiate-unstake", user, [&](Timestamp now, Mutation& m) {
        if (m.state.paused) return VaultError::PAUSED;
        if (user.IsNull()) return VaultError::ZERO_ADDRESS;
        if (amount <= 0) return VaultError::ZERO_AMOUNT;

        Position& pos = Working(m, user);
        if (!pos.HasStake()) return VaultError::NO_STAKE_FOUND;
        if (pos.InCooldown()) return VaultError::COOLDOWN_IN_PROGRESS;
        if (pos.InEarlyCooldown()) return VaultError::EARLY_COOLDOWN_IN_PROGRESS;
        if (!pos.IsMatured(now)) return VaultError::STAKE_STILL_LOCKED;
        if (amount > pos.Unlocked(now)) return VaultError::AMOUNT_EXCEEDS_AVAILABLE;

        pos.cooldownStart = now;
        pos.cooldownAmount = amount;
        pos.lastUpdateTime = now;
        m.state.totalInCooldown += amount;

        VaultEvent event = MakeEvent(VaultEventType::UnstakeInitiated, user, now);
        event.amount = amount;
        m.events.push_back(event);
        return VaultError::OK;
    });
}

VaultError StakingVault::Unstake(const Address& user, Amount amount) {
    return Run("unstake", user, [&](Timestamp now, Mutation& m) {
        if (m.state.paused) return VaultError::PAUSED;
        if (user.IsNull()) return VaultError::ZERO_ADDRESS;
        if (amount <= 0) return VaultError::ZERO_AMOUNT;

        Position& pos = Working(m, user);
        if (!pos.InCooldown()) return VaultError::NO_COOLDOWN;
        if (amount > pos.cooldownAmount) return VaultError::AMOUNT_EXCEEDS_COOLDOWN;
        if (now < pos.cooldownStart + params_.cooldownPeriod) {
            return VaultError::COOLDOWN_NOT_COMPLETE;
        }

        pos.amount -= amount;
        pos.cooldownAmount -= amount;
        if (pos.cooldownAmount == 0) {
            pos.cooldownStart = 0;
        }
        pos.lastUpdateTime = now;
        Reprice(pos);
        if (pos.IsEmpty()) {
            pos = Position{};
        }

        m.state.totalStaked -= amount;
        m.state.totalInCooldown -= amount;
        m.moves.push_back({TokenMove::Kind::Push, user, amount});

        VaultEvent event = MakeEvent(VaultEventType::Unstaked, user, now);
        event.amount = amount;
        m.events.push_back(event);
        return VaultError::OK;
    });
}

VaultError StakingVault::InitiateEarlyUnstake(const Address& user, Amount amount) {
    return Run("initiate-early-unstake", user, [&](Timestamp now, Mutation& m) {
        if (m.state.paused) return VaultError::PAUSED;
        if (user.IsNull()) return VaultError::ZERO_ADDRESS;
        if (amount <= 0) return VaultError::ZERO_AMOUNT;
        if (amount < params_.minimumStake) return VaultError::AMOUNT_BELOW_MINIMUM;

        Position& pos = Working(m, user);
        if (!pos.HasStake()) return VaultError::NO_STAKE_FOUND;
        if (pos.InCooldown()) return VaultError::COOLDOWN_IN_PROGRESS;
        if (pos.InEarlyCooldown()) return VaultError::EARLY_COOLDOWN_IN_PROGRESS;
        if (pos.IsMatured(now)) return VaultError::LOCKUP_COMPLETED;
        if (amount > pos.Locked(now)) return VaultError::AMOUNT_EXCEEDS_AVAILABLE;

        pos.earlyUnstakeCooldownStart = now;
        pos.earlyUnstakeCooldownAmount = amount;
        pos.lastUpdateTime = now;
        m.state.totalInEarlyCooldown += amount;

        VaultEvent event = MakeEvent(VaultEventType::EarlyUnstakeInitiated, user, now);
        event.amount = amount;
        m.events.push_back(event);
        return VaultError::OK;
    });
}

VaultError StakingVault::EarlyUnstake(const Address& user, Amount amount) {
    return Run("early-unstake", user, [&](Timestamp now, Mutation& m) {
        if (m.state.paused) return VaultError::PAUSED;
        if (user.IsNull()) return VaultError::ZERO_ADDRESS;
        if (amount <= 0) return VaultError::ZERO_AMOUNT;

        Position& pos = Working(m, user);
        if (!pos.InEarlyCooldown()) return VaultError::NO_EARLY_COOLDOWN;
        if (amount > pos.earlyUnstakeCooldownAmount) {
            return VaultError::AMOUNT_EXCEEDS_EARLY_COOLDOWN;
        }
        if (now < pos.earlyUnstakeCooldownStart + params_.earlyUnstakeCooldownPeriod) {
            return VaultError::EARLY_COOLDOWN_NOT_COMPLETE;
        }

        Amount penalty = PenaltyShare(amount, params_.earlyUnstakePenaltyBps);
        Amount payout = amount - penalty;

        pos.amount -= amount;
        pos.earlyUnstakeCooldownAmount -= amount;
        if (pos.earlyUnstakeCooldownAmount == 0) {
            pos.earlyUnstakeCooldownStart = 0;
        }
        pos.lastUpdateTime = now;
        Reprice(pos);
        if (pos.IsEmpty()) {
            pos = Position{};
        }

        m.state.totalStaked -= amount;
        m.state.totalInEarlyCooldown -= amount;
        if (payout > 0) {
            m.moves.push_back({TokenMove::Kind::Push, user, payout});
        }
        if (penalty > 0) {
            m.moves.push_back({TokenMove::Kind::Push, m.state.treasury, penalty});
        }

        VaultEvent event = MakeEvent(VaultEventType::EarlyUnstaked, user, now);
        event.amount = payout;
        event.secondaryAmount = penalty;
        m.events.push_back(event);
        return VaultError::OK;
    });
}

// ============================================================================
// Penalty Hook
// ============================================================================

PenaltyResult StakingVault::ProcessQAPenalty(const Address& caller, const Address& user,
                                             Amount requested) {
    Amount applied = 0;
    VaultError err = Run("qa-penalty", user, [&](Timestamp now, Mutation& m) {
        if (caller.IsNull() || caller != m.state.qualityControlCaller) {
            return VaultError::UNAUTHORIZED;
        }
        if (m.state.paused) return VaultError::PAUSED;
        if (user.IsNull()) return VaultError::ZERO_ADDRESS;
        if (requested <= 0) return VaultError::ZERO_AMOUNT;

        Position& pos = Working(m, user);
        Amount take = std::min(requested, pos.amount);
        if (take == 0) {
            return VaultError::OK;
        }

        // Active portion first, then the normal cooldown, then the early one
        Amount remaining = take;
        Amount fromActive = std::min(remaining, pos.Available());
        remaining -= fromActive;

        Amount fromCooldown = std::min(remaining, pos.cooldownAmount);
        remaining -= fromCooldown;

        Amount fromEarly = std::min(remaining, pos.earlyUnstakeCooldownAmount);
        remaining -= fromEarly;

        if (remaining != 0) {
            return VaultError::INVALID_COMBINATION;
        }

        pos.amount -= take;
        pos.cooldownAmount -= fromCooldown;
        pos.earlyUnstakeCooldownAmount -= fromEarly;
        if (pos.cooldownAmount == 0) {
            pos.cooldownStart = 0;
        }
        if (pos.earlyUnstakeCooldownAmount == 0) {
            pos.earlyUnstakeCooldownStart = 0;
        }
        pos.lastUpdateTime = now;
        Reprice(pos);
        if (pos.amount == 0) {
            pos = Position{};
        }

        m.state.totalStaked -= take;
        m.state.totalInCooldown -= fromCooldown;
        m.state.totalInEarlyCooldown -= fromEarly;
        m.moves.push_back({TokenMove::Kind::Push, m.state.treasury, take});

        VaultEvent event = MakeEvent(VaultEventType::QAPenalty, user, now);
        event.amount = take;
        event.secondaryAmount = requested;
        event.multiplier = pos.effectiveMultiplier;
        m.events.push_back(event);

        applied = take;
        return VaultError::OK;
    });

    PenaltyResult result;
    result.error = err;
    result.applied = err == VaultError::OK ? applied : 0;
    return result;
}

// ============================================================================
// Administration
// ============================================================================

VaultError StakingVault::Pause(const Address& caller) {
    return Run("pause", caller, [&](Timestamp now, Mutation& m) {
        if (caller != admin_) return VaultError::UNAUTHORIZED;
        if (m.state.paused) return VaultError::PAUSED;
        m.state.paused = true;
        m.events.push_back(MakeEvent(VaultEventType::Paused, caller, now));
        return VaultError::OK;
    });
}

VaultError StakingVault::Unpause(const Address& caller) {
    return Run("unpause", caller, [&](Timestamp now, Mutation& m) {
        if (caller != admin_) return VaultError::UNAUTHORIZED;
        if (!m.state.paused) return VaultError::NOT_PAUSED;
        m.state.paused = false;
        m.events.push_back(MakeEvent(VaultEventType::Unpaused, caller, now));
        return VaultError::OK;
    });
}

VaultError StakingVault::SetTreasury(const Address& caller, const Address& treasury) {
    return Run("set-treasury", caller, [&](Timestamp now, Mutation& m) {
        if (caller != admin_) return VaultError::UNAUTHORIZED;
        if (treasury.IsNull()) return VaultError::ZERO_ADDRESS;
        m.state.treasury = treasury;
        m.events.push_back(MakeEvent(VaultEventType::TreasuryUpdated, treasury, now));
        return VaultError::OK;
    });
}

VaultError StakingVault::SetQualityControlCaller(const Address& caller, const Address& qaCaller) {
    return Run("set-qa-caller", caller, [&](Timestamp now, Mutation& m) {
        if (caller != admin_) return VaultError::UNAUTHORIZED;
        if (qaCaller.IsNull()) return VaultError::ZERO_ADDRESS;
        m.state.qualityControlCaller = qaCaller;
        m.events.push_back(MakeEvent(VaultEventType::QACallerUpdated, qaCaller, now));
        return VaultError::OK;
    });
}

VaultError StakingVault::SetMaximumStake(const Address& caller, Amount maximum) {
    return Run("set-max-stake", caller, [&](Timestamp now, Mutation& m) {
        if (caller != admin_) return VaultError::UNAUTHORIZED;
        if (maximum < params_.minimumStake) return VaultError::AMOUNT_BELOW_MINIMUM;
        if (!MoneyRange(maximum)) return VaultError::AMOUNT_ABOVE_MAXIMUM;
        m.state.maximumStake = maximum;

        VaultEvent event = MakeEvent(VaultEventType::MaximumStakeUpdated, caller, now);
        event.amount = maximum;
        m.events.push_back(event);
        return VaultError::OK;
    });
}

VaultError StakingVault::EmergencyWithdraw(const Address& caller, const Address& to,
                                           Amount amount) {
    return Run("emergency-withdraw", caller, [&](Timestamp now, Mutation& m) {
        if (caller != admin_) return VaultError::UNAUTHORIZED;
        if (to.IsNull()) return VaultError::ZERO_ADDRESS;
        if (amount <= 0) return VaultError::ZERO_AMOUNT;

        // Cooldown amounts are still inside totalStaked; counting them again
        // keeps the bound conservative
        Amount owed = m.state.totalStaked + m.state.totalInCooldown +
                      m.state.totalInEarlyCooldown;
        Amount custody = ledger_.BalanceOf(vaultAddress_);
        if (custody <= owed || amount > custody - owed) {
            return VaultError::INSUFFICIENT_EXCESS;
        }

        m.moves.push_back({TokenMove::Kind::Push, to, amount});

        VaultEvent event = MakeEvent(VaultEventType::EmergencyWithdraw, to, now);
        event.amount = amount;
        m.events.push_back(event);
        return VaultError::OK;
    });
}

// ============================================================================
// Per-User Queries
// ============================================================================

Position StakingVault::GetPosition(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return PositionLocked(user);
}

UserStakingSummary StakingVault::SummaryLocked(const Address& user, Timestamp now) const {
    UserStakingSummary summary;
    Position pos = PositionLocked(user);
    if (pos.IsEmpty()) {
        return summary;
    }

    summary.userTotalStaked = pos.amount;
    summary.totalUnlocked = pos.Unlocked(now);
    summary.totalLocked = pos.Locked(now);
    summary.totalInCooldown = pos.cooldownAmount;
    summary.totalInEarlyCooldown = pos.earlyUnstakeCooldownAmount;
    summary.effectiveMultiplier = pos.effectiveMultiplier;
    summary.effectiveLockupPeriod = pos.effectiveLockupPeriod;
    summary.timeUntilUnlock = RemainingLockup(pos.Timing(), now);
    summary.hasActiveStake = pos.HasStake();

    if (pos.InCooldown()) {
        Timestamp ready = pos.cooldownStart + params_.cooldownPeriod;
        summary.timeUntilCooldownComplete = std::max<int64_t>(0, ready - now);
        summary.totalReadyForUnstake = now >= ready ? pos.cooldownAmount : 0;
    }
    if (pos.InEarlyCooldown()) {
        Timestamp ready = pos.earlyUnstakeCooldownStart + params_.earlyUnstakeCooldownPeriod;
        summary.timeUntilEarlyCooldownComplete = std::max<int64_t>(0, ready - now);
        summary.totalReadyForEarlyUnstake = now >= ready ? pos.earlyUnstakeCooldownAmount : 0;
    }
    return summary;
}

UserStakingSummary StakingVault::GetUserSummary(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SummaryLocked(user, util::GetTime());
}

Amount StakingVault::GetTotalStaked(const Address& user) const {
    return GetUserSummary(user).userTotalStaked;
}

Amount StakingVault::GetTotalUnlocked(const Address& user) const {
    return GetUserSummary(user).totalUnlocked;
}

Amount StakingVault::GetTotalLocked(const Address& user) const {
    return GetUserSummary(user).totalLocked;
}

Amount StakingVault::GetTotalInCooldown(const Address& user) const {
    return GetUserSummary(user).totalInCooldown;
}

Amount StakingVault::GetTotalInEarlyCooldown(const Address& user) const {
    return GetUserSummary(user).totalInEarlyCooldown;
}

Amount StakingVault::GetTotalReadyForUnstake(const Address& user) const {
    return GetUserSummary(user).totalReadyForUnstake;
}

Amount StakingVault::GetTotalReadyForEarlyUnstake(const Address& user) const {
    return GetUserSummary(user).totalReadyForEarlyUnstake;
}

int StakingVault::GetUserMultiplier(const Address& user) const {
    return GetUserSummary(user).effectiveMultiplier;
}

int64_t StakingVault::GetUserLockupPeriod(const Address& user) const {
    return GetUserSummary(user).effectiveLockupPeriod;
}

int64_t StakingVault::GetTimeUntilUnlock(const Address& user) const {
    return GetUserSummary(user).timeUntilUnlock;
}

int64_t StakingVault::GetTimeUntilCooldownComplete(const Address& user) const {
    return GetUserSummary(user).timeUntilCooldownComplete;
}

int64_t StakingVault::GetTimeUntilEarlyCooldownComplete(const Address& user) const {
    return GetUserSummary(user).timeUntilEarlyCooldownComplete;
}

bool StakingVault::HasActiveStake(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return PositionLocked(user).HasStake();
}

// ============================================================================
// System Queries
// ============================================================================

Amount StakingVault::GetTotalStaked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.totalStaked;
}

Amount StakingVault::GetTotalInCooldown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.totalInCooldown;
}

Amount StakingVault::GetTotalInEarlyCooldown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.totalInEarlyCooldown;
}

Amount StakingVault::GetMaximumStake() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.maximumStake;
}

bool StakingVault::IsPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.paused;
}

Address StakingVault::GetTreasury() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.treasury;
}

Address StakingVault::GetQualityControlCaller() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.qualityControlCaller;
}

size_t StakingVault::GetStakerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

std::string StakingVault::CheckInvariants() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CheckInvariantsLocked();
}

std::string StakingVault::CheckInvariantsLocked(bool checkMultipliers) const {
    Amount staked = 0;
    Amount inCooldown = 0;
    Amount inEarly = 0;

    for (const auto& [user, pos] : positions_) {
        if (!pos.IsConsistent()) {
            return "inconsistent position for " + user.ToString() + ": " + pos.ToString();
        }
        if (pos.IsEmpty()) {
            return "empty position stored for " + user.ToString();
        }
        if (checkMultipliers && pos.effectiveMultiplier !=
            params_.multipliers.Calculate(pos.amount, pos.effectiveLockupPeriod)) {
            return "stale multiplier for " + user.ToString();
        }
        staked += pos.amount;
        inCooldown += pos.cooldownAmount;
        inEarly += pos.earlyUnstakeCooldownAmount;
    }

    if (staked != state_.totalStaked) {
        return "totalStaked " + FormatAmount(state_.totalStaked) + " != sum " +
               FormatAmount(staked);
    }
    if (inCooldown != state_.totalInCooldown) {
        return "totalInCooldown does not match positions";
    }
    if (inEarly != state_.totalInEarlyCooldown) {
        return "totalInEarlyCooldown does not match positions";
    }
    return "";
}

} // namespace vault
} // namespace lockvault
