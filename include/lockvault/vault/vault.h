// LOCKVAULT - Staking Vault
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Users lock tokens for a chosen duration to earn an amount- and
// duration-dependent reward multiplier. Positions can be topped up or
// extended, and exited either after maturity (normal cooldown) or early
// (penalty plus a longer cooldown). A quality-control caller can claw back
// stake to the treasury.
//
// Every mutating call is all-or-nothing: token movements, the persisted
// batch and the in-memory state either all change or none do.

#ifndef LOCKVAULT_VAULT_VAULT_H
#define LOCKVAULT_VAULT_VAULT_H

#include "lockvault/core/types.h"
#include "lockvault/vault/params.h"
#include "lockvault/vault/position.h"
#include "lockvault/vault/vaultdb.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lockvault {

namespace token {
class TokenLedger;
}

namespace vault {

// ============================================================================
// Errors
// ============================================================================

enum class VaultError {
    OK = 0,

    // Input validation
    ZERO_ADDRESS,
    ZERO_AMOUNT,
    AMOUNT_BELOW_MINIMUM,
    AMOUNT_ABOVE_MAXIMUM,
    INVALID_LOCKUP_PERIOD,
    LOCKUP_INCREASE_TOO_SMALL,
    LOCKUP_INCREASE_TOO_LARGE,

    // State preconditions
    NO_STAKE_FOUND,
    STAKE_ALREADY_EXISTS,
    COOLDOWN_IN_PROGRESS,
    EARLY_COOLDOWN_IN_PROGRESS,
    NO_COOLDOWN,
    NO_EARLY_COOLDOWN,
    AMOUNT_EXCEEDS_AVAILABLE,
    AMOUNT_EXCEEDS_COOLDOWN,
    AMOUNT_EXCEEDS_EARLY_COOLDOWN,
    LOCKUP_COMPLETED,
    INSUFFICIENT_EXCESS,
    PAUSED,
    NOT_PAUSED,

    // Timing
    STAKE_STILL_LOCKED,
    COOLDOWN_NOT_COMPLETE,
    EARLY_COOLDOWN_NOT_COMPLETE,

    // Authorization
    UNAUTHORIZED,

    // Arithmetic
    ARITHMETIC_OVERFLOW,
    INVALID_COMBINATION,

    // Collaborators
    TRANSFER_FAILED,
    STORAGE_ERROR,
};

const char* VaultErrorToString(VaultError error);

// ============================================================================
// Events
// ============================================================================

enum class VaultEventType {
    Staked,                 // amount, lockup, multiplier
    AmountIncreased,        // amount = delta, secondaryAmount = new total
    LockupIncreased,        // amount = principal, secondaryAmount = extension (s), lockup = new lockup
    UnstakeInitiated,       // amount requested
    Unstaked,               // amount released
    EarlyUnstakeInitiated,  // amount requested
    EarlyUnstaked,          // amount = paid to user, secondaryAmount = penalty
    QAPenalty,              // amount = applied, secondaryAmount = requested
    Paused,
    Unpaused,
    TreasuryUpdated,        // user = new treasury
    QACallerUpdated,        // user = new quality-control caller
    MaximumStakeUpdated,    // amount = new maximum
    EmergencyWithdraw,      // user = recipient, amount
};

const char* VaultEventTypeToString(VaultEventType type);

struct VaultEvent {
    VaultEventType type{VaultEventType::Staked};
    Address user;
    Amount amount{0};
    Amount secondaryAmount{0};
    int64_t lockup{0};
    int multiplier{0};
    Timestamp timestamp{0};

    std::string ToString() const;
};

// ============================================================================
// Roles
// ============================================================================

struct VaultRoles {
    Address admin;
    Address treasury;
    Address qualityControlCaller;
};

// ============================================================================
// Query Results
// ============================================================================

/// Everything a reward distributor reads about one user
struct UserStakingSummary {
    Amount userTotalStaked{0};
    Amount totalUnlocked{0};
    Amount totalLocked{0};
    Amount totalInCooldown{0};
    Amount totalInEarlyCooldown{0};
    Amount totalReadyForUnstake{0};
    Amount totalReadyForEarlyUnstake{0};
    int effectiveMultiplier{0};
    int64_t effectiveLockupPeriod{0};
    int64_t timeUntilUnlock{0};
    int64_t timeUntilCooldownComplete{0};
    int64_t timeUntilEarlyCooldownComplete{0};
    bool hasActiveStake{false};
};

/// Outcome of the penalty hook: error is OK even when applied < requested
struct PenaltyResult {
    VaultError error{VaultError::OK};
    Amount applied{0};
};

// ============================================================================
// Staking Vault
// ============================================================================

class StakingVault {
public:
    using EventCallback = std::function<void(const VaultEvent&)>;

    /**
     * Create the vault over a token ledger and a store.
     *
     * Persisted state is loaded when present; otherwise the initial state
     * is written. Throws std::invalid_argument for invalid params, roles or
     * addresses, and std::runtime_error when the store cannot be read or
     * written.
     *
     * @param vaultAddress Custody account on the ledger
     */
    StakingVault(VaultParams params, const VaultRoles& roles,
                 token::TokenLedger& ledger, const Address& vaultAddress,
                 std::unique_ptr<VaultDB> db);

    ~StakingVault();

    StakingVault(const StakingVault&) = delete;
    StakingVault& operator=(const StakingVault&) = delete;

    // === Stake / Increase ===

    /// Open a position; pulls amount from user via the vault's allowance
    VaultError Stake(const Address& user, Amount amount, int64_t lockup);

    VaultError IncreaseAmount(const Address& user, Amount delta);

    VaultError IncreaseLockup(const Address& user, int64_t extension);

    /// Extension first, then amount, as one operation
    VaultError IncreaseStake(const Address& user, Amount delta, int64_t extension);

    // === Unstake Lifecycle ===

    VaultError InitiateUnstake(const Address& user, Amount amount);
    VaultError Unstake(const Address& user, Amount amount);

    VaultError InitiateEarlyUnstake(const Address& user, Amount amount);
    VaultError EarlyUnstake(const Address& user, Amount amount);

    // === Penalty Hook ===

    /**
     * Deduct up to requested from user's stake and send it to the treasury.
     * Only the quality-control caller may call this. Never fails for
     * insufficiency: check applied against requested.
     */
    PenaltyResult ProcessQAPenalty(const Address& caller, const Address& user,
                                   Amount requested);

    // === Administration ===

    VaultError Pause(const Address& caller);
    VaultError Unpause(const Address& caller);
    VaultError SetTreasury(const Address& caller, const Address& treasury);
    VaultError SetQualityControlCaller(const Address& caller, const Address& qaCaller);
    VaultError SetMaximumStake(const Address& caller, Amount maximum);

    /// Withdraw custody in excess of everything owed to stakers
    VaultError EmergencyWithdraw(const Address& caller, const Address& to, Amount amount);

    // === Per-User Queries ===

    Position GetPosition(const Address& user) const;
    Amount GetTotalStaked(const Address& user) const;
    Amount GetTotalUnlocked(const Address& user) const;
    Amount GetTotalLocked(const Address& user) const;
    Amount GetTotalInCooldown(const Address& user) const;
    Amount GetTotalInEarlyCooldown(const Address& user) const;
    Amount GetTotalReadyForUnstake(const Address& user) const;
    Amount GetTotalReadyForEarlyUnstake(const Address& user) const;
    int GetUserMultiplier(const Address& user) const;
    int64_t GetUserLockupPeriod(const Address& user) const;
    int64_t GetTimeUntilUnlock(const Address& user) const;
    int64_t GetTimeUntilCooldownComplete(const Address& user) const;
    int64_t GetTimeUntilEarlyCooldownComplete(const Address& user) const;
    bool HasActiveStake(const Address& user) const;
    UserStakingSummary GetUserSummary(const Address& user) const;

    // === System Queries ===

    Amount GetTotalStaked() const;
    Amount GetTotalInCooldown() const;
    Amount GetTotalInEarlyCooldown() const;
    Amount GetMaximumStake() const;
    bool IsPaused() const;
    Address GetTreasury() const;
    Address GetQualityControlCaller() const;
    const Address& GetAdmin() const { return admin_; }
    const Address& GetVaultAddress() const { return vaultAddress_; }
    const VaultParams& GetParams() const { return params_; }
    size_t GetStakerCount() const;

    int CalculateMultiplier(Amount amount, int64_t lockup) const {
        return params_.multipliers.Calculate(amount, lockup);
    }

    /**
     * Recheck the ledger invariants: per-position consistency, cached
     * multipliers, and totals equal to the sums over positions.
     * Returns a description of the first violation, or empty.
     */
    std::string CheckInvariants() const;

    void SetEventCallback(EventCallback callback);

private:
    struct TokenMove {
        enum class Kind { Pull, Push };
        Kind kind;
        Address account;    // Source of a pull, recipient of a push
        Amount amount;
    };

    /// Working copy of everything an operation changes
    struct Mutation {
        std::map<Address, Position> positions;
        VaultState state;
        std::vector<TokenMove> moves;
        std::vector<VaultEvent> events;
    };

    using Body = std::function<VaultError(Timestamp, Mutation&)>;

    /// Lock, run body against a fresh Mutation, commit, then log and emit
    VaultError Run(const char* op, const Address& who, const Body& body);

    VaultError CommitLocked(Mutation& m);
    bool ExecuteMove(const TokenMove& move);
    bool ReverseMove(const TokenMove& move);
    void RollbackMoves(const std::vector<TokenMove>& done);

    Position& Working(Mutation& m, const Address& user) const;
    Position PositionLocked(const Address& user) const;
    void Reprice(Position& pos) const;
    VaultError CheckCanPull(const Address& user, Amount amount) const;

    VaultError ApplyAmountIncrease(Mutation& m, const Address& user, Amount delta, Timestamp now);
    VaultError ApplyLockupIncrease(Mutation& m, const Address& user, int64_t extension,
                                   Timestamp now);

    UserStakingSummary SummaryLocked(const Address& user, Timestamp now) const;
    std::string CheckInvariantsLocked(bool checkMultipliers = true) const;
    void RefreshMultipliersLocked();

    static VaultEvent MakeEvent(VaultEventType type, const Address& user, Timestamp now);
    static void LogEvent(const VaultEvent& event);

    const VaultParams params_;
    const Address admin_;
    const Address vaultAddress_;
    token::TokenLedger& ledger_;
    std::unique_ptr<VaultDB> db_;

    VaultState state_;
    std::map<Address, Position> positions_;

    EventCallback eventCallback_;

    mutable std::mutex mutex_;
};

} // namespace vault
} // namespace lockvault

#endif // LOCKVAULT_VAULT_VAULT_H
