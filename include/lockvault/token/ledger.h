// LOCKVAULT - Token Ledger
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Fungible balance ledger the vault takes custody through. The vault only
// needs transfer, allowance-based transferFrom and balance queries.

#ifndef LOCKVAULT_TOKEN_LEDGER_H
#define LOCKVAULT_TOKEN_LEDGER_H

#include "lockvault/core/types.h"
#include "lockvault/db/database.h"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace lockvault {
namespace token {

// ============================================================================
// Token Ledger Interface
// ============================================================================

/**
 * Balance ledger. All mutating calls return false, with no change, when
 * the movement cannot be made (insufficient balance or allowance, zero
 * address, non-positive amount, storage failure).
 */
class TokenLedger {
public:
    virtual ~TokenLedger() = default;

    virtual Amount BalanceOf(const Address& owner) const = 0;

    virtual Amount Allowance(const Address& owner, const Address& spender) const = 0;

    /// Move amount from `from` to `to`
    virtual bool Transfer(const Address& from, const Address& to, Amount amount) = 0;

    /// Move amount from `from` to `to` against the allowance granted to spender
    virtual bool TransferFrom(const Address& spender, const Address& from,
                              const Address& to, Amount amount) = 0;

    /// Set (not add to) spender's allowance over owner's balance
    virtual bool Approve(const Address& owner, const Address& spender, Amount amount) = 0;

    /// Create new balance (test and tooling setup)
    virtual bool Mint(const Address& to, Amount amount) = 0;

    virtual Amount TotalSupply() const = 0;
};

// ============================================================================
// In-Memory Ledger
// ============================================================================

class MemoryTokenLedger : public TokenLedger {
public:
    MemoryTokenLedger() = default;

    Amount BalanceOf(const Address& owner) const override;
    Amount Allowance(const Address& owner, const Address& spender) const override;
    bool Transfer(const Address& from, const Address& to, Amount amount) override;
    bool TransferFrom(const Address& spender, const Address& from,
                      const Address& to, Amount amount) override;
    bool Approve(const Address& owner, const Address& spender, Amount amount) override;
    bool Mint(const Address& to, Amount amount) override;
    Amount TotalSupply() const override;

private:
    bool MoveLocked(const Address& from, const Address& to, Amount amount);

    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    Amount totalSupply_{0};
    mutable std::mutex mutex_;
};

// ============================================================================
// Database-Backed Ledger
// ============================================================================

/**
 * Ledger persisted in a key-value store (prefix 'b' balances, 'a'
 * allowances). Every call is a single atomic batch. A record that cannot
 * be read fails the call; queries report 0 for it.
 */
class DatabaseTokenLedger : public TokenLedger {
public:
    /// Throws std::runtime_error if the store cannot be opened
    explicit DatabaseTokenLedger(const std::filesystem::path& path);
    explicit DatabaseTokenLedger(std::unique_ptr<db::Database> database);

    Amount BalanceOf(const Address& owner) const override;
    Amount Allowance(const Address& owner, const Address& spender) const override;
    bool Transfer(const Address& from, const Address& to, Amount amount) override;
    bool TransferFrom(const Address& spender, const Address& from,
                      const Address& to, Amount amount) override;
    bool Approve(const Address& owner, const Address& spender, Amount amount) override;
    bool Mint(const Address& to, Amount amount) override;
    Amount TotalSupply() const override;

private:
    bool ReadAmount(const std::string& key, Amount& amount) const;
    Amount ReadOrZero(const std::string& key) const;
    bool StageMove(db::WriteBatch& batch, const Address& from, const Address& to,
                   Amount amount) const;
    bool Commit(db::WriteBatch& batch, const char* what);

    std::unique_ptr<db::Database> db_;
    mutable std::mutex mutex_;
};

} // namespace token
} // namespace lockvault

#endif // LOCKVAULT_TOKEN_LEDGER_H
