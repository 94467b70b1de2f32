// LOCKVAULT - Token Ledger Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/token/ledger.h"

#include "lockvault/util/logging.h"

#include <stdexcept>

namespace lockvault {
namespace token {

namespace {

bool ValidMove(const Address& from, const Address& to, Amount amount) {
    return !from.IsNull() && !to.IsNull() && amount > 0 && MoneyRange(amount);
}

const std::string kSupplyKey = "s";

} // namespace

// ============================================================================
// MemoryTokenLedger
// ============================================================================

Amount MemoryTokenLedger::BalanceOf(const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(owner);
    return it == balances_.end() ? 0 : it->second;
}

Amount MemoryTokenLedger::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

bool MemoryTokenLedger::MoveLocked(const Address& from, const Address& to, Amount amount) {
    if (!ValidMove(from, to, amount)) {
        return false;
    }
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    balances_[to] += amount;
    return true;
}

bool MemoryTokenLedger::Transfer(const Address& from, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return MoveLocked(from, to, amount);
}

bool MemoryTokenLedger::TransferFrom(const Address& spender, const Address& from,
                                     const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({from, spender});
    if (it == allowances_.end() || it->second < amount) {
        return false;
    }
    if (!MoveLocked(from, to, amount)) {
        return false;
    }
    it->second -= amount;
    return true;
}

bool MemoryTokenLedger::Approve(const Address& owner, const Address& spender, Amount amount) {
    if (owner.IsNull() || spender.IsNull() || amount < 0 || !MoneyRange(amount)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    allowances_[{owner, spender}] = amount;
    return true;
}

bool MemoryTokenLedger::Mint(const Address& to, Amount amount) {
    if (to.IsNull() || amount <= 0 || !MoneyRange(amount)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!MoneyRange(totalSupply_ + amount)) {
        return false;
    }
    balances_[to] += amount;
    totalSupply_ += amount;
    return true;
}

Amount MemoryTokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

// ============================================================================
// DatabaseTokenLedger
// ============================================================================

DatabaseTokenLedger::DatabaseTokenLedger(const std::filesystem::path& path) {
    auto [status, database] = db::OpenDatabase(path);
    if (!status.ok()) {
        throw std::runtime_error("Failed to open ledger database: " + status.ToString());
    }
    db_ = std::move(database);
}

DatabaseTokenLedger::DatabaseTokenLedger(std::unique_ptr<db::Database> database)
    : db_(std::move(database)) {
    if (!db_) {
        throw std::invalid_argument("DatabaseTokenLedger: null database");
    }
}

bool DatabaseTokenLedger::ReadAmount(const std::string& key, Amount& amount) const {
    std::string value;
    db::Status s = db_->Get(key, &value);
    if (s.IsNotFound()) {
        amount = 0;
        return true;
    }
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Ledger read failed: " << s.ToString();
        return false;
    }
    int64_t stored = 0;
    if (!db::DeserializeFromString(value, stored) || !MoneyRange(stored)) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Corrupt ledger record";
        return false;
    }
    amount = stored;
    return true;
}

Amount DatabaseTokenLedger::ReadOrZero(const std::string& key) const {
    Amount amount = 0;
    return ReadAmount(key, amount) ? amount : 0;
}

Amount DatabaseTokenLedger::BalanceOf(const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReadOrZero(db::MakeKey(db::prefix::BALANCE, owner));
}

Amount DatabaseTokenLedger::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReadOrZero(db::MakeKey(db::prefix::ALLOWANCE, owner, spender));
}

Amount DatabaseTokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReadOrZero(kSupplyKey);
}

bool DatabaseTokenLedger::StageMove(db::WriteBatch& batch, const Address& from,
                                    const Address& to, Amount amount) const {
    std::string fromKey = db::MakeKey(db::prefix::BALANCE, from);
    std::string toKey = db::MakeKey(db::prefix::BALANCE, to);

    Amount fromBalance = 0;
    if (!ReadAmount(fromKey, fromBalance) || fromBalance < amount) {
        return false;
    }
    fromBalance -= amount;

    Amount toBalance = fromBalance;
    if (from != to && !ReadAmount(toKey, toBalance)) {
        return false;
    }
    if (!MoneyRange(toBalance + amount)) {
        return false;
    }
    toBalance += amount;

    batch.Put(fromKey, db::SerializeToString(static_cast<int64_t>(fromBalance)));
    batch.Put(toKey, db::SerializeToString(static_cast<int64_t>(toBalance)));
    return true;
}

bool DatabaseTokenLedger::Commit(db::WriteBatch& batch, const char* what) {
    db::Status s = db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << what << " not persisted: " << s.ToString();
        return false;
    }
    return true;
}

bool DatabaseTokenLedger::Transfer(const Address& from, const Address& to, Amount amount) {
    if (!ValidMove(from, to, amount)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    db::WriteBatch batch;
    if (!StageMove(batch, from, to, amount)) {
        return false;
    }
    return Commit(batch, "transfer");
}

bool DatabaseTokenLedger::TransferFrom(const Address& spender, const Address& from,
                                       const Address& to, Amount amount) {
    if (!ValidMove(from, to, amount)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string allowanceKey = db::MakeKey(db::prefix::ALLOWANCE, from, spender);
    Amount allowance = 0;
    if (!ReadAmount(allowanceKey, allowance) || allowance < amount) {
        return false;
    }
    db::WriteBatch batch;
    if (!StageMove(batch, from, to, amount)) {
        return false;
    }
    batch.Put(allowanceKey, db::SerializeToString(static_cast<int64_t>(allowance - amount)));
    return Commit(batch, "transferFrom");
}

bool DatabaseTokenLedger::Approve(const Address& owner, const Address& spender, Amount amount) {
    if (owner.IsNull() || spender.IsNull() || amount < 0 || !MoneyRange(amount)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    db::WriteBatch batch;
    batch.Put(db::MakeKey(db::prefix::ALLOWANCE, owner, spender),
              db::SerializeToString(static_cast<int64_t>(amount)));
    return Commit(batch, "approve");
}

bool DatabaseTokenLedger::Mint(const Address& to, Amount amount) {
    if (to.IsNull() || amount <= 0 || !MoneyRange(amount)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = db::MakeKey(db::prefix::BALANCE, to);
    Amount supply = 0;
    Amount balance = 0;
    if (!ReadAmount(kSupplyKey, supply) || !ReadAmount(key, balance)) {
        return false;
    }
    if (!MoneyRange(supply + amount)) {
        return false;
    }
    db::WriteBatch batch;
    batch.Put(key, db::SerializeToString(static_cast<int64_t>(balance + amount)));
    batch.Put(kSupplyKey, db::SerializeToString(static_cast<int64_t>(supply + amount)));
    return Commit(batch, "mint");
}

} // namespace token
} // namespace lockvault
