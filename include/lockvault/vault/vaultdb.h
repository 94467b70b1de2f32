// LOCKVAULT - Vault Storage
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Persists positions (prefix 'p', keyed by address) and the global vault
// state (prefix 'g'). Each vault mutation is written as one batch.

#ifndef LOCKVAULT_VAULT_VAULTDB_H
#define LOCKVAULT_VAULT_VAULTDB_H

#include "lockvault/core/types.h"
#include "lockvault/db/database.h"
#include "lockvault/vault/position.h"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace lockvault {
namespace vault {

/**
 * Key-value storage for vault records.
 */
class VaultDB {
public:
    /// Open (or create) the store at path; throws std::runtime_error on failure
    explicit VaultDB(const std::filesystem::path& path,
                     const db::Options& options = db::Options());

    /// Wrap an already-open database (tests, custom backends)
    explicit VaultDB(std::unique_ptr<db::Database> database);

    ~VaultDB();

    VaultDB(const VaultDB&) = delete;
    VaultDB& operator=(const VaultDB&) = delete;

    // === Reads ===

    std::optional<Position> ReadPosition(const Address& user) const;

    /// nullopt when the store has never been initialised
    std::optional<VaultState> ReadState() const;

    /// Visit every stored position; stop early when func returns false
    bool ForEachPosition(const std::function<bool(const Address&, const Position&)>& func) const;

    std::map<Address, Position> LoadAllPositions() const;

    // === Writes ===

    /**
     * Write the given positions and state atomically. Empty positions are
     * deleted instead of stored.
     */
    db::Status WriteBatch(const std::vector<std::pair<Address, Position>>& positions,
                          const VaultState& state);

    db::Database& GetDatabase() { return *db_; }

private:
    std::unique_ptr<db::Database> db_;
};

} // namespace vault
} // namespace lockvault

#endif // LOCKVAULT_VAULT_VAULTDB_H
