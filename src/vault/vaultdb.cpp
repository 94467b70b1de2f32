// LOCKVAULT - Vault Storage Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/vault/vaultdb.h"

#include "lockvault/util/logging.h"

#include <cstring>
#include <stdexcept>

namespace lockvault {
namespace vault {

VaultDB::VaultDB(const std::filesystem::path& path, const db::Options& options) {
    auto [status, database] = db::OpenDatabase(path, options);
    if (!status.ok()) {
        throw std::runtime_error("Failed to open vault database: " + status.ToString());
    }
    db_ = std::move(database);
}

VaultDB::VaultDB(std::unique_ptr<db::Database> database) : db_(std::move(database)) {
    if (!db_) {
        throw std::invalid_argument("VaultDB: null database");
    }
}

VaultDB::~VaultDB() = default;

std::optional<Position> VaultDB::ReadPosition(const Address& user) const {
    std::string value;
    db::Status s = db_->Get(db::MakeKey(db::prefix::POSITION, user), &value);
    if (!s.ok()) {
        if (!s.IsNotFound()) {
            LOG_ERROR(util::LogCategory::DB) << "Position read for " << user.ToString()
                                             << " failed: " << s.ToString();
        }
        return std::nullopt;
    }

    Position pos;
    if (!db::DeserializeFromString(value, pos)) {
        LOG_ERROR(util::LogCategory::DB) << "Corrupt position record for " << user.ToString();
        return std::nullopt;
    }
    return pos;
}

std::optional<VaultState> VaultDB::ReadState() const {
    std::string value;
    db::Status s = db_->Get(db::MakeKey(db::prefix::VAULT_STATE), &value);
    if (s.IsNotFound()) {
        return std::nullopt;
    }
    if (!s.ok()) {
        throw std::runtime_error("Vault state read failed: " + s.ToString());
    }

    VaultState state;
    if (!db::DeserializeFromString(value, state)) {
        throw std::runtime_error("Corrupt vault state record");
    }
    return state;
}

bool VaultDB::ForEachPosition(
    const std::function<bool(const Address&, const Position&)>& func) const {
    const std::string start = db::MakeKey(db::prefix::POSITION);
    auto it = db_->NewIterator();

    for (it->Seek(start); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        if (!key.starts_with(start)) {
            break;
        }

        if (key.size() != 1 + Address::SIZE) {
            LOG_WARN(util::LogCategory::DB) << "Skipping malformed position key";
            continue;
        }

        Address user;
        std::memcpy(user.data(), key.data() + 1, Address::SIZE);

        Position pos;
        if (!db::DeserializeFromString(it->value().ToString(), pos)) {
            throw std::runtime_error("Corrupt position record for " + user.ToString());
        }

        if (!func(user, pos)) {
            return false;
        }
    }

    db::Status s = it->status();
    if (!s.ok()) {
        throw std::runtime_error("Position scan failed: " + s.ToString());
    }
    return true;
}

std::map<Address, Position> VaultDB::LoadAllPositions() const {
    std::map<Address, Position> positions;
    ForEachPosition([&positions](const Address& user, const Position& pos) {
        positions.emplace(user, pos);
        return true;
    });
    return positions;
}

db::Status VaultDB::WriteBatch(const std::vector<std::pair<Address, Position>>& positions,
                               const VaultState& state) {
    db::WriteBatch batch;
    for (const auto& [user, pos] : positions) {
        std::string key = db::MakeKey(db::prefix::POSITION, user);
        if (pos.IsEmpty()) {
            batch.Delete(key);
        } else {
            batch.Put(key, db::SerializeToString(pos));
        }
    }
    batch.Put(db::MakeKey(db::prefix::VAULT_STATE), db::SerializeToString(state));

    db::Status s = db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Vault batch write failed: " << s.ToString();
    }
    return s;
}

} // namespace vault
} // namespace lockvault
