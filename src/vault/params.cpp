// LOCKVAULT - Vault Parameters Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/vault/params.h"

#include "lockvault/util/config.h"
#include "lockvault/util/time.h"

#include <algorithm>

namespace lockvault {
namespace vault {

bool VaultParams::IsValidLockup(int64_t lockup) const {
    return std::find(lockupPeriods.begin(), lockupPeriods.end(), lockup) != lockupPeriods.end();
}

std::optional<std::string> VaultParams::Validate() const {
    if (minimumStake <= 0 || !MoneyRange(minimumStake)) {
        return std::string("minimum stake must be positive");
    }
    if (maximumStake < minimumStake || !MoneyRange(maximumStake)) {
        return std::string("maximum stake must be at least the minimum stake");
    }
    if (cooldownPeriod < 0 || earlyUnstakeCooldownPeriod < 0) {
        return std::string("cooldown periods must not be negative");
    }
    if (earlyUnstakePenaltyBps < 0 || earlyUnstakePenaltyBps > BPS_DENOMINATOR) {
        return std::string("early unstake penalty must be within 0..10000 bps");
    }
    if (minimumLockupIncrease <= 0) {
        return std::string("minimum lockup increase must be positive");
    }
    if (maximumLockup < minimumLockupIncrease) {
        return std::string("maximum lockup must be at least the minimum lockup increase");
    }
    if (lockupPeriods.empty()) {
        return std::string("no lockup periods");
    }
    for (int64_t lockup : lockupPeriods) {
        if (lockup <= 0) {
            return std::string("lockup periods must be positive");
        }
    }
    return MultiplierTable::Validate(multipliers.GetDurations(), multipliers.GetTiers(),
                                     multipliers.GetCeiling());
}

// ============================================================================
// Configuration
// ============================================================================

namespace {

util::ConfigParseResult ReadDuration(const util::ConfigManager& config, const char* key,
                                     int64_t& out) {
    const std::string section = util::ConfigKeys::VAULT_SECTION;
    if (!config.HasKey(key, section)) {
        return util::ConfigParseResult::Success();
    }
    auto value = config.TryGetDuration(key, section);
    if (!value) {
        return util::ConfigParseResult::Error(
            section + "." + key + ": invalid duration '" +
            config.GetString(key, "", section) + "'");
    }
    out = *value;
    return util::ConfigParseResult::Success();
}

util::ConfigParseResult ReadAmount(const util::ConfigManager& config, const char* key,
                                   Amount& out) {
    const std::string section = util::ConfigKeys::VAULT_SECTION;
    if (!config.HasKey(key, section)) {
        return util::ConfigParseResult::Success();
    }
    auto value = config.TryGetAmount(key, section);
    if (!value) {
        return util::ConfigParseResult::Error(
            section + "." + key + ": invalid amount '" +
            config.GetString(key, "", section) + "'");
    }
    out = *value;
    return util::ConfigParseResult::Success();
}

} // namespace

util::ConfigParseResult LoadVaultParams(const util::ConfigManager& config,
                                        VaultParams& params) {
    namespace keys = util::ConfigKeys;
    const std::string section = keys::VAULT_SECTION;

    VaultParams loaded = params;
    util::ConfigParseResult result = util::ConfigParseResult::Success();

    if (!(result = ReadAmount(config, keys::MINSTAKE, loaded.minimumStake)).success) return result;
    if (!(result = ReadAmount(config, keys::MAXSTAKE, loaded.maximumStake)).success) return result;
    if (!(result = ReadDuration(config, keys::COOLDOWN, loaded.cooldownPeriod)).success) return result;
    if (!(result = ReadDuration(config, keys::EARLYCOOLDOWN,
                                loaded.earlyUnstakeCooldownPeriod)).success) return result;
    if (!(result = ReadDuration(config, keys::MINLOCKUPINCREASE,
                                loaded.minimumLockupIncrease)).success) return result;
    if (!(result = ReadDuration(config, keys::MAXLOCKUP, loaded.maximumLockup)).success) return result;

    if (config.HasKey(keys::PENALTYBPS, section)) {
        auto bps = config.TryGetInt(keys::PENALTYBPS, section);
        if (!bps || *bps < 0 || *bps > BPS_DENOMINATOR) {
            return util::ConfigParseResult::Error(
                "vault.penaltybps: expected basis points in 0..10000");
        }
        loaded.earlyUnstakePenaltyBps = static_cast<int>(*bps);
    }

    auto lockups = config.GetList(keys::LOCKUPS, section);
    if (!lockups.empty()) {
        loaded.lockupPeriods.clear();
        for (const auto& item : lockups) {
            auto seconds = util::ParseDuration(item);
            if (!seconds) {
                return util::ConfigParseResult::Error("vault.lockups: invalid duration '" +
                                                      item + "'");
            }
            loaded.lockupPeriods.push_back(*seconds);
        }
    }

    result = LoadMultiplierTable(config, loaded.multipliers);
    if (!result.success) {
        return result;
    }

    if (auto err = loaded.Validate()) {
        return util::ConfigParseResult::Error("vault: " + *err);
    }

    params = std::move(loaded);
    return util::ConfigParseResult::Success();
}

void AllowVaultConfigKeys(util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;

    for (const char* key : {keys::MINSTAKE, keys::MAXSTAKE, keys::COOLDOWN,
                            keys::EARLYCOOLDOWN, keys::PENALTYBPS,
                            keys::MINLOCKUPINCREASE, keys::MAXLOCKUP, keys::LOCKUPS}) {
        config.AllowKey(key, keys::VAULT_SECTION);
    }
    for (const char* key : {keys::DURATIONS, keys::TIER, keys::CEILING}) {
        config.AllowKey(key, keys::MULTIPLIER_SECTION);
    }
    for (const char* key : {keys::ADMIN, keys::TREASURY, keys::QACALLER, keys::VAULTADDRESS}) {
        config.AllowKey(key, keys::ROLES_SECTION);
    }
    for (const char* key : {keys::DATADIR, keys::DEBUG, keys::LOGLEVEL, keys::LOGFILE,
                            keys::PRINTTOCONSOLE}) {
        config.AllowKey(key);
    }
}

} // namespace vault
} // namespace lockvault
