// LOCKVAULT - Reward Multiplier Table Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/vault/multiplier.h"

#include "lockvault/util/config.h"
#include "lockvault/util/time.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace lockvault {
namespace vault {

namespace {

std::vector<int64_t> DefaultDurations() {
    return {30 * util::SECONDS_PER_DAY, 90 * util::SECONDS_PER_DAY,
            180 * util::SECONDS_PER_DAY, 365 * util::SECONDS_PER_DAY};
}

// Base row plus a flat bonus per amount tier
std::vector<MultiplierTier> DefaultTiers() {
    const std::vector<int> base = {10500, 11000, 11500, 12500};
    const struct { int64_t tokens; int bonus; } steps[] = {
        {0, 0}, {1000, 500}, {2500, 1000}, {5000, 1500}, {7500, 2000}, {10000, 2500},
    };

    std::vector<MultiplierTier> tiers;
    for (const auto& step : steps) {
        MultiplierTier tier;
        tier.threshold = step.tokens * COIN;
        for (int value : base) {
            tier.multipliers.push_back(value + step.bonus);
        }
        tiers.push_back(std::move(tier));
    }
    return tiers;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

MultiplierTable::MultiplierTable()
    : durations_(DefaultDurations()), tiers_(DefaultTiers()) {}

MultiplierTable::MultiplierTable(std::vector<int64_t> durations,
                                 std::vector<MultiplierTier> tiers,
                                 int ceiling)
    : durations_(std::move(durations)), tiers_(std::move(tiers)), ceiling_(ceiling) {
    if (auto err = Validate(durations_, tiers_, ceiling_)) {
        throw std::invalid_argument("invalid multiplier table: " + *err);
    }
}

MultiplierTable MultiplierTable::Default() {
    return MultiplierTable();
}

std::optional<std::string> MultiplierTable::Validate(const std::vector<int64_t>& durations,
                                                     const std::vector<MultiplierTier>& tiers,
                                                     int ceiling) {
    if (durations.empty()) {
        return std::string("no duration breakpoints");
    }
    if (tiers.empty()) {
        return std::string("no amount tiers");
    }
    if (ceiling < BASE_MULTIPLIER) {
        return "ceiling " + std::to_string(ceiling) + " is below 1.0x";
    }

    for (size_t i = 0; i < durations.size(); ++i) {
        if (durations[i] <= 0) {
            return std::string("duration breakpoints must be positive");
        }
        if (i > 0 && durations[i] <= durations[i - 1]) {
            return std::string("duration breakpoints must be strictly increasing");
        }
    }

    for (size_t t = 0; t < tiers.size(); ++t) {
        const auto& row = tiers[t].multipliers;
        if (tiers[t].threshold < 0) {
            return std::string("tier thresholds must not be negative");
        }
        if (t > 0 && tiers[t].threshold <= tiers[t - 1].threshold) {
            return std::string("tier thresholds must be strictly increasing");
        }
        if (row.size() != durations.size()) {
            return "tier " + std::to_string(t) + " has " + std::to_string(row.size()) +
                   " entries, expected " + std::to_string(durations.size());
        }
        for (size_t d = 0; d < row.size(); ++d) {
            if (row[d] < 0) {
                return "tier " + std::to_string(t) + " has a negative multiplier";
            }
            if (d > 0 && row[d] < row[d - 1]) {
                return "tier " + std::to_string(t) + " decreases with duration";
            }
            if (t > 0 && row[d] < tiers[t - 1].multipliers[d]) {
                return "tier " + std::to_string(t) + " is below the previous tier";
            }
        }
    }

    return std::nullopt;
}

// ============================================================================
// Lookup
// ============================================================================

const MultiplierTier& MultiplierTable::SelectTier(Amount amount) const {
    // Highest tier whose threshold <= amount; amounts under the first
    // threshold still use the first row
    auto it = std::upper_bound(tiers_.begin(), tiers_.end(), amount,
        [](Amount value, const MultiplierTier& tier) { return value < tier.threshold; });
    if (it == tiers_.begin()) {
        return tiers_.front();
    }
    return *std::prev(it);
}

int MultiplierTable::Interpolate(const std::vector<int>& row, int64_t lockup) const {
    if (lockup <= durations_.front()) {
        return row.front();
    }
    if (lockup >= durations_.back()) {
        return row.back();
    }

    size_t hi = 1;
    while (durations_[hi] < lockup) {
        ++hi;
    }
    size_t lo = hi - 1;

    int64_t d0 = durations_[lo];
    int64_t d1 = durations_[hi];
    int64_t v0 = row[lo];
    int64_t v1 = row[hi];

    // Rows never decrease and lockup < d1, so the step stays under v1 - v0
    int64_t step = MulDiv(lockup - d0, v1 - v0, d1 - d0);
    return static_cast<int>(v0 + step);
}

int MultiplierTable::Calculate(Amount amount, int64_t lockup) const {
    if (amount <= 0) {
        return 0;
    }
    int value = Interpolate(SelectTier(amount).multipliers, lockup);
    return std::min(value, ceiling_);
}

std::string MultiplierTable::ToString() const {
    std::ostringstream oss;
    oss << "threshold";
    for (int64_t d : durations_) {
        oss << "\t" << util::FormatDuration(util::Seconds{d});
    }
    oss << "\n";
    for (const auto& tier : tiers_) {
        oss << FormatAmount(tier.threshold, 0);
        for (int m : tier.multipliers) {
            oss << "\t" << FormatBps(std::min(m, ceiling_));
        }
        oss << "\n";
    }
    oss << "ceiling " << FormatBps(ceiling_);
    return oss.str();
}

// ============================================================================
// Configuration
// ============================================================================

std::optional<MultiplierTier> ParseTierSpec(const std::string& spec) {
    size_t colon = spec.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    auto threshold = ParseAmount(spec.substr(0, colon));
    if (!threshold) {
        return std::nullopt;
    }

    MultiplierTier tier;
    tier.threshold = *threshold;

    std::istringstream values(spec.substr(colon + 1));
    std::string item;
    while (std::getline(values, item, '/')) {
        if (item.empty() || item.find_first_not_of("0123456789") != std::string::npos ||
            item.size() > 6) {
            return std::nullopt;
        }
        tier.multipliers.push_back(std::stoi(item));
    }

    if (tier.multipliers.empty()) {
        return std::nullopt;
    }
    return tier;
}

util::ConfigParseResult LoadMultiplierTable(const util::ConfigManager& config,
                                            MultiplierTable& table) {
    using util::ConfigParseResult;
    namespace keys = util::ConfigKeys;
    const std::string section = keys::MULTIPLIER_SECTION;

    std::vector<int64_t> durations = table.GetDurations();
    std::vector<MultiplierTier> tiers = table.GetTiers();
    int ceiling = table.GetCeiling();

    auto durationList = config.GetList(keys::DURATIONS, section);
    if (!durationList.empty()) {
        durations.clear();
        for (const auto& item : durationList) {
            auto seconds = util::ParseDuration(item);
            if (!seconds) {
                return ConfigParseResult::Error("multiplier.durations: invalid duration '" +
                                                item + "'");
            }
            durations.push_back(*seconds);
        }
    }

    auto tierList = config.GetList(keys::TIER, section);
    if (!tierList.empty()) {
        tiers.clear();
        for (const auto& item : tierList) {
            auto tier = ParseTierSpec(item);
            if (!tier) {
                return ConfigParseResult::Error("multiplier.tier: cannot parse '" + item + "'");
            }
            tiers.push_back(std::move(*tier));
        }
    }

    if (config.HasKey(keys::CEILING, section)) {
        auto value = config.TryGetInt(keys::CEILING, section);
        if (!value || *value > 1000000) {
            return ConfigParseResult::Error("multiplier.ceiling: not a basis-point value");
        }
        ceiling = static_cast<int>(*value);
    }

    if (auto err = MultiplierTable::Validate(durations, tiers, ceiling)) {
        return ConfigParseResult::Error("multiplier: " + *err);
    }

    table = MultiplierTable(std::move(durations), std::move(tiers), ceiling);
    return ConfigParseResult::Success();
}

} // namespace vault
} // namespace lockvault
