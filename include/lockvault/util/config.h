// LOCKVAULT - Configuration File Parser
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Parses INI-style configuration files for vault parameters and roles.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - Repeated keys accumulate into a list (see GetList)
// - "include <path>" pulls in another file

#ifndef LOCKVAULT_UTIL_CONFIG_H
#define LOCKVAULT_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lockvault {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".lockvault";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "lockvault.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth (to prevent infinite recursion)
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

/**
 * Outcome of parsing or interpreting configuration.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }

    /// "file:line: message" style description
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration read from files and programmatic overrides.
 *
 * Values set with Set() replace anything parsed; SetDefault() only fills
 * keys that are still absent.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and ${VAR} are expanded)
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @return Parse result
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse <dataDir>/lockvault.conf if it exists.
     * A missing file is not an error.
     */
    ConfigParseResult LoadDataDirConfig(const std::string& dataDir);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Strict decimal integer (nullopt if missing or malformed)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Duration with s/m/h/d/w suffixes, in seconds
    std::optional<int64_t> TryGetDuration(const std::string& key,
                                          const std::string& section = "") const;

    /// Token amount ("1000", "0.5"), in base units
    std::optional<int64_t> TryGetAmount(const std::string& key,
                                        const std::string& section = "") const;

    /// Get list of values (comma-separated and/or repeated entries, in file order)
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Get path value (with ~ expansion)
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically, replacing any parsed value or list
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (lower priority than config files)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections and Validation
    // ========================================================================

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Register an allowed key (for validation)
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Return a warning for every key that was never allowed
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const;

    static std::string GetDefaultDataDir();
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& sourceName);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;  // Repeated entries after the first

    std::set<std::string> allowedKeys_;

    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    // [vault]
    constexpr const char* VAULT_SECTION = "vault";
    constexpr const char* MINSTAKE = "minstake";
    constexpr const char* MAXSTAKE = "maxstake";
    constexpr const char* COOLDOWN = "cooldown";
    constexpr const char* EARLYCOOLDOWN = "earlycooldown";
    constexpr const char* PENALTYBPS = "penaltybps";
    constexpr const char* MINLOCKUPINCREASE = "minlockupincrease";
    constexpr const char* MAXLOCKUP = "maxlockup";
    constexpr const char* LOCKUPS = "lockups";

    // [multiplier]
    constexpr const char* MULTIPLIER_SECTION = "multiplier";
    constexpr const char* DURATIONS = "durations";
    constexpr const char* TIER = "tier";
    constexpr const char* CEILING = "ceiling";

    // [roles]
    constexpr const char* ROLES_SECTION = "roles";
    constexpr const char* ADMIN = "admin";
    constexpr const char* TREASURY = "treasury";
    constexpr const char* QACALLER = "qacaller";
    constexpr const char* VAULTADDRESS = "vault";
}

} // namespace util
} // namespace lockvault

#endif // LOCKVAULT_UTIL_CONFIG_H
