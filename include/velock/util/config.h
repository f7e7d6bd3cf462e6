// VELOCK - Configuration File Parser
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// INI-style configuration for the ledger engine and its tools.
//
// File format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally under a [section] header
// - Values can be quoted: key="value with spaces"
// - A trailing backslash continues the line
// - A bare key is a boolean flag; "nokey" sets it to false
// - ${VAR} expands to the environment variable VAR
//
// Command line options (--key=value, --key value, --section.key=value)
// override anything read from files.

#ifndef VELOCK_UTIL_CONFIG_H
#define VELOCK_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace velock {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_CONFIG_FILENAME = "velock.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<command-line>" or "<default>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message" (omitting what is unknown)
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file. Later definitions of a key win.
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text; sourceName is used in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Parse command-line options. Non-option arguments are collected
    /// and available through GetPositionalArgs().
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Whole-string decimal integer; nullopt when missing or malformed
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    /// true/false, yes/no, on/off, 1/0
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// String value with ~ and ${VAR} expanded
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    /// Full entry (value plus where it came from)
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Only takes effect while no file or command line defines the key
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Introspection
    // ========================================================================

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;
    size_t Size() const { return entries_.size(); }
    void Clear();

    /// One "section.key=value" line per entry
    std::string Dump() const;

    // ========================================================================
    // Helpers
    // ========================================================================

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);
    static std::optional<bool> ParseBool(const std::string& str);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    void Store(ConfigEntry entry);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Global
    constexpr const char* CONF = "conf";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* DEBUG = "debug";
    constexpr const char* SCRIPT = "script";

    // [ledger]
    constexpr const char* LEDGER_SECTION = "ledger";
    constexpr const char* EPOCH_WIDTH = "epoch_width";
    constexpr const char* ORIGIN_TIME = "origin_time";
    constexpr const char* MIN_LOCK_EPOCHS = "min_lock_epochs";
    constexpr const char* MAX_LOCK_EPOCHS = "max_lock_epochs";

    // [governance]
    constexpr const char* GOVERNANCE_SECTION = "governance";
    constexpr const char* VOTE_WINDOW = "vote_window";
    constexpr const char* MIN_PROPOSE_POWER_DIVISOR = "min_propose_power_divisor";
    constexpr const char* VOTE_TIMING = "vote_timing";
}

} // namespace util
} // namespace velock

#endif // VELOCK_UTIL_CONFIG_H
