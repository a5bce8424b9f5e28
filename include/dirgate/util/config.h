// DIRGATE - Configuration File Parser
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Parses INI-style configuration for the dirgate daemon.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME} and $VAR_NAME
//
// Command-line arguments (-key=value, -key value, -nokey) take priority
// over anything read from a file.

#ifndef DIRGATE_UTIL_CONFIG_H
#define DIRGATE_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dirgate {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name, looked up in the working directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "dirgate.conf";

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
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and the command line.
 *
 * Priority (highest first):
 * 1. Command-line arguments
 * 2. Config file
 * 3. Defaults registered with SetDefault
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
     * @param filePath Path to the config file (~ and $VAR are expanded)
     * @param overwrite If true, file values replace command-line values
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /// Parse configuration text; sourceName is used in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments. Non-option arguments are returned in
     * the result's warnings so the caller can reject them.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer with optional k/m/g/t suffix (binary multiples)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key,
                     uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Values from a comma-separated entry and from repeated keys
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// String value with ~ and environment variables expanded
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set only if no value is present
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Validation
    // ========================================================================

    void RequireKey(const std::string& key, const std::string& section = "");
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Missing required keys and, if any key was allowed, unknown keys
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const;

    std::vector<std::string> GetSections() const;

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

    /// Commented sample file listing every daemon option
    static std::string GenerateSampleConfig();

    /// All entries with their origin
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source, bool overwrite);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   bool overwrite, std::string& currentSection, ConfigParseResult& result);

    void Store(ConfigEntry entry, bool overwrite);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key, char& bad);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;  // Repeated keys

    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* CONF = "conf";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    // Gateway
    constexpr const char* ROOT = "root";
    constexpr const char* MAXFILESIZE = "maxfilesize";
    constexpr const char* MAXPATHLENGTH = "maxpathlength";
    constexpr const char* MAXTERMLENGTH = "maxtermlength";
    constexpr const char* ALLOWEDEXT = "allowedext";

    // Rate limiting
    constexpr const char* RATEWINDOW = "ratewindow";
    constexpr const char* RATEMAX = "ratemax";
    constexpr const char* SWEEPINTERVAL = "sweepinterval";

    // Search
    constexpr const char* SEARCHMAXRESULTS = "searchmaxresults";
    constexpr const char* SEARCHMAXDEPTH = "searchmaxdepth";
    constexpr const char* SEARCHTIMEOUT = "searchtimeout";

    // Server
    constexpr const char* BIND = "bind";
    constexpr const char* PORT = "port";
    constexpr const char* THREADS = "threads";
    constexpr const char* TRUSTPROXY = "trustproxy";

    /// Every key the daemon understands
    std::vector<std::string> All();
}

} // namespace util
} // namespace dirgate

#endif // DIRGATE_UTIL_CONFIG_H
