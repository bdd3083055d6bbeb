// VALORIA - Configuration File Parser
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// Parses INI-style configuration files (valoria.conf) and command-line
// overrides.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef VALORIA_UTIL_CONFIG_H
#define VALORIA_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace valoria {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".valoria";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "valoria.conf";

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

    /// "file:line: message" for display
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files, the command line and built-in defaults.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments and explicit Set() calls
 * 2. Config file
 * 3. Defaults registered with SetDefault()
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and ${VAR} are expanded)
     * @return Parse result; on failure entries read so far are kept
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name used in error messages
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse "--key=value" / "-key=value" arguments. Bare flags "--key" set
     * the key to "true" and "--nokey" to "false". Positional arguments are
     * ignored.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// nullopt if the key is missing or not a whole base-10 integer
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

    /// Get path value (with ~ expansion)
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value; overrides anything read from files
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only used when nothing else provides the key
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Validation
    // ========================================================================

    /// Register a known key; Validate() warns about any other key
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Warnings for keys that were never registered with AllowKey()
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    /// Keys of a section (empty for global)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Look up the full entry (source and line) for a key
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// $HOME/.valoria, or empty when HOME is unset
    static std::string GetDefaultDataDir();

    /// Expand ${VAR} and $VAR references; unset variables expand to ""
    static std::string ExpandEnvVars(const std::string& value);

    /// Expand a leading ~ to the home directory
    static std::string ExpandTilde(const std::string& path);

    /// Parse boolean string (true/false, yes/no, on/off, 1/0)
    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& sourceName);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    /// Store an entry unless a higher-priority one already exists
    void Store(ConfigEntry entry, bool overwrite);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool ValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";

    // Oracle parameters (seed a fresh data directory)
    constexpr const char* ADMIN = "admin";
    constexpr const char* MAXORACLES = "maxoracles";
    constexpr const char* CONSENSUSTHRESHOLD = "consensusthreshold";
    constexpr const char* MAXSUBMISSIONS = "maxsubmissions";
    constexpr const char* STALENESSWINDOW = "stalenesswindow";
}

} // namespace util
} // namespace valoria

#endif // VALORIA_UTIL_CONFIG_H
