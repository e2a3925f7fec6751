// STARKMOAT - Configuration File Parser
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// INI-style configuration for the starkmoat tools.
//
// File format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally under [section] headers
// - Values can be quoted: key="value with spaces"
// - A bare key is a boolean flag; "nokey" sets it to false
// - ${VAR} and $VAR are replaced from the environment

#ifndef STARKMOAT_UTIL_CONFIG_H
#define STARKMOAT_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace starkmoat {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_DATADIR_NAME = ".starkmoat";
constexpr const char* DEFAULT_CONFIG_FILENAME = "starkmoat.conf";

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
    std::string source;    // File name, "<string>" or "<command-line>"
    int lineNumber{0};
    bool fromCommandLine{false};
};

/**
 * Result of parsing a configuration source.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};
    
    static ConfigParseResult Success() {
        ConfigParseResult r;
        r.success = true;
        return r;
    }
    
    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        ConfigParseResult r;
        r.errorMessage = msg;
        r.errorSource = source;
        r.errorLine = line;
        return r;
    }
    
    /// "source:line: message", or just the message when there is no location
    std::string Describe() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and command-line options.
 * 
 * Command-line values always win: a key set by ParseCommandLine is never
 * overwritten by a file parsed later, so the file can be located from a
 * --datadir option before it is read.
 */
class ConfigManager {
public:
    ConfigManager() = default;
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    ConfigParseResult ParseFile(const std::string& filePath);
    
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");
    
    /**
     * Parse --key=value, --flag and --noflag options. Arguments that do not
     * start with '-' are collected in order into positional.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[],
                                       std::vector<std::string>* positional = nullptr);
    
    /**
     * Read <datadir>/starkmoat.conf if it exists. A missing file is not an
     * error; a malformed one is.
     */
    ConfigParseResult LoadConfigFile();
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key, const std::string& section = "") const;
    
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;
    
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;
    
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;
    
    /// String value with ~ expanded
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;
    
    /// Look up the full entry, including where it came from
    const ConfigEntry* GetEntry(const std::string& key,
                                const std::string& section = "") const;
    
    // ========================================================================
    // Modification and Validation
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");
    
    void Clear();
    
    size_t Size() const { return entries_.size(); }
    
    /// Register a known global key; Validate warns about anything else
    void AllowKey(const std::string& key) { allowedKeys_.insert(key); }
    
    /// Warnings for unknown global keys (empty when no keys were allowed)
    std::vector<std::string> Validate() const;
    
    // ========================================================================
    // Paths
    // ========================================================================
    
    /// The datadir option, or the default data directory
    std::string GetDataDir() const;
    
    /// $HOME/.starkmoat
    static std::string GetDefaultDataDir();
    
    static std::string ExpandEnvVars(const std::string& value);
    
    static std::string ExpandTilde(const std::string& path);
    
    static std::optional<bool> ParseBool(const std::string& str);

private:
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    /// Store an entry unless a command-line value already holds the key
    void Store(ConfigEntry entry);
    
    static std::string MakeKey(const std::string& key, const std::string& section);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);
    
    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* DOMAIN = "domain";
    constexpr const char* ROOT = "root";
    constexpr const char* ACTOR = "actor";
    constexpr const char* ACTION = "action";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
}

} // namespace util
} // namespace starkmoat

#endif // STARKMOAT_UTIL_CONFIG_H
