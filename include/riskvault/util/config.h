// RISKVAULT - Configuration File Parser
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Parses INI-style configuration (riskvault.conf) and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef RISKVAULT_UTIL_CONFIG_H
#define RISKVAULT_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskvault {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".riskvault";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "riskvault.conf";

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
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and the command line.
 * 
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Config file
 * 3. Built-in defaults
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
     * @param filePath Path to the config file
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath);
    
    /**
     * Parse configuration from a string.
     * 
     * @param content Config text
     * @param sourceName Name used in error messages
     */
    ConfigParseResult ParseString(const std::string& content, 
                                  const std::string& sourceName = "<string>");
    
    /**
     * Parse command-line arguments of the form -key=value, --key=value,
     * -flag and -noflag. Everything else is kept as a positional argument.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);
    
    /// Non-option arguments in order of appearance
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
    
    /// Integer value; accepts d/h/m suffixes for durations in seconds
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
    
    /// Path value with ~ and ${VAR} expansion
    std::string GetPath(const std::string& key, 
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value, 
             const std::string& section = "");
    
    /// Set a value only if nothing else has defined the key
    void SetDefault(const std::string& key, const std::string& value, 
                    const std::string& section = "");
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    size_t Size() const { return entries_.size(); }
    
    /// Get default data directory path ($HOME/.riskvault)
    static std::string GetDefaultDataDir();
    
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);
    
    /// Dump all configuration to string
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source, int lineNum);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);
    
    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Global Configuration
// ============================================================================

/// Process-wide configuration used by the command-line tool
ConfigManager& GetConfig();

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* NETWORK = "network";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    
    // Caller identity for administrative commands
    constexpr const char* SENDER = "sender";
    
    // Vault parameters
    constexpr const char* MIN_UPDATE_INTERVAL = "minupdateinterval";
    constexpr const char* MAX_DAILY_DECRYPTIONS = "maxdailydecryptions";
    constexpr const char* SCORE_VALIDITY = "scorevalidity";
    constexpr const char* PASSPORT_VALIDITY = "passportvalidity";
    constexpr const char* BANDS = "bands";
    constexpr const char* GENESIS_HEIGHT = "genesisheight";
}

} // namespace util
} // namespace riskvault

#endif // RISKVAULT_UTIL_CONFIG_H
