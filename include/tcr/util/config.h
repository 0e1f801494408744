// TCR - Configuration File Parser
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Parses INI-style configuration for registry deployments.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME

#ifndef TCR_UTIL_CONFIG_H
#define TCR_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tcr {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

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
    std::string source;    // File path or origin tag
    int lineNumber{0};
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
 * Holds configuration read from files and strings.
 *
 * Later sources overwrite earlier ones key by key.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Unsigned integer (nullopt if missing, malformed or negative)
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    /// Keys of `section` that are not in `known`
    std::vector<std::string> UnknownKeys(const std::string& section,
                                         const std::set<std::string>& known) const;

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source, int lineNum);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);

    /// Expand ${VAR} and $VAR references from the environment
    static std::string ExpandEnvVars(const std::string& value);

    std::map<std::string, ConfigEntry> entries_;
};

} // namespace util
} // namespace tcr

#endif // TCR_UTIL_CONFIG_H
