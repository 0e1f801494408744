// TCR - Configuration File Parser Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/util/config.h"
#include "tcr/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tcr {
namespace util {

// ============================================================================
// Static Helpers
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    char first = str.front();
    char last = str.back();
    if (first != last || (first != '"' && first != '\'')) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    // Double quotes honour the common escapes
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] != '\\' || i + 1 >= inner.length()) {
            out += inner[i];
            continue;
        }
        switch (inner[i + 1]) {
            case 'n':  out += '\n'; ++i; break;
            case 't':  out += '\t'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '"':  out += '"';  ++i; break;
            default:   out += inner[i]; break;
        }
    }
    return out;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            size_t nameStart = 0;
            size_t nameEnd = 0;
            size_t next = 0;

            if (value[i + 1] == '{') {
                size_t close = value.find('}', i + 2);
                if (close != std::string::npos) {
                    nameStart = i + 2;
                    nameEnd = close;
                    next = close + 1;
                }
            } else {
                size_t end = i + 1;
                while (end < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[end])) ||
                        value[end] == '_')) {
                    ++end;
                }
                if (end > i + 1) {
                    nameStart = i + 1;
                    nameEnd = end;
                    next = end;
                }
            }

            if (next != 0) {
                std::string name = value.substr(nameStart, nameEnd - nameStart);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = next;
                continue;
            }
        }

        result += value[i];
        ++i;
    }

    return result;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    if (section.empty()) {
        return key;
    }
    return section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& section, const std::string& source,
                          int lineNum) {
    std::string fullKey = MakeKey(key, section);

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[fullKey] = std::move(entry);
}

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        if (!IsValidKey(currentSection)) {
            result = ConfigParseResult::Error(
                "Invalid section name: " + currentSection, source, lineNum);
            return false;
        }
        return true;
    }

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        result = ConfigParseResult::Error("Expected key=value", source, lineNum);
        return false;
    }
    std::string key = Trim(trimmed.substr(0, eqPos));
    std::string value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));

    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }

    Store(key, value, currentSection, source, lineNum);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    ConfigParseResult result = ConfigParseResult::Success();
    std::string currentSection;
    std::string line;
    std::string pending;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            pending += line.substr(0, line.length() - 1);
            continue;
        }

        pending += line;
        if (!ParseLine(pending, source, lineNum, currentSection, result)) {
            LOG_DEBUG(LogCategory::CONFIG) << source << ":" << lineNum << ": "
                                           << result.errorMessage;
            return result;
        }
        pending.clear();
    }

    if (!pending.empty() &&
        !ParseLine(pending, source, lineNum, currentSection, result)) {
        return result;
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(filePath);

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }

    ConfigParseResult result = ParseStream(file, path);
    if (result.success) {
        LOG_INFO(LogCategory::CONFIG) << "Loaded configuration from " << path;
    }
    return result;
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str || str->empty() || (*str)[0] == '-') {
        return std::nullopt;
    }

    try {
        size_t pos = 0;
        uint64_t value = std::stoull(*str, &pos);
        if (!Trim(str->substr(pos)).empty()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Validation
// ============================================================================

std::vector<std::string> ConfigManager::UnknownKeys(const std::string& section,
                                                   const std::set<std::string>& known) const {
    std::vector<std::string> unknown;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section && !known.count(entry.key)) {
            unknown.push_back(entry.key);
        }
    }
    return unknown;
}

} // namespace util
} // namespace tcr
