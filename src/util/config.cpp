// VALORIA - Configuration File Parser Implementation
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include "valoria/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace valoria {
namespace util {

namespace {

constexpr const char* COMMAND_LINE_SOURCE = "<command-line>";

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "ok";
    }
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile;
        if (errorLine > 0) {
            oss << ":" << errorLine;
        }
        oss << ": ";
    }
    oss << errorMessage;
    return oss.str();
}

// ============================================================================
// Static Helper Functions
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

    const char quote = str.front();
    if ((quote != '"' && quote != '\'') || str.back() != quote) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (quote == '\'') {
        return inner;
    }

    // Double quotes honour \n \t \\ and \"
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] != '\\' || i + 1 == inner.length()) {
            out += inner[i];
            continue;
        }
        switch (inner[i + 1]) {
            case 'n':  out += '\n'; ++i; break;
            case 't':  out += '\t'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '"':  out += '"';  ++i; break;
            default:   out += '\\'; break;
        }
    }
    return out;
}

bool ConfigManager::ValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    const std::string lower = ToLower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] != '$' || i + 1 == value.length()) {
            result += value[i++];
            continue;
        }

        size_t nameStart;
        size_t nameEnd;
        size_t next;
        if (value[i + 1] == '{') {
            nameStart = i + 2;
            nameEnd = value.find('}', nameStart);
            if (nameEnd == std::string::npos) {
                result += value[i++];
                continue;
            }
            next = nameEnd + 1;
        } else {
            nameStart = i + 1;
            nameEnd = nameStart;
            while (nameEnd < value.length() &&
                   (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                    value[nameEnd] == '_')) {
                ++nameEnd;
            }
            if (nameEnd == nameStart) {
                result += value[i++];
                continue;
            }
            next = nameEnd;
        }

        const std::string name = value.substr(nameStart, nameEnd - nameStart);
        if (const char* env = std::getenv(name.c_str())) {
            result += env;
        }
        i = next;
    }

    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        return path;  // ~user is not supported
    }

    std::string home;
    if (const char* homeEnv = std::getenv("HOME")) {
        home = homeEnv;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }

    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        return "";
    }
    return std::string(home) + "/" + DEFAULT_DATADIR_NAME;
}

// ============================================================================
// Internal Key Management
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

void ConfigManager::Store(ConfigEntry entry, bool overwrite) {
    const std::string fullKey = MakeKey(entry.key, entry.section);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !overwrite && !it->second.isDefault) {
        return;
    }
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    const std::string trimmed = Trim(line);

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
        return true;
    }

    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag: "key" means true, "nokey" means false
        entry.key = trimmed;
        entry.value = "true";
        if (entry.key.size() > 2 && entry.key.compare(0, 2, "no") == 0) {
            entry.key = entry.key.substr(2);
            entry.value = "false";
        }
    } else {
        entry.key = Trim(trimmed.substr(0, eqPos));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (!ValidKey(entry.key)) {
        result = ConfigParseResult::Error(
            entry.key.empty() ? "Empty key" : "Invalid key: " + entry.key,
            source, lineNum);
        return false;
    }

    auto previous = GetEntry(entry.key, entry.section);
    if (previous) {
        // Command-line values outrank every file
        if (previous->source == COMMAND_LINE_SOURCE) {
            return true;
        }
        if (previous->source == source) {
            result.warnings.push_back(source + ":" + std::to_string(lineNum) +
                                      ": duplicate key '" + entry.key +
                                      "', last value wins");
        }
    }

    Store(std::move(entry), true);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& sourceName) {
    ConfigParseResult result = ConfigParseResult::Success();
    std::string currentSection;
    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }

        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }

    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    const std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path, path);
    }

    file.seekg(0, std::ios::end);
    const auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }

    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    ConfigParseResult result = ConfigParseResult::Success();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            continue;
        }

        arg.erase(0, arg[1] == '-' ? 2 : 1);

        ConfigEntry entry;
        entry.source = COMMAND_LINE_SOURCE;

        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            entry.key = arg.substr(0, eqPos);
            entry.value = arg.substr(eqPos + 1);
        } else if (arg.size() > 2 && arg.compare(0, 2, "no") == 0) {
            entry.key = arg.substr(2);
            entry.value = "false";
        } else {
            entry.key = arg;
            entry.value = "true";
        }

        if (!ValidKey(entry.key)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            COMMAND_LINE_SOURCE);
        }

        Store(std::move(entry), true);
    }

    return result;
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.find(MakeKey(key, section)) != entries_.end();
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key,
                                                   const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
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

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }

    const std::string value = Trim(*str);
    try {
        size_t pos = 0;
        const long long parsed = std::stoll(value, &pos, 10);
        if (pos != value.length()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(parsed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(Trim(*str));
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandTilde(GetString(key, defaultValue, section));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = COMMAND_LINE_SOURCE;
    Store(std::move(entry), true);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    Store(std::move(entry), false);
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> warnings;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.isDefault || allowedKeys_.count(fullKey) > 0) {
            continue;
        }
        std::string where = entry.source;
        if (entry.lineNumber > 0) {
            where += ":" + std::to_string(entry.lineNumber);
        }
        warnings.push_back(where + ": unknown option '" + fullKey + "'");
    }
    return warnings;
}

// ============================================================================
// Utilities
// ============================================================================

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

void ConfigManager::Clear() {
    entries_.clear();
    allowedKeys_.clear();
}

} // namespace util
} // namespace valoria
