// VELOCK - Configuration File Parser Implementation
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include "velock/util/config.h"
#include "velock/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace velock {
namespace util {

namespace {

std::string Trim(const std::string& str) {
    const char* ws = " \t\r\n";
    size_t start = str.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(ws);
    return str.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Unquote(const std::string& str) {
    if (str.size() < 2) {
        return str;
    }
    char q = str.front();
    if ((q != '"' && q != '\'') || str.back() != q) {
        return str;
    }

    std::string inner = str.substr(1, str.size() - 2);
    if (q == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.size()) {
            char next = inner[i + 1];
            if (next == 'n') { out += '\n'; ++i; continue; }
            if (next == 't') { out += '\t'; ++i; continue; }
            if (next == '\\' || next == '"') { out += next; ++i; continue; }
        }
        out += inner[i];
    }
    return out;
}

bool IsValidKey(const std::string& key, char* bad) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            *bad = c;
            return false;
        }
    }
    return !key.empty();
}

/// "nofoo" -> ("foo", true); anything else is returned unchanged
std::pair<std::string, bool> SplitNegation(const std::string& key) {
    if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(key[2]))) {
        return {key.substr(2), true};
    }
    return {key, false};
}

} // namespace

// ============================================================================
// ConfigParseResult
// ============================================================================

std::string ConfigParseResult::ToString() const {
    if (success) return "OK";
    std::string out;
    if (!errorFile.empty()) {
        out += errorFile;
        if (errorLine > 0) out += ":" + std::to_string(errorLine);
        out += ": ";
    }
    return out + errorMessage;
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = ToLower(Trim(str));
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
            size_t close = value.find('}', i + 2);
            if (close != std::string::npos) {
                std::string name = value.substr(i + 2, close - i - 2);
                if (const char* env = std::getenv(name.c_str())) {
                    out += env;
                }
                i = close + 1;
                continue;
            }
        }
        out += value[i++];
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(ConfigEntry entry) {
    entries_[MakeKey(entry.key, entry.section)] = std::move(entry);
}

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        if (trimmed.back() != ']') {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, trimmed.size() - 2));
        return true;
    }

    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;

    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
        auto [key, negated] = SplitNegation(trimmed);
        entry.key = key;
        entry.value = negated ? "false" : "true";
    } else {
        entry.key = Trim(trimmed.substr(0, eq));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eq + 1))));
    }

    char bad = '\0';
    if (!IsValidKey(entry.key, &bad)) {
        result = ConfigParseResult::Error(
            entry.key.empty() ? "Empty key"
                              : "Invalid character in key: " + std::string(1, bad),
            source, lineNum);
        return false;
    }

    Store(std::move(entry));
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    ConfigParseResult result = ConfigParseResult::Success();
    std::string currentSection;
    std::string pending;
    std::string line;
    int lineNum = 0;
    int pendingStart = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            if (pending.empty()) pendingStart = lineNum;
            pending += line.substr(0, line.size() - 1);
            continue;
        }

        int reportLine = lineNum;
        if (!pending.empty()) {
            line = pending + line;
            pending.clear();
            reportLine = pendingStart;
        }

        if (!ParseLine(line, source, reportLine, currentSection, result)) {
            return result;
        }
    }

    if (!pending.empty() &&
        !ParseLine(pending, source, pendingStart, currentSection, result)) {
        return result;
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }

    auto result = ParseStream(file, path);
    if (result.success) {
        LogDebugF(LogCategory::CONFIG, "Loaded config file %s", path.c_str());
    }
    return result;
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream in(content);
    return ParseStream(in, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i] ? argv[i] : "";
        if (arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        arg.erase(0, arg.find_first_not_of('-'));
        if (arg.empty()) {
            continue;
        }

        std::string name;
        std::string value;
        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        } else {
            auto [base, negated] = SplitNegation(arg);
            if (negated) {
                name = base;
                value = "false";
            } else if (i + 1 < argc && argv[i + 1] && argv[i + 1][0] != '-') {
                name = arg;
                value = argv[++i];
            } else {
                name = arg;
                value = "true";
            }
        }

        ConfigEntry entry;
        size_t dot = name.find('.');
        if (dot != std::string::npos) {
            entry.section = name.substr(0, dot);
            entry.key = name.substr(dot + 1);
        } else {
            entry.key = name;
        }

        char bad = '\0';
        if (!IsValidKey(entry.key, &bad)) {
            return ConfigParseResult::Error("Invalid option: --" + name, "<command-line>");
        }

        entry.value = value;
        entry.source = "<command-line>";
        Store(std::move(entry));
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) > 0;
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
    std::string text = Trim(*str);
    if (text.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    std::string text = Trim(*str);
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str || str->empty()) {
        return defaultValue;
    }
    return ExpandTilde(ExpandEnvVars(*str));
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
    entry.source = "<set>";
    Store(std::move(entry));
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end() && !it->second.isDefault) {
        return;
    }
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    Store(std::move(entry));
}

// ============================================================================
// Introspection
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [name, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return {sections.begin(), sections.end()};
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [name, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

void ConfigManager::Clear() {
    entries_.clear();
    positional_.clear();
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    for (const auto& [name, entry] : entries_) {
        oss << name << "=" << entry.value << "\n";
    }
    return oss.str();
}

} // namespace util
} // namespace velock
