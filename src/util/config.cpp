// DIRGATE - Configuration File Parser Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace dirgate {
namespace util {

namespace {

const char* const COMMAND_LINE_SOURCE = "<command-line>";

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

void SplitInto(const std::string& value, std::vector<std::string>& out) {
    std::istringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        if (start == std::string::npos) {
            continue;
        }
        size_t end = item.find_last_not_of(" \t");
        out.push_back(item.substr(start, end - start + 1));
    }
}

} // namespace

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

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
    if ((first != '"' && first != '\'') || str.back() != first) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] != '\\' || i + 1 >= inner.length()) {
            unescaped += inner[i];
            continue;
        }
        switch (inner[i + 1]) {
            case 'n': unescaped += '\n'; ++i; break;
            case 't': unescaped += '\t'; ++i; break;
            case '\\': unescaped += '\\'; ++i; break;
            case '"': unescaped += '"'; ++i; break;
            default: unescaped += inner[i]; break;
        }
    }
    return unescaped;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key, char& bad) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            bad = c;
            return false;
        }
    }
    return !key.empty();
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            size_t nameStart = 0;
            size_t nameEnd = 0;
            size_t resume = 0;

            if (value[i + 1] == '{') {
                size_t close = value.find('}', i + 2);
                if (close != std::string::npos) {
                    nameStart = i + 2;
                    nameEnd = close;
                    resume = close + 1;
                }
            } else {
                nameStart = i + 1;
                nameEnd = nameStart;
                while (nameEnd < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                resume = nameEnd;
            }

            if (resume != 0 && nameEnd > nameStart) {
                std::string name = value.substr(nameStart, nameEnd - nameStart);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = resume;
                continue;
            }
        }

        result += value[i];
        ++i;
    }

    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        // ~user is not supported
        return path;
    }

    std::string home;
    if (const char* homeEnv = std::getenv("HOME")) {
        home = homeEnv;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }

    return home.empty() ? path : home + path.substr(1);
}

// ============================================================================
// Parsing
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    return section.empty() ? key : section + ":" + key;
}

void ConfigManager::Store(ConfigEntry entry, bool overwrite) {
    std::string fullKey = MakeKey(entry.key, entry.section);

    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault) {
        bool fromCommandLine = it->second.source == COMMAND_LINE_SOURCE;
        bool incomingCommandLine = entry.source == COMMAND_LINE_SOURCE;

        if (fromCommandLine && !incomingCommandLine && !overwrite) {
            return;
        }
        if (it->second.source == entry.source) {
            // Repeated key in one source accumulates as a list
            lists_[fullKey].push_back(entry.value);
            return;
        }
    }

    lists_.erase(fullKey);
    entries_[fullKey] = std::move(entry);
}

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, bool overwrite, std::string& currentSection,
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
        return true;
    }

    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag; "nokey" negates
        entry.key = trimmed;
        entry.value = "1";
        if (entry.key.length() > 2 && entry.key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(entry.key[2]))) {
            entry.key = entry.key.substr(2);
            entry.value = "0";
        }
    } else {
        entry.key = Trim(trimmed.substr(0, eqPos));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    char bad = '\0';
    if (entry.key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    if (!IsValidKey(entry.key, bad)) {
        result = ConfigParseResult::Error(
            "Invalid character in key: " + std::string(1, bad), source, lineNum);
        return false;
    }

    Store(std::move(entry), overwrite);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source,
                                             bool overwrite) {
    std::string currentSection;
    std::string line;
    std::string continuation;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty() && line.back() == '\\') {
            continuation += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuation.empty()) {
            line = continuation + line;
            continuation.clear();
        }

        if (!ParseLine(line, source, lineNum, overwrite, currentSection, result)) {
            return result;
        }
    }

    if (!continuation.empty() &&
        !ParseLine(continuation, source, lineNum, overwrite, currentSection, result)) {
        return result;
    }

    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    std::string expandedPath = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(expandedPath, std::ios::binary);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }

    file.seekg(0, std::ios::end);
    std::streamoff fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize < 0 || static_cast<uint64_t>(fileSize) > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }

    return ParseStream(file, expandedPath, overwrite);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName, overwrite);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, char* argv[]) {
    ConfigParseResult result = ConfigParseResult::Success();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.empty() || arg[0] != '-') {
            result.warnings.push_back("Ignoring non-option argument: " + arg);
            continue;
        }

        size_t dashes = arg.find_first_not_of('-');
        if (dashes == std::string::npos) {
            continue;
        }
        arg = arg.substr(dashes);

        ConfigEntry entry;
        entry.source = COMMAND_LINE_SOURCE;

        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            entry.key = arg.substr(0, eqPos);
            entry.value = arg.substr(eqPos + 1);
        } else if (arg.length() > 2 && arg.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(arg[2]))) {
            entry.key = arg.substr(2);
            entry.value = "0";
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            entry.key = arg;
            entry.value = argv[++i];
        } else {
            entry.key = arg;
            entry.value = "1";
        }

        char bad = '\0';
        if (!IsValidKey(entry.key, bad)) {
            return ConfigParseResult::Error("Invalid command-line option: -" + entry.key);
        }

        Store(std::move(entry), true);
    }

    return result;
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) != 0;
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

    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos);

        std::string suffix = ToLower(Trim(str->substr(pos)));
        if (suffix.empty()) {
            return value;
        }
        if (suffix.size() > 1 && suffix != "kb" && suffix != "mb" &&
            suffix != "gb" && suffix != "tb") {
            return std::nullopt;
        }
        switch (suffix[0]) {
            case 'k': return value * 1024;
            case 'm': return value * 1024 * 1024;
            case 'g': return value * 1024LL * 1024 * 1024;
            case 't': return value * 1024LL * 1024 * 1024 * 1024;
            default: return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto value = TryGetInt(key, section);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

uint64_t ConfigManager::GetUInt(const std::string& key,
                                uint64_t defaultValue,
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

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::string fullKey = MakeKey(key, section);
    std::vector<std::string> result;

    auto entryIt = entries_.find(fullKey);
    if (entryIt == entries_.end()) {
        return result;
    }
    SplitInto(entryIt->second.value, result);

    auto listIt = lists_.find(fullKey);
    if (listIt != lists_.end()) {
        for (const auto& value : listIt->second) {
            SplitInto(value, result);
        }
    }

    return result;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
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
    entry.source = "<programmatic>";

    std::string fullKey = MakeKey(key, section);
    lists_.erase(fullKey);
    entries_[fullKey] = std::move(entry);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.count(fullKey) != 0) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::RequireKey(const std::string& key, const std::string& section) {
    requiredKeys_.insert(MakeKey(key, section));
}

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;

    for (const auto& required : requiredKeys_) {
        if (entries_.count(required) == 0) {
            errors.push_back("Required key missing: " + required);
        }
    }

    if (!allowedKeys_.empty()) {
        for (const auto& [fullKey, entry] : entries_) {
            if (allowedKeys_.count(fullKey) == 0 && requiredKeys_.count(fullKey) == 0) {
                errors.push_back("Unknown key: " + fullKey + " (defined in " + entry.source + ")");
            }
        }
    }

    return errors;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    requiredKeys_.clear();
    allowedKeys_.clear();
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [key, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::string ConfigManager::GenerateSampleConfig() {
    std::ostringstream oss;

    oss << "# dirgate configuration file\n";
    oss << "# Command-line options (-key=value) override values set here.\n\n";

    oss << "# ============================================================================\n";
    oss << "# Gateway\n";
    oss << "# ============================================================================\n\n";

    oss << "# Directory exposed to clients; nothing outside it is reachable\n";
    oss << "#root=/srv/files\n\n";

    oss << "# Largest accepted upload (k/m/g suffixes allowed)\n";
    oss << "#maxfilesize=10m\n\n";

    oss << "# Longest accepted path after normalization\n";
    oss << "#maxpathlength=260\n\n";

    oss << "# Longest accepted search term\n";
    oss << "#maxtermlength=100\n\n";

    oss << "# Upload extension allow-list; empty accepts any non-dangerous extension\n";
    oss << "#allowedext=.txt,.pdf,.png\n\n";

    oss << "# ============================================================================\n";
    oss << "# Rate Limiting\n";
    oss << "# ============================================================================\n\n";

    oss << "# Sliding window length in minutes\n";
    oss << "#ratewindow=15\n\n";

    oss << "# Requests allowed per caller and operation within the window\n";
    oss << "#ratemax=100\n\n";

    oss << "# Seconds between sweeps of idle rate-limit windows\n";
    oss << "#sweepinterval=300\n\n";

    oss << "# ============================================================================\n";
    oss << "# Search\n";
    oss << "# ============================================================================\n\n";

    oss << "#searchmaxresults=10000\n";
    oss << "#searchmaxdepth=20\n\n";

    oss << "# Time budget per search in seconds\n";
    oss << "#searchtimeout=30\n\n";

    oss << "# ============================================================================\n";
    oss << "# Server\n";
    oss << "# ============================================================================\n\n";

    oss << "#bind=127.0.0.1\n";
    oss << "#port=8750\n";
    oss << "#threads=4\n\n";

    oss << "# Take the caller address from X-Forwarded-For / X-Real-IP\n";
    oss << "#trustproxy=0\n\n";

    oss << "# ============================================================================\n";
    oss << "# Logging\n";
    oss << "# ============================================================================\n\n";

    oss << "# trace, debug, info, warn, error, fatal or off\n";
    oss << "#loglevel=info\n\n";

    oss << "#logfile=/var/log/dirgate.log\n";
    oss << "#printtoconsole=1\n\n";

    oss << "# Debug categories: gateway, security, search, store, rpc, config or all\n";
    oss << "#debug=security\n";

    return oss.str();
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;

    oss << "# Configuration Dump (" << entries_.size() << " entries)\n";

    std::map<std::string, std::vector<const ConfigEntry*>> bySection;
    for (const auto& [key, entry] : entries_) {
        bySection[entry.section].push_back(&entry);
    }

    for (const auto& [name, entries] : bySection) {
        oss << "\n";
        if (!name.empty()) {
            oss << "[" << name << "]\n";
        }
        for (const ConfigEntry* entry : entries) {
            oss << entry->key << "=" << entry->value << "  # ";
            if (entry->isDefault) {
                oss << "(default)";
            } else {
                oss << entry->source;
                if (entry->lineNumber > 0) {
                    oss << ":" << entry->lineNumber;
                }
            }
            oss << "\n";
        }
    }

    return oss.str();
}

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {

std::vector<std::string> All() {
    return {
        CONF, DEBUG, LOGLEVEL, LOGFILE, PRINTTOCONSOLE,
        ROOT, MAXFILESIZE, MAXPATHLENGTH, MAXTERMLENGTH, ALLOWEDEXT,
        RATEWINDOW, RATEMAX, SWEEPINTERVAL,
        SEARCHMAXRESULTS, SEARCHMAXDEPTH, SEARCHTIMEOUT,
        BIND, PORT, THREADS, TRUSTPROXY,
    };
}

} // namespace ConfigKeys

} // namespace util
} // namespace dirgate
