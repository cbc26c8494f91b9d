// TypeProof - Configuration
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// INI-style configuration files and -key=value command-line options.
//
// File format:
// - Lines starting with # or ; are comments
// - key=value pairs, optional [section] headers
// - Values may be quoted: key="value with spaces"
// - Bare "key" means true, bare "nokey" means false
// - ${VAR_NAME} expands to the environment variable's value

#ifndef TYPEPROOF_UTIL_CONFIG_H
#define TYPEPROOF_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace typeproof {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// A single configuration value and where it came from
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;
    std::string source;
    int lineNumber{0};
    bool isDefault{false};
};

/// Result of parsing a configuration source
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        return {false, msg, source, line};
    }

    std::string ToString() const;
};

/**
 * Holds configuration from defaults, files and the command line.
 *
 * Later sources overwrite earlier ones, except that defaults never
 * overwrite a value that is already set.
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

    /// Parse -key=value / -flag / -noflag options. Arguments that do not
    /// start with '-' are kept, in order, as positional arguments.
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Values
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

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    /// Positional command-line arguments
    const std::vector<std::string>& GetPositional() const { return positional_; }

    size_t Size() const { return entries_.size(); }
    void Clear();

    /// Expand ${VAR} references using the process environment
    static std::string ExpandEnvVars(const std::string& value);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source, int lineNum);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    // Proof issuance
    constexpr const char* RECEIPTKIND = "receiptkind";
    constexpr const char* MAXEVENTS = "maxevents";
    constexpr const char* MAXPROMPTCHARS = "maxpromptchars";
    constexpr const char* SEGMENTEVENTS = "segmentevents";
    constexpr const char* PRINTIMAGEID = "printimageid";

    // Ledger tool
    constexpr const char* SIGNER = "signer";
    constexpr const char* SEQUENCE = "sequence";
    constexpr const char* VERIFIER = "verifier";
}

/// Environment variable that overrides the receipt kind
constexpr const char* RECEIPT_KIND_ENV = "TYPEPROOF_RECEIPT_KIND";

} // namespace util
} // namespace typeproof

#endif // TYPEPROOF_UTIL_CONFIG_H
