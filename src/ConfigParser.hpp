#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include <istream>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

// Option defaults read from a JSON file; command-line flags are layered on top.
struct ConfigDefaults {
    // Kept unexpanded; {{tokens}} are filled in once the root is known.
    std::optional<std::string> destDir;
    bool includeDotfiles = false;
    bool includeCode = false;
    bool dryRun = false;
    bool interactive = false;
    // User-defined {{key}} values from the "placeholders" object.
    std::map<std::string, std::string> placeholders;
};

// Replace every {{key}} with values[key]. Unknown tokens stay verbatim and are reported on std::cerr.
std::string expandPlaceholders(const std::string& value, const std::map<std::string, std::string>& values);

// Parses a sortify JSON file and exposes the resolved defaults.
class ConfigParser {
public:
    // Load configuration from disk; returns false on I/O or validation errors.
    bool load(const std::string& filePath);
    // Same as load() but reads an already opened stream; `origin` names it in messages.
    bool load(std::istream& input, const std::string& origin);
    // Read-only access to the loaded defaults.
    const ConfigDefaults& getDefaults() const;

private:
    // Validate and collect the "placeholders" object.
    bool loadPlaceholders(const nlohmann::json& data);
    // Copy an optional boolean field; false when present with the wrong type.
    static bool readFlag(const nlohmann::json& data, const char* key, bool& out);

    ConfigDefaults m_defaults;
};

#endif
