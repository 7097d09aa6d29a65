#include "ConfigParser.hpp"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

const ConfigDefaults& ConfigParser::getDefaults() const {
    return m_defaults;
}

bool ConfigParser::load(const std::string& filePath) {
    std::ifstream jsonFile(filePath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: " << filePath << std::endl;
        return false;
    }
    return load(jsonFile, filePath);
}

bool ConfigParser::load(std::istream& input, const std::string& origin) {
    json data;
    try {
        input >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "Invalid configuration in " << origin << ": the top level must be an object." << std::endl;
        return false;
    }

    m_defaults = ConfigDefaults{};
    if (!loadPlaceholders(data)) {
        return false;
    }

    if (auto it = data.find("dest_dir"); it != data.end()) {
        if (!it->is_string()) {
            std::cerr << "`dest_dir` must be a string." << std::endl;
            return false;
        }
        const std::string destDir = it->get<std::string>();
        if (destDir.empty()) {
            std::cerr << "`dest_dir` cannot be empty." << std::endl;
            return false;
        }
        m_defaults.destDir = destDir;
    }

    if (!readFlag(data, "include_dotfiles", m_defaults.includeDotfiles) ||
        !readFlag(data, "include_code", m_defaults.includeCode) ||
        !readFlag(data, "dry_run", m_defaults.dryRun) ||
        !readFlag(data, "interactive", m_defaults.interactive)) {
        return false;
    }

    std::cout << "Loaded defaults from " << origin << std::endl;
    return true;
}

bool ConfigParser::readFlag(const json& data, const char* key, bool& out) {
    auto it = data.find(key);
    if (it == data.end()) {
        return true;
    }
    if (!it->is_boolean()) {
        std::cerr << "`" << key << "` must be a boolean value." << std::endl;
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool ConfigParser::loadPlaceholders(const json& data) {
    auto placeholdersIt = data.find("placeholders");
    if (placeholdersIt == data.end()) {
        return true;
    }

    if (!placeholdersIt->is_object()) {
        std::cerr << "`placeholders` must be an object of key/value strings." << std::endl;
        return false;
    }

    for (auto it = placeholdersIt->begin(); it != placeholdersIt->end(); ++it) {
        if (!it.value().is_string()) {
            std::cerr << "Placeholder `" << it.key() << "` must be a string." << std::endl;
            return false;
        }
        m_defaults.placeholders[it.key()] = it.value().get<std::string>();
    }
    return true;
}

std::string expandPlaceholders(const std::string& value, const std::map<std::string, std::string>& values) {
    std::string expanded;
    expanded.reserve(value.size());

    std::size_t pos = 0;
    while (pos < value.size()) {
        const std::size_t open = value.find("{{", pos);
        const std::size_t close = open == std::string::npos ? std::string::npos : value.find("}}", open + 2);
        if (close == std::string::npos) {
            expanded.append(value, pos, std::string::npos);
            break;
        }

        expanded.append(value, pos, open - pos);
        const std::string key = value.substr(open + 2, close - open - 2);
        auto it = values.find(key);
        if (it != values.end()) {
            expanded += it->second;
        } else {
            std::cerr << "Warning: unresolved placeholder `{{" << key << "}}` in `" << value << "`." << std::endl;
            expanded.append(value, open, close + 2 - open);
        }
        pos = close + 2;
    }

    return expanded;
}
