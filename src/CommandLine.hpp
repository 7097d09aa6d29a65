#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "ConfigParser.hpp"
#include "SortConfig.hpp"

#include <filesystem>
#include <optional>
#include <string>

// Raw options as given on the command line, before defaults are applied.
struct CommandLineOptions {
    std::filesystem::path root;
    std::optional<std::string> destDir;
    std::optional<std::string> configFile;
    bool dryRun = false;
    bool includeDotfiles = false;
    bool includeCode = false;
    bool interactive = false;
    bool showHelp = false;
};

// Parse argv; on failure returns false and describes the problem in `error`.
bool parseCommandLine(int argc, const char* const* argv, CommandLineOptions& options, std::string& error);

// Help text listing every option.
std::string usageText(const std::string& programName);

// Merge file defaults with command-line flags. Flags only switch booleans on; --dest-dir wins over the file.
SortConfig buildConfig(const CommandLineOptions& options, const ConfigDefaults& defaults);

#endif
