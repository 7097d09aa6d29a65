#include "CommandLine.hpp"

#include <map>
#include <sstream>
#include <string>
#include <system_error>

namespace {
constexpr char kDestDirFlag[] = "--dest-dir";
constexpr char kConfigFlag[] = "--config";

// Handles "--flag value" and "--flag=value"; returns false when the value is missing.
bool takeValue(const std::string& arg, const char* flag, int argc, const char* const* argv, int& index,
               std::optional<std::string>& out, std::string& error) {
    const std::string prefix = std::string(flag) + "=";
    if (arg.compare(0, prefix.size(), prefix) == 0) {
        out = arg.substr(prefix.size());
    } else if (index + 1 < argc) {
        out = argv[++index];
    } else {
        error = std::string("Option ") + flag + " expects a value.";
        return false;
    }

    if (out->empty()) {
        error = std::string("Option ") + flag + " cannot be empty.";
        return false;
    }
    return true;
}

bool matchesValueFlag(const std::string& arg, const char* flag) {
    const std::string name(flag);
    return arg == name || arg.compare(0, name.size() + 1, name + "=") == 0;
}
} // namespace

bool parseCommandLine(int argc, const char* const* argv, CommandLineOptions& options, std::string& error) {
    options = CommandLineOptions{};
    bool haveRoot = false;
    bool onlyPositional = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (!onlyPositional && arg == "--") {
            onlyPositional = true;
        } else if (!onlyPositional && (arg == "-h" || arg == "--help")) {
            options.showHelp = true;
        } else if (!onlyPositional && arg == "--dry-run") {
            options.dryRun = true;
        } else if (!onlyPositional && arg == "--include-dotfiles") {
            options.includeDotfiles = true;
        } else if (!onlyPositional && arg == "--include-code") {
            options.includeCode = true;
        } else if (!onlyPositional && arg == "--interactive") {
            options.interactive = true;
        } else if (!onlyPositional && matchesValueFlag(arg, kDestDirFlag)) {
            if (!takeValue(arg, kDestDirFlag, argc, argv, i, options.destDir, error)) {
                return false;
            }
        } else if (!onlyPositional && matchesValueFlag(arg, kConfigFlag)) {
            if (!takeValue(arg, kConfigFlag, argc, argv, i, options.configFile, error)) {
                return false;
            }
        } else if (!onlyPositional && arg.size() > 1 && arg.front() == '-') {
            error = "Unknown option: " + arg;
            return false;
        } else if (haveRoot) {
            error = "Only one root directory may be given (got an extra `" + arg + "`).";
            return false;
        } else {
            options.root = arg;
            haveRoot = true;
        }
    }

    return true;
}

std::string usageText(const std::string& programName) {
    std::ostringstream out;
    out << "Usage: " << programName << " [root] [options]\n"
        << "\n"
        << "Recursively group files by extension into a top-level folder.\n"
        << "\n"
        << "  root                 Directory to start from (default: current directory)\n"
        << "  --dest-dir <path>    Destination folder, relative to root unless absolute\n"
        << "                       (default: " << kDefaultDestDir << ")\n"
        << "  --dry-run            Print planned moves without changing anything\n"
        << "  --include-dotfiles   Include hidden files (starting with a dot)\n"
        << "  --include-code       Include common code files like .py, .ipynb\n"
        << "  --interactive        Run in interactive mode with guided prompts\n"
        << "  --config <file>      Read option defaults from a JSON file\n"
        << "  -h, --help           Show this help and exit\n";
    return out.str();
}

SortConfig buildConfig(const CommandLineOptions& options, const ConfigDefaults& defaults) {
    SortConfig config;

    if (options.root.empty()) {
        std::error_code ec;
        config.root = std::filesystem::current_path(ec);
        if (ec) {
            config.root = ".";
        }
    } else {
        config.root = options.root;
    }

    // {{root}} and {{root_name}} always describe the root being sorted and shadow file placeholders.
    std::map<std::string, std::string> placeholders = defaults.placeholders;
    const std::filesystem::path resolvedRoot = config.rootPath();
    placeholders["root"] = resolvedRoot.string();
    placeholders["root_name"] = resolvedRoot.filename().string();

    if (options.destDir) {
        config.destDir = expandPlaceholders(*options.destDir, placeholders);
    } else if (defaults.destDir) {
        config.destDir = expandPlaceholders(*defaults.destDir, placeholders);
    } else {
        config.destDir = kDefaultDestDir;
    }

    config.includeDotfiles = options.includeDotfiles || defaults.includeDotfiles;
    config.includeCode = options.includeCode || defaults.includeCode;
    config.dryRun = options.dryRun || defaults.dryRun;
    config.interactive = options.interactive || defaults.interactive;
    return config;
}
