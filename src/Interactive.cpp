#include "Interactive.hpp"

#include "FileScanner.hpp"
#include "PathUtils.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

#include <unistd.h>

namespace {
constexpr std::size_t kLineWidth = 60;
constexpr std::size_t kPreviewRows = 20;
constexpr std::size_t kExtensionColumnWidth = 15;

constexpr char kBanner[] = R"(
    _________              __  .__  _____
 /   _____/ ____________/  |_|__|/ ____\__.__.
 \_____  \ /  _ \_  __ \   __\  \   __<   |  |
 /        (  <_> )  | \/|  | |  ||  |  \___  |
/_______  /\____/|__|   |__| |__||__|  / ____|
        \/                             \/
)";

const char* colorCode(Color color) {
    switch (color) {
    case Color::Cyan:
        return "36";
    case Color::Magenta:
        return "35";
    case Color::Green:
        return "32";
    case Color::Yellow:
        return "33";
    case Color::Blue:
        return "34";
    case Color::None:
        break;
    }
    return nullptr;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}
} // namespace

ExtensionCounts summarizeExtensions(const std::vector<std::filesystem::path>& files) {
    std::map<std::string, std::size_t> counts;
    for (const auto& file : files) {
        ++counts[extensionKey(file)];
    }

    ExtensionCounts ordered(counts.begin(), counts.end());
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.second > rhs.second;
    });
    return ordered;
}

std::string renderSummaryTable(const ExtensionCounts& counts, std::size_t total) {
    const std::string header = "+-----------------+-------+--------+";
    std::ostringstream out;
    out << header << '\n' << "| Extension       | Count |   %    |" << '\n' << header << '\n';
    for (const auto& [extension, count] : counts) {
        const double percent = total == 0 ? 0.0 : (static_cast<double>(count) / static_cast<double>(total)) * 100.0;
        out << "| " << std::left << std::setw(static_cast<int>(kExtensionColumnWidth)) << extension.substr(0, kExtensionColumnWidth)
            << " | " << std::right << std::setw(5) << count
            << " | " << std::fixed << std::setprecision(1) << std::setw(5) << percent << "% |" << '\n';
    }
    out << header;
    return out.str();
}

bool supportsColor() {
    const char* term = std::getenv("TERM");
    const std::string termName = term ? term : "";
    return isatty(STDOUT_FILENO) != 0 && !termName.empty() && termName != "dumb";
}

InteractiveSession::InteractiveSession(std::istream& input, std::ostream& output, bool useColor)
    : m_input(input), m_output(output), m_useColor(useColor) {}

std::string InteractiveSession::colorize(const std::string& text, Color color, bool bold) const {
    if (!m_useColor) {
        return text;
    }

    std::string codes;
    if (bold) {
        codes = "1";
    }
    if (const char* code = colorCode(color)) {
        codes += codes.empty() ? code : std::string(";") + code;
    }
    if (codes.empty()) {
        return text;
    }
    return "\033[" + codes + "m" + text + "\033[0m";
}

std::optional<std::string> InteractiveSession::readLine() {
    std::string line;
    if (!std::getline(m_input, line)) {
        return std::nullopt;
    }
    return trim(line);
}

std::optional<bool> InteractiveSession::promptYesNo(const std::string& prompt, std::optional<bool> defaultValue) {
    const std::string suffix = !defaultValue ? " [y/n]" : (*defaultValue ? " [Y/n]" : " [y/N]");
    while (true) {
        m_output << prompt << suffix << ": " << std::flush;
        const auto answer = readLine();
        if (!answer) {
            return std::nullopt;
        }

        const std::string response = toLower(*answer);
        if (response.empty() && defaultValue) {
            return *defaultValue;
        }
        if (response == "y" || response == "yes") {
            return true;
        }
        if (response == "n" || response == "no") {
            return false;
        }
        m_output << "Please answer 'y' or 'n'." << std::endl;
    }
}

std::optional<std::string> InteractiveSession::promptText(const std::string& prompt, const std::string& defaultValue) {
    m_output << prompt << " [" << defaultValue << "]: " << std::flush;
    const auto answer = readLine();
    if (!answer) {
        return std::nullopt;
    }
    return answer->empty() ? defaultValue : *answer;
}

void InteractiveSession::printBanner(const std::filesystem::path& defaultRoot) {
    m_output << '\n' << colorize(kBanner, Color::Cyan, true) << '\n'
             << colorize("Sortify :: Recursive extension-based sorter", Color::Magenta, true) << '\n'
             << colorize("Default root -> " + resolvePath(defaultRoot).string(), Color::Yellow) << '\n'
             << colorize(std::string(kLineWidth, '-'), Color::Blue) << std::endl;
}

void InteractiveSession::printSection(const std::string& title) {
    const std::string padded = "[ " + title + " ]";
    const std::size_t leftPad = padded.size() < kLineWidth ? (kLineWidth - padded.size()) / 2 : 0;
    const std::size_t rightPad = padded.size() < kLineWidth ? kLineWidth - padded.size() - leftPad : 0;
    const std::string rule(kLineWidth, '=');

    m_output << '\n' << colorize(rule, Color::Blue) << '\n'
             << colorize(std::string(leftPad, ' ') + padded + std::string(rightPad, ' '), Color::Green, true) << '\n'
             << colorize(rule, Color::Blue) << std::endl;
}

void InteractiveSession::printCancelled() {
    m_output << '\n' << colorize("Cancelled by user.", Color::Magenta, true) << std::endl;
}

std::optional<SortConfig> InteractiveSession::run(const std::filesystem::path& defaultRoot) {
    printBanner(defaultRoot);

    printSection("Source & Destination");
    const auto rootAnswer = promptText("Start directory", resolvePath(defaultRoot).string());
    if (!rootAnswer.has_value()) {
        printCancelled();
        return std::nullopt;
    }
    const auto destAnswer = promptText("Destination folder ('.' keeps files beside their source root)", ".");
    if (!destAnswer.has_value()) {
        printCancelled();
        return std::nullopt;
    }

    printSection("Filters");
    const auto includeDotfiles = promptYesNo("Include hidden files (dotfiles)?", false);
    if (!includeDotfiles.has_value()) {
        printCancelled();
        return std::nullopt;
    }
    const auto includeCode = promptYesNo("Include code files (.py, .ipynb, etc.)?", false);
    if (!includeCode.has_value()) {
        printCancelled();
        return std::nullopt;
    }

    SortConfig config;
    config.root = *rootAnswer;
    config.destDir = *destAnswer;
    config.includeDotfiles = *includeDotfiles;
    config.includeCode = *includeCode;
    config.interactive = true;

    printSection("Preview");
    const FileScanner scanner(config.rootPath(), config.destinationRoot(), config.includeDotfiles, config.includeCode);
    const auto files = scanner.collect();
    m_output << colorize("Found " + std::to_string(files.size()) + " file(s) to process.", Color::Yellow, true) << std::endl;
    if (!files.empty()) {
        ExtensionCounts summary = summarizeExtensions(files);
        const std::size_t groups = summary.size();
        if (groups > kPreviewRows) {
            summary.resize(kPreviewRows);
        }
        m_output << renderSummaryTable(summary, files.size()) << std::endl;
        if (groups > kPreviewRows) {
            m_output << colorize("...and " + std::to_string(groups - kPreviewRows) + " more extension group(s)", Color::Magenta) << std::endl;
        }
    } else {
        m_output << colorize("No files detected with the current filters.", Color::Magenta) << std::endl;
    }

    printSection("Safety Checks");
    const auto dryRun = promptYesNo("Do a dry run first (no changes)?", true);
    if (!dryRun.has_value()) {
        printCancelled();
        return std::nullopt;
    }
    const auto proceed = promptYesNo("Proceed with the operation?", !files.empty());
    if (!proceed.has_value() || !*proceed) {
        printCancelled();
        return std::nullopt;
    }

    config.dryRun = *dryRun;
    return config;
}
