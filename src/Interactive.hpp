#ifndef INTERACTIVE_HPP
#define INTERACTIVE_HPP

#include "SortConfig.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class Color {
    None,
    Cyan,
    Magenta,
    Green,
    Yellow,
    Blue,
};

// Bucket name and file count, ordered by descending count then name.
using ExtensionCounts = std::vector<std::pair<std::string, std::size_t>>;

// Count files per bucket for the preview table.
ExtensionCounts summarizeExtensions(const std::vector<std::filesystem::path>& files);
// ASCII table of extension, count and share of `total`.
std::string renderSummaryTable(const ExtensionCounts& counts, std::size_t total);
// True when stdout is a terminal that understands ANSI escapes.
bool supportsColor();

// Guided prompt flow that produces the same SortConfig as the command line.
class InteractiveSession {
public:
    InteractiveSession(std::istream& input, std::ostream& output, bool useColor);

    // Walk the user through every option. Returns nothing when the user cancels or input ends.
    std::optional<SortConfig> run(const std::filesystem::path& defaultRoot);

    // Ask until the answer is yes or no; an empty answer takes `defaultValue` when there is one.
    std::optional<bool> promptYesNo(const std::string& prompt, std::optional<bool> defaultValue);
    // Free text with a default for empty answers.
    std::optional<std::string> promptText(const std::string& prompt, const std::string& defaultValue);

    std::string colorize(const std::string& text, Color color, bool bold = false) const;

private:
    std::optional<std::string> readLine();
    void printBanner(const std::filesystem::path& defaultRoot);
    void printSection(const std::string& title);
    void printCancelled();

    std::istream& m_input;
    std::ostream& m_output;
    bool m_useColor;
};

#endif
