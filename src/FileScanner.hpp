#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include <filesystem>
#include <string>
#include <vector>

// Walks a source tree and collects the files that should be grouped by extension.
class FileScanner {
public:
    FileScanner(std::filesystem::path root, std::filesystem::path destinationRoot, bool includeDotfiles, bool includeCode);

    // Walk the tree once and return every candidate in walk order.
    std::vector<std::filesystem::path> collect() const;
    // True when the destination is the root itself ("sort in place").
    bool sortsInPlace() const { return m_inPlace; }

    // Whether a lower-cased, dot-prefixed extension belongs to the built-in code set.
    static bool isCodeExtension(const std::string& extension);

private:
    // Directories at or under the destination are never descended into.
    bool shouldPrune(const std::filesystem::path& directory) const;
    // Apply the file filters in order; false means the entry is skipped.
    bool accepts(const std::filesystem::directory_entry& entry) const;

    std::filesystem::path m_root;
    std::filesystem::path m_destinationRoot;
    bool m_includeDotfiles;
    bool m_includeCode;
    bool m_inPlace;
};

#endif
