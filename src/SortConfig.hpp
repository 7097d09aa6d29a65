#ifndef SORT_CONFIG_HPP
#define SORT_CONFIG_HPP

#include <filesystem>
#include <string>

// Default name of the folder created inside the root when no destination is given.
inline constexpr char kDefaultDestDir[] = "sorted_by_extension";

// Options for a single sorting run. Built once and never modified afterwards.
struct SortConfig {
    std::filesystem::path root;
    std::filesystem::path destDir = ".";
    bool includeDotfiles = false;
    bool includeCode = false;
    bool dryRun = false;
    bool interactive = false;

    // Absolute, canonical form of the source root.
    std::filesystem::path rootPath() const;
    // Absolute, canonical destination; relative destinations hang off rootPath().
    std::filesystem::path destinationRoot() const;
};

// Resolve a path against the current directory and canonicalize whatever part of it exists.
std::filesystem::path resolvePath(const std::filesystem::path& path);

#endif
