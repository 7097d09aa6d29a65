#ifndef SORTER_HPP
#define SORTER_HPP

#include "FileMover.hpp"
#include "SortConfig.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

// Outcome of one sorting run.
struct SortSummary {
    std::filesystem::path destinationRoot;
    bool dryRun = false;
    std::vector<std::filesystem::path> candidates;
    std::vector<MoveResult> results;
    // Files handled per bucket name (moved or planned).
    std::map<std::string, std::size_t> perBucket;

    std::size_t count(MoveStatus status) const;
};

// Validate the root, scan it and move every candidate. Returns false when the root is unusable.
bool sortFiles(const SortConfig& config, SortSummary& summary);

#endif
