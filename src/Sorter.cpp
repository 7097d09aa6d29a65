#include "Sorter.hpp"

#include "FileScanner.hpp"
#include "PathUtils.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <utility>

std::size_t SortSummary::count(MoveStatus status) const {
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(), [status](const MoveResult& result) {
        return result.status == status;
    }));
}

bool sortFiles(const SortConfig& config, SortSummary& summary) {
    const auto root = config.rootPath();
    const auto destinationRoot = config.destinationRoot();

    summary = SortSummary{};
    summary.destinationRoot = destinationRoot;
    summary.dryRun = config.dryRun;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        std::cerr << "Root directory does not exist or is not a directory: " << root.string() << std::endl;
        return false;
    }

    const FileScanner scanner(root, destinationRoot, config.includeDotfiles, config.includeCode);
    summary.candidates = scanner.collect();

    if (summary.candidates.empty()) {
        std::cout << "No files to process with the current filters." << std::endl;
        return true;
    }

    if (!config.dryRun && !config.interactive) {
        std::cout << "About to move " << summary.candidates.size() << " file(s). "
                  << "Use --dry-run to preview without changes, or --interactive for guided setup." << std::endl;
    }

    FileMover mover(destinationRoot, config.dryRun);
    for (const auto& path : summary.candidates) {
        MoveResult result = mover.process(path);
        if (result.status == MoveStatus::Moved || result.status == MoveStatus::Planned) {
            ++summary.perBucket[extensionKey(path)];
        }
        summary.results.push_back(std::move(result));
    }

    std::cout << std::endl << "Done." << (config.dryRun ? " (dry-run)" : "") << std::endl;
    std::cout << "Destination: " << destinationRoot.string() << std::endl;
    std::cout << (config.dryRun ? "Planned: " : "Moved: ")
              << summary.count(config.dryRun ? MoveStatus::Planned : MoveStatus::Moved)
              << ", already grouped: " << summary.count(MoveStatus::AlreadyGrouped)
              << ", vanished: " << summary.count(MoveStatus::Vanished)
              << ", failed: " << summary.count(MoveStatus::Failed) << std::endl;

    const std::size_t failures = summary.count(MoveStatus::Failed);
    if (failures != 0) {
        std::cerr << failures << " file(s) could not be moved; see the messages above." << std::endl;
    }
    return true;
}
