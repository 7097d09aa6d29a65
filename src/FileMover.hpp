#ifndef FILE_MOVER_HPP
#define FILE_MOVER_HPP

#include <filesystem>
#include <set>
#include <system_error>

// What happened to a single candidate.
enum class MoveStatus {
    Moved,
    Planned,
    AlreadyGrouped,
    Vanished,
    Failed,
};

struct MoveResult {
    MoveStatus status;
    std::filesystem::path source;
    // Where the file now lives (or would live after a dry run).
    std::filesystem::path target;
};

// Moves files into per-extension buckets below a destination root.
class FileMover {
public:
    FileMover(std::filesystem::path destinationRoot, bool dryRun);

    // Move (or, in dry-run mode, plan) one file into its bucket.
    MoveResult process(const std::filesystem::path& sourcePath);
    // Bucket directory a file belongs in.
    std::filesystem::path bucketFor(const std::filesystem::path& file) const;
    // First free name in `folder`: "name.ext", then "name (1).ext", "name (2).ext", ...
    // Returns an empty path and sets `ec` when a candidate cannot be checked (e.g. the name is too long).
    std::filesystem::path uniqueTarget(const std::filesystem::path& folder, const std::filesystem::path& filename,
                                       std::error_code& ec) const;

private:
    // True when something already occupies `candidate`, or a dry run has already claimed it.
    bool isTaken(const std::filesystem::path& candidate, std::error_code& ec) const;
    void reportNameFailure(const std::filesystem::path& sourcePath, const std::filesystem::path& bucket,
                           const std::error_code& ec) const;
    // Create the bucket and any missing parents; an existing bucket is fine.
    bool ensureBucket(const std::filesystem::path& bucket) const;
    // Rename, falling back to copy-and-remove across devices. Leaves the file in exactly one place.
    MoveStatus relocate(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath) const;

    std::filesystem::path m_destinationRoot;
    bool m_dryRun;
    std::set<std::filesystem::path> m_plannedTargets;
};

#endif
