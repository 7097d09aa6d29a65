#include "FileMover.hpp"

#include "PathUtils.hpp"
#include "SortConfig.hpp"

#include <iostream>
#include <string>
#include <system_error>

namespace {
// False with `ec` clear means nothing is there; any other failure is left in `ec`.
bool pathExists(const std::filesystem::path& path, std::error_code& ec) {
    const auto status = std::filesystem::symlink_status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        ec.clear();
        return false;
    }
    if (ec) {
        return true;
    }
    return std::filesystem::exists(status);
}
} // namespace

FileMover::FileMover(std::filesystem::path destinationRoot, bool dryRun)
    : m_destinationRoot(resolvePath(destinationRoot)), m_dryRun(dryRun) {}

std::filesystem::path FileMover::bucketFor(const std::filesystem::path& file) const {
    return m_destinationRoot / extensionKey(file);
}

std::filesystem::path FileMover::uniqueTarget(const std::filesystem::path& folder, const std::filesystem::path& filename,
                                              std::error_code& ec) const {
    auto candidate = folder / filename;
    if (!isTaken(candidate, ec)) {
        return candidate;
    }
    if (ec) {
        return {};
    }

    const std::string stem = filename.stem().string();
    const std::string extension = filename.extension().string();
    for (std::size_t counter = 1;; ++counter) {
        candidate = folder / (stem + " (" + std::to_string(counter) + ")" + extension);
        if (!isTaken(candidate, ec)) {
            return candidate;
        }
        if (ec) {
            return {};
        }
    }
}

bool FileMover::isTaken(const std::filesystem::path& candidate, std::error_code& ec) const {
    ec.clear();
    if (m_dryRun && m_plannedTargets.count(candidate) != 0) {
        return true;
    }
    return pathExists(candidate, ec);
}

MoveResult FileMover::process(const std::filesystem::path& sourcePath) {
    const auto bucket = bucketFor(sourcePath);

    if (resolvePath(sourcePath.parent_path()) == bucket) {
        std::cout << "Skipping (already grouped): " << sourcePath.string() << std::endl;
        return {MoveStatus::AlreadyGrouped, sourcePath, sourcePath};
    }

    std::error_code existsErr;
    if (!pathExists(sourcePath, existsErr)) {
        std::cerr << "Skipping (vanished): " << sourcePath.string() << std::endl;
        return {MoveStatus::Vanished, sourcePath, sourcePath};
    }
    if (existsErr) {
        std::cerr << "Failed to inspect `" << sourcePath.string() << "`: " << existsErr.message() << std::endl;
        return {MoveStatus::Failed, sourcePath, sourcePath};
    }

    std::error_code nameErr;
    if (m_dryRun) {
        const auto target = uniqueTarget(bucket, sourcePath.filename(), nameErr);
        if (nameErr) {
            reportNameFailure(sourcePath, bucket, nameErr);
            return {MoveStatus::Failed, sourcePath, sourcePath};
        }
        m_plannedTargets.insert(target);
        std::cout << "DRY-RUN: " << sourcePath.string() << " -> " << target.string() << std::endl;
        return {MoveStatus::Planned, sourcePath, target};
    }

    if (!ensureBucket(bucket)) {
        return {MoveStatus::Failed, sourcePath, sourcePath};
    }

    const auto target = uniqueTarget(bucket, sourcePath.filename(), nameErr);
    if (nameErr) {
        reportNameFailure(sourcePath, bucket, nameErr);
        return {MoveStatus::Failed, sourcePath, sourcePath};
    }
    std::cout << "Moving: " << sourcePath.string() << " -> " << target.string() << std::endl;

    const MoveStatus status = relocate(sourcePath, target);
    return {status, sourcePath, status == MoveStatus::Moved ? target : sourcePath};
}

void FileMover::reportNameFailure(const std::filesystem::path& sourcePath, const std::filesystem::path& bucket,
                                  const std::error_code& ec) const {
    std::cerr << "Failed to find a free name for `" << sourcePath.filename().string() << "` in `" << bucket.string()
              << "`: " << ec.message() << std::endl;
}

bool FileMover::ensureBucket(const std::filesystem::path& bucket) const {
    std::error_code mkdirErr;
    std::filesystem::create_directories(bucket, mkdirErr);
    if (mkdirErr) {
        std::cerr << "Failed to create destination directory `" << bucket.string() << "`: " << mkdirErr.message() << std::endl;
        return false;
    }

    std::error_code typeErr;
    if (!std::filesystem::is_directory(bucket, typeErr)) {
        std::cerr << "Destination `" << bucket.string() << "` exists but is not a directory." << std::endl;
        return false;
    }
    return true;
}

MoveStatus FileMover::relocate(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath) const {
    std::error_code renameErr;
    std::filesystem::rename(sourcePath, targetPath, renameErr);
    if (!renameErr) {
        return MoveStatus::Moved;
    }

    std::error_code existsErr;
    if (renameErr == std::errc::no_such_file_or_directory && !pathExists(sourcePath, existsErr) && !existsErr) {
        std::cerr << "Skipping (vanished): " << sourcePath.string() << std::endl;
        return MoveStatus::Vanished;
    }

    if (renameErr != std::errc::cross_device_link) {
        std::cerr << "Failed to move `" << sourcePath.string() << "`: " << renameErr.message() << std::endl;
        return MoveStatus::Failed;
    }

    // copy_options::none refuses to replace an existing target.
    std::error_code copyErr;
    std::filesystem::copy_file(sourcePath, targetPath, std::filesystem::copy_options::none, copyErr);
    if (copyErr) {
        if (copyErr != std::errc::file_exists) {
            std::error_code cleanupErr;
            std::filesystem::remove(targetPath, cleanupErr);
        }
        std::cerr << "Failed to copy `" << sourcePath.string() << "` to `" << targetPath.string() << "`: " << copyErr.message() << std::endl;
        return MoveStatus::Failed;
    }

    std::error_code removeErr;
    std::filesystem::remove(sourcePath, removeErr);
    if (removeErr) {
        std::error_code cleanupErr;
        std::filesystem::remove(targetPath, cleanupErr);
        std::cerr << "Failed to remove original file `" << sourcePath.string() << "` after copy: " << removeErr.message() << std::endl;
        if (cleanupErr) {
            std::cerr << "Copy left behind at `" << targetPath.string() << "`: " << cleanupErr.message() << std::endl;
        }
        return MoveStatus::Failed;
    }

    std::cout << "Copied `" << sourcePath.string() << "` -> `" << targetPath.string() << "` (cross-device move)" << std::endl;
    return MoveStatus::Moved;
}
