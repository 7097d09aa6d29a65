#include "SortConfig.hpp"

#include <system_error>

std::filesystem::path resolvePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path.lexically_normal();
    }

    // weakly_canonical tolerates a missing tail, which a destination often is.
    std::filesystem::path canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        canonical = absolute.lexically_normal();
    }

    // "out/" normalizes with an empty last element; drop it so comparisons see "out".
    if (!canonical.has_filename() && canonical != canonical.root_path()) {
        canonical = canonical.parent_path();
    }
    return canonical;
}

std::filesystem::path SortConfig::rootPath() const {
    return resolvePath(root.empty() ? std::filesystem::path(".") : root);
}

std::filesystem::path SortConfig::destinationRoot() const {
    if (destDir.is_absolute()) {
        return resolvePath(destDir);
    }
    return resolvePath(rootPath() / destDir);
}
