#include "FileScanner.hpp"

#include "PathUtils.hpp"
#include "SortConfig.hpp"

#include <iostream>
#include <system_error>
#include <unordered_set>

namespace {
const std::unordered_set<std::string>& codeExtensions() {
    static const std::unordered_set<std::string> extensions = {
        // Python and notebooks
        ".py", ".ipynb", ".pyc", ".pyo",
        // Web
        ".html", ".css", ".js", ".jsx", ".ts", ".tsx",
        // Java and the C family
        ".java", ".c", ".cpp", ".h", ".hpp", ".cs",
        // Scripts
        ".sh", ".bash", ".ps1", ".bat",
        // Project data and config
        ".json", ".yaml", ".yml", ".xml",
        // Other languages
        ".go", ".rs", ".rb", ".php", ".swift", ".kt", ".kts",
    };
    return extensions;
}
} // namespace

FileScanner::FileScanner(std::filesystem::path root, std::filesystem::path destinationRoot, bool includeDotfiles, bool includeCode)
    : m_root(resolvePath(root)),
      m_destinationRoot(resolvePath(destinationRoot)),
      m_includeDotfiles(includeDotfiles),
      m_includeCode(includeCode),
      m_inPlace(m_root == m_destinationRoot) {}

bool FileScanner::isCodeExtension(const std::string& extension) {
    return codeExtensions().count(extension) != 0;
}

std::vector<std::filesystem::path> FileScanner::collect() const {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator iter(m_root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "Unable to enumerate `" << m_root.string() << "`: " << ec.message() << std::endl;
        return files;
    }

    const std::filesystem::recursive_directory_iterator end;
    while (iter != end) {
        const auto& entry = *iter;

        std::error_code typeErr;
        if (entry.is_directory(typeErr)) {
            if (!m_inPlace && shouldPrune(entry.path())) {
                iter.disable_recursion_pending();
            }
        } else if (accepts(entry)) {
            files.push_back(entry.path());
        }

        iter.increment(ec);
        if (ec) {
            std::cerr << "Stopped walking `" << m_root.string() << "` early: " << ec.message() << std::endl;
            break;
        }
    }

    return files;
}

bool FileScanner::shouldPrune(const std::filesystem::path& directory) const {
    return isWithin(resolvePath(directory), m_destinationRoot);
}

bool FileScanner::accepts(const std::filesystem::directory_entry& entry) const {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) {
        return false;
    }

    const std::filesystem::path& path = entry.path();
    const std::string name = path.filename().string();

    if (!m_includeDotfiles && !name.empty() && name.front() == '.') {
        return false;
    }

    if (!m_includeCode && isCodeExtension(toLower(path.extension().string()))) {
        return false;
    }

    // The top-level README documents the tree and always stays put.
    if (path.parent_path() == m_root && toLower(name) == "readme.md") {
        return false;
    }

    if (m_inPlace) {
        return path.parent_path() != m_destinationRoot / extensionKey(path);
    }
    // A symlink whose target already sits in the destination is treated as sorted.
    return !isWithin(resolvePath(path), m_destinationRoot);
}
