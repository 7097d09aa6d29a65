#include "PathUtils.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string extensionKey(const std::filesystem::path& file) {
    std::string extension = file.extension().string();
    if (!extension.empty() && extension.front() == '.') {
        extension.erase(extension.begin());
    }

    // "notes." has an extension of "." which leaves nothing to group by.
    if (extension.empty()) {
        return kNoExtensionKey;
    }
    return toLower(std::move(extension));
}

bool isWithin(const std::filesystem::path& candidate, const std::filesystem::path& base) {
    if (base.empty()) {
        return false;
    }
    const auto mismatch = std::mismatch(base.begin(), base.end(), candidate.begin(), candidate.end());
    return mismatch.first == base.end();
}
