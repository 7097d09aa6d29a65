#ifndef PATH_UTILS_HPP
#define PATH_UTILS_HPP

#include <filesystem>
#include <string>

// Bucket name used for files that have no extension.
inline constexpr char kNoExtensionKey[] = "no_ext";

// Lower-case copy of an ASCII string.
std::string toLower(std::string value);

// Lower-cased extension without its dot, or kNoExtensionKey when there is none.
std::string extensionKey(const std::filesystem::path& file);

// True when `candidate` is `base` or lies beneath it, compared segment by segment.
bool isWithin(const std::filesystem::path& candidate, const std::filesystem::path& base);

#endif
