#ifndef TEMP_TREE_HPP
#define TEMP_TREE_HPP

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <unistd.h>

// Scratch directory for one test, removed again when the test ends.
class TempTree {
public:
    TempTree() {
        static std::atomic<unsigned> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string testName = info ? info->name() : "unnamed";
        m_root = std::filesystem::temp_directory_path() /
                 ("sortify-" + testName + "-" + std::to_string(getpid()) + "-" + std::to_string(counter++));
        std::filesystem::remove_all(m_root);
        std::filesystem::create_directories(m_root);
        m_root = std::filesystem::canonical(m_root);
    }

    ~TempTree() {
        std::error_code ec;
        std::filesystem::remove_all(m_root, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    const std::filesystem::path& root() const { return m_root; }

    std::filesystem::path write(const std::filesystem::path& relative, const std::string& contents = "data") const {
        const auto path = m_root / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path;
    }

    std::string read(const std::filesystem::path& relative) const {
        std::ifstream in(m_root / relative, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    bool exists(const std::filesystem::path& relative) const {
        return std::filesystem::exists(m_root / relative);
    }

    std::size_t countFiles() const {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(m_root)) {
            if (entry.is_regular_file()) {
                ++count;
            }
        }
        return count;
    }

private:
    std::filesystem::path m_root;
};

#endif
