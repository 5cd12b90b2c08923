/**
 * @file UbcTestFiles.h
 * @brief Scratch files for reader tests
 */

#ifndef UBCIO_TEST_FILES_H
#define UBCIO_TEST_FILES_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace ubcio {
namespace test {

/// Writes text to a unique file under the temp directory and removes it on destruction.
class ScratchFile {
public:
    ScratchFile(std::string_view tag, const std::string& contents)
        : path_(make_unique_path(tag))
    {
        std::ofstream out(path_);
        out << contents;
    }

    ~ScratchFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;

    static std::filesystem::path make_unique_path(std::string_view tag)
    {
        static std::atomic<int> counter{0};
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        const std::string name = "ubcio_" + std::to_string(now) + "_" +
                                 std::to_string(counter++) + "_" + std::string(tag);
        return std::filesystem::temp_directory_path() / name;
    }
};

/// A path under the temp directory that does not exist.
inline std::string missing_path(std::string_view tag)
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return (std::filesystem::temp_directory_path() /
            ("ubcio_missing_" + std::to_string(now) + "_" + std::string(tag))).string();
}

} // namespace test
} // namespace ubcio

#endif // UBCIO_TEST_FILES_H
