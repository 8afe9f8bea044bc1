#ifndef FACMATCH_TESTS_COMMON_CLEANUP_HPP
#define FACMATCH_TESTS_COMMON_CLEANUP_HPP

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>

namespace testing {
namespace cleanup {

/**
 * RAII structure to remove a file upon destruction.
 *
 * Per default will also make sure that the file does not exist
 * when it is constructed.
 */
class file_t {
public:
    file_t(const std::string& filename, bool remove_on_construct = true)
        : filename_(filename) {
        if (remove_on_construct) {
            deleteFile(false);
        }
    }

    ~file_t() noexcept { deleteFile(true); }

    const std::string& path() const { return filename_; }

private:
    void deleteFile(bool warn) const noexcept {
        if (filename_.empty()) {
            return;
        }

        std::error_code ec;
        std::filesystem::remove(filename_, ec);
        if (ec && warn) {
            std::cerr << "WARNING: Unable to remove \"" << filename_ << "\": " << ec.message() << std::endl;
        }
    }

    std::string filename_;
};

} // namespace cleanup

// Write text content to a file, replacing it
inline void writeTextFile(const std::string& filename, const std::string& content) {
    std::ofstream file(filename, std::ios::trunc);
    file << content;
}

inline std::string readTextFile(const std::string& filename) {
    std::ifstream file(filename);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace testing

#endif // FACMATCH_TESTS_COMMON_CLEANUP_HPP
