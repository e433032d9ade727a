#ifndef TBMCPS_TEST_SUPPORT_HPP
#define TBMCPS_TEST_SUPPORT_HPP

// Shared helpers for the test suites: OK/FAIL reporting and scratch directories.

#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace test_support {

inline bool check(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

// A fresh directory under the system temp dir, removed on destruction.
class TempDirectory {
public:
    explicit TempDirectory(const std::string &name) {
        path_ = std::filesystem::temp_directory_path() /
                ("tbmcps_" + name + "_" + std::to_string(getpid()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    TempDirectory(const TempDirectory &) = delete;
    TempDirectory &operator=(const TempDirectory &) = delete;

    const std::filesystem::path &path() const { return path_; }

    std::string file(const std::string &file_name) const { return (path_ / file_name).string(); }

    void write(const std::string &file_name, const std::string &contents) const {
        std::ofstream stream(path_ / file_name);
        stream << contents;
    }

private:
    std::filesystem::path path_;
};

} // namespace test_support

#endif // TBMCPS_TEST_SUPPORT_HPP
