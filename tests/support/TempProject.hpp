#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace sf_boost {
namespace test_support {

/**
 * @brief Scratch directory removed again when the test ends
 *
 * Named after the running test and the process id, so test binaries can run
 * in parallel.
 */
class TempProject {
public:
    TempProject() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "sf_boost_";
        if (info != nullptr) {
            name += std::string(info->test_suite_name()) + "_" + info->name() + "_";
        }
        name += std::to_string(::getpid());

        root_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }

    ~TempProject() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempProject(const TempProject&) = delete;
    TempProject& operator=(const TempProject&) = delete;

    const std::filesystem::path& root() const { return root_; }

    /**
     * @brief Create (or overwrite) a file below the root, creating parents
     */
    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        std::filesystem::path file = root_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
        return file;
    }

    std::string read(const std::string& relative) const {
        std::ifstream in(root_ / relative, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path root_;
};

} // namespace test_support
} // namespace sf_boost
