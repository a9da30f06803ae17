#pragma once

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace tether::tests {

// Scratch directory removed on destruction. Unique per process so parallel
// ctest runs do not collide.
class TempDir {
public:
    explicit TempDir(const std::string &name) {
        path_ = std::filesystem::temp_directory_path() / ("tether_" + name + "_" + std::to_string(getpid()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

    std::filesystem::path write_file(const std::string &relative, const std::string &content) const {
        auto file_path = path_ / relative;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream out(file_path);
        out << content;
        out.close();
        return file_path;
    }

    // Write a /bin/sh script and mark it executable
    std::filesystem::path write_script(const std::string &relative, const std::string &body) const {
        auto script_path = write_file(relative, "#!/bin/sh\n" + body);
        std::filesystem::permissions(script_path,
                                     std::filesystem::perms::owner_exec | std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::add);
        return script_path;
    }

private:
    std::filesystem::path path_;
};

}  // namespace tether::tests
