#pragma once

#include <filesystem>
#include <stdexcept>

namespace svcgen::pipeline {

class workspace_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Unique staging directory "svcgen-XXXXXX" below a parent directory.
 *
 * The directory and everything in it is removed on destruction unless
 * keep() was called.
 */
class Workspace {
public:
    /// @throws workspace_error if the directory cannot be created
    explicit Workspace(const std::filesystem::path& parent);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    /// Leave the directory on disk.
    void keep() { keep_ = true; }
    [[nodiscard]] bool kept() const { return keep_; }

private:
    std::filesystem::path path_;
    bool keep_ = false;
};

}  // namespace svcgen::pipeline
