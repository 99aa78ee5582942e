#include <svcgen/pipeline/workspace.hh>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace svcgen::pipeline {

namespace fs = std::filesystem;

Workspace::Workspace(const fs::path& parent) {
    std::error_code ec;
    const fs::path base = fs::absolute(parent, ec);
    if (ec || !fs::is_directory(base, ec)) {
        throw workspace_error("cannot create workspace: " + parent.string() + " is not a directory");
    }

    std::string pattern = (base / "svcgen-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        throw workspace_error("cannot create workspace in " + base.string() + ": " + std::strerror(errno));
    }
    path_ = fs::path(buffer.data());
}

Workspace::~Workspace() {
    if (keep_ || path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
}

}  // namespace svcgen::pipeline
