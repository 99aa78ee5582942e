//
// Project Configuration
//
// A project is the directory tree rooted at the nearest directory holding
// svcgen.yaml. The file names the root C++ namespace of generated code and
// the toolchain settings used to build the generator driver:
//
//   namespace: cellar
//   compiler: clang++
//   cxxflags: [-O0, -g]
//   include_dirs: [third_party/include]
//   library_dirs: [build/lib]
//
// Every key is optional. Relative directories are resolved against the
// project root.
//

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace svcgen {

/// File marking a project root.
inline constexpr const char* project_file_name = "svcgen.yaml";

class config_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ProjectConfig {
    std::filesystem::path root;
    std::string namespace_name;                       ///< Root namespace (never empty after loading)
    std::optional<std::string> compiler;
    std::vector<std::string> cxxflags;
    std::vector<std::filesystem::path> include_dirs;  ///< Absolute
    std::vector<std::filesystem::path> library_dirs;  ///< Absolute
};

/// Walk up from start (inclusive) to the first directory holding svcgen.yaml.
/// start does not need to exist.
std::optional<std::filesystem::path> find_project_root(const std::filesystem::path& start);

/// Load root/svcgen.yaml.
/// @throws config_error if the file cannot be read or is malformed
ProjectConfig load_project_config(const std::filesystem::path& root);

/// Parse configuration YAML. Exposed for tests.
/// @throws config_error on malformed content
ProjectConfig parse_project_config(std::istream& input, const std::filesystem::path& root);

/// Turn an arbitrary name into a C++ identifier ("my-api" -> "my_api").
std::string to_identifier(const std::string& name);

/// True for "a" and "a::b::c" made of identifiers.
bool is_namespace_name(const std::string& name);

}  // namespace svcgen
