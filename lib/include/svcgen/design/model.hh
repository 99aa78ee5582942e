//
// Service Design Model
//
// The evaluated form of a design. One root per design; generators consume
// roots and never see the DSL that built them.
//

#pragma once

#include <string>
#include <vector>

namespace svcgen::design {

/// Location of a DSL call, "file:line" of the design function.
struct source_location {
    std::string file;
    int line = 0;

    [[nodiscard]] std::string format() const {
        return file + ":" + std::to_string(line);
    }
};

struct api_def {
    std::string name;
    std::string title;
    std::string version;
    std::string description;
};

struct method_def {
    std::string name;
    std::string description;
    std::string verb;                       ///< Upper case HTTP method
    std::string path;                       ///< "/accounts/{id}"
    std::vector<std::string> path_params;   ///< Names in path order
    int status = 0;                         ///< Success status code
    bool has_route = false;
};

struct service_def {
    std::string name;
    std::string description;
    std::vector<method_def> methods;
};

struct root {
    std::string design;                     ///< Name the design was registered under
    source_location location;
    api_def api;
    std::vector<service_def> services;

    /// Service by name, or nullptr.
    [[nodiscard]] const service_def* find_service(const std::string& name) const {
        for (const auto& s : services) {
            if (s.name == name) {
                return &s;
            }
        }
        return nullptr;
    }
};

/// HTTP methods accepted by http().
bool is_http_verb(const std::string& verb);

/// Success status used when a method does not set one.
int default_status(const std::string& verb);

/// Names of "{name}" segments in path, in order.
/// @throws std::invalid_argument on an unterminated or empty parameter
std::vector<std::string> path_params(const std::string& path);

/// "/accounts/{id}" with every parameter replaced by "{}", so that routes
/// differing only in parameter names compare equal.
std::string route_pattern(const std::string& path);

/// "account_service" -> "AccountService"
std::string pascal_case(const std::string& name);

}  // namespace svcgen::design
