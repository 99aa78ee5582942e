#include <svcgen/design/model.hh>

#include <cctype>
#include <stdexcept>

namespace svcgen::design {

bool is_http_verb(const std::string& verb) {
    return verb == "GET" || verb == "POST" || verb == "PUT" || verb == "PATCH" ||
           verb == "DELETE" || verb == "HEAD" || verb == "OPTIONS";
}

int default_status(const std::string& verb) {
    if (verb == "POST") return 201;
    if (verb == "DELETE") return 204;
    return 200;
}

std::vector<std::string> path_params(const std::string& path) {
    std::vector<std::string> params;
    std::size_t pos = 0;
    while ((pos = path.find('{', pos)) != std::string::npos) {
        const std::size_t close = path.find('}', pos);
        if (close == std::string::npos) {
            throw std::invalid_argument("unterminated parameter in path " + path);
        }
        std::string name = path.substr(pos + 1, close - pos - 1);
        if (name.empty()) {
            throw std::invalid_argument("empty parameter name in path " + path);
        }
        params.push_back(std::move(name));
        pos = close + 1;
    }
    return params;
}

std::string route_pattern(const std::string& path) {
    std::string pattern;
    std::size_t pos = 0;
    while (pos < path.size()) {
        if (path[pos] == '{') {
            const std::size_t close = path.find('}', pos);
            if (close == std::string::npos) {
                pattern += path.substr(pos);
                break;
            }
            pattern += "{}";
            pos = close + 1;
        } else {
            pattern += path[pos++];
        }
    }
    return pattern;
}

std::string pascal_case(const std::string& name) {
    std::string result;
    bool upper = true;
    for (unsigned char c : name) {
        if (!std::isalnum(c)) {
            upper = true;
            continue;
        }
        result += upper ? static_cast<char>(std::toupper(c)) : static_cast<char>(c);
        upper = false;
    }
    return result;
}

}  // namespace svcgen::design
