//
// Transport Runtime
//
// Minimal HTTP-shaped types the generated transport code is written against.
// There is no network layer: a ServeMux dispatches Requests to Handlers in
// process and a Doer is whatever sends a Request somewhere and returns the
// Response.
//

#pragma once

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace svcgen::rest {

struct Request {
    std::string method;
    std::string host;
    std::string path;
    std::map<std::string, std::string> params;    ///< Path parameters filled by ServeMux
    std::map<std::string, std::string> headers;
    std::string body;
};

struct Response {
    int status = 0;                               ///< 0 until a handler sets it
    std::map<std::string, std::string> headers;
    std::string body;
};

using Handler = std::function<Response(const Request&)>;

/// Sends requests for generated clients.
class Doer {
public:
    virtual ~Doer() = default;
    virtual Response execute(const Request& request) = 0;
};

/// Percent-encode a path segment.
inline std::string escape_path(const std::string& segment) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : segment) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

/// Routes "/accounts/{id}" style patterns to handlers.
class ServeMux {
public:
    void handle(const std::string& method, const std::string& pattern, Handler handler) {
        routes_.push_back({method, split(pattern), std::move(handler)});
    }

    /// 404 when no pattern matches the path, 405 when only the method differs.
    [[nodiscard]] Response serve(Request request) const {
        const auto segments = split(request.path);
        bool path_matched = false;
        for (const auto& route : routes_) {
            std::map<std::string, std::string> params;
            if (!match(route.segments, segments, params)) {
                continue;
            }
            path_matched = true;
            if (route.method != request.method) {
                continue;
            }
            request.params = std::move(params);
            return route.handler(request);
        }
        return path_matched ? Response{405, {}, "method not allowed"}
                            : Response{404, {}, "not found"};
    }

    [[nodiscard]] std::size_t size() const { return routes_.size(); }

private:
    struct route {
        std::string method;
        std::vector<std::string> segments;
        Handler handler;
    };

    std::vector<route> routes_;

    static std::vector<std::string> split(const std::string& path) {
        std::vector<std::string> parts;
        std::string current;
        for (char c : path) {
            if (c == '/') {
                if (!current.empty()) {
                    parts.push_back(std::move(current));
                    current.clear();
                }
            } else {
                current += c;
            }
        }
        if (!current.empty()) {
            parts.push_back(std::move(current));
        }
        return parts;
    }

    static bool match(const std::vector<std::string>& pattern,
                      const std::vector<std::string>& segments,
                      std::map<std::string, std::string>& params) {
        if (pattern.size() != segments.size()) {
            return false;
        }
        for (std::size_t i = 0; i < pattern.size(); ++i) {
            const std::string& p = pattern[i];
            if (p.size() > 2 && p.front() == '{' && p.back() == '}') {
                params[p.substr(1, p.size() - 2)] = segments[i];
            } else if (p != segments[i]) {
                return false;
            }
        }
        return true;
    }
};

}  // namespace svcgen::rest
