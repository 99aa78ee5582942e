#include <svcgen/dsl.hh>

namespace svcgen::dsl {

void api(const std::string& name, const body& fn) {
    eval::Context::active().define_api(name, fn);
}

void title(const std::string& text) {
    eval::Context::active().set_title(text);
}

void version(const std::string& text) {
    eval::Context::active().set_version(text);
}

void description(const std::string& text) {
    eval::Context::active().set_description(text);
}

void service(const std::string& name, const body& fn) {
    eval::Context::active().define_service(name, fn);
}

void method(const std::string& name, const body& fn) {
    eval::Context::active().define_method(name, fn);
}

void http(const std::string& verb, const std::string& path) {
    eval::Context::active().set_route(verb, path);
}

void status(int code) {
    eval::Context::active().set_status(code);
}

}  // namespace svcgen::dsl
