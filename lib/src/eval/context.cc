//
// Design evaluation and validation
//

#include <svcgen/eval/context.hh>
#include <svcgen/project.hh>

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace svcgen::eval {

namespace {

Context* active_context = nullptr;

/// Marks a context active for the duration of run_dsl().
class ActiveGuard {
public:
    explicit ActiveGuard(Context* ctx) : previous_(active_context) { active_context = ctx; }
    ~ActiveGuard() { active_context = previous_; }

    ActiveGuard(const ActiveGuard&) = delete;
    ActiveGuard& operator=(const ActiveGuard&) = delete;

private:
    Context* previous_;
};

bool is_identifier(const std::string& name) {
    return !name.empty() && to_identifier(name) == name;
}

std::string quote_name(const std::string& s) {
    return "\"" + s + "\"";
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string format_all(const std::vector<diagnostic>& diagnostics) {
    std::ostringstream oss;
    oss << "design evaluation failed with " << diagnostics.size()
        << (diagnostics.size() == 1 ? " error" : " errors") << ":";
    for (const auto& d : diagnostics) {
        oss << "\n" << d.format();
    }
    return oss.str();
}

}  // namespace

// ============================================================================
// Diagnostics
// ============================================================================

std::string diagnostic::format() const {
    std::ostringstream oss;
    if (!location.file.empty()) {
        oss << location.format() << ": ";
    }
    oss << "error " << code << ": ";
    if (!scope.empty()) {
        oss << scope << ": ";
    }
    oss << message;
    return oss.str();
}

eval_error::eval_error(std::vector<diagnostic> diagnostics)
    : std::runtime_error(format_all(diagnostics))
    , diagnostics_(std::move(diagnostics))
{
}

eval_error::eval_error(const std::string& message)
    : std::runtime_error(message)
{
}

// ============================================================================
// Registration and Evaluation
// ============================================================================

Context& Context::instance() {
    static Context context;
    return context;
}

Context::Context() = default;
Context::~Context() = default;

void Context::register_design(std::string name, design_fn fn, design::source_location location) {
    designs_.push_back({std::move(name), std::move(fn), std::move(location)});
}

void Context::run_dsl() {
    roots_.clear();
    evaluated_ = false;
    diagnostics_.clear();

    if (designs_.empty()) {
        throw eval_error("no design registered; define one with SVCGEN_DESIGN");
    }

    std::vector<const registration*> order;
    for (const auto& reg : designs_) {
        order.push_back(&reg);
    }
    std::stable_sort(order.begin(), order.end(),
                     [](const registration* a, const registration* b) { return a->name < b->name; });

    ActiveGuard guard(this);
    std::set<std::string> seen;
    for (const auto* reg : order) {
        if (!seen.insert(reg->name).second) {
            current_design_ = reg;
            scope_ = {};
            current_ = nullptr;
            report("D020", "design " + quote_name(reg->name) + " is registered more than once");
            continue;
        }
        evaluate(*reg);
    }
    current_ = nullptr;
    current_design_ = nullptr;

    if (!diagnostics_.empty()) {
        roots_.clear();
        auto diagnostics = std::move(diagnostics_);
        diagnostics_.clear();
        throw eval_error(std::move(diagnostics));
    }
    evaluated_ = true;
}

std::vector<const design::root*> Context::roots() const {
    if (!evaluated_) {
        throw eval_error("design roots requested before the DSL ran successfully");
    }
    if (roots_.empty()) {
        throw eval_error("the DSL produced no design root");
    }
    std::vector<const design::root*> result;
    result.reserve(roots_.size());
    for (const auto& r : roots_) {
        result.push_back(r.get());
    }
    return result;
}

void Context::evaluate(const registration& reg) {
    auto root = std::make_unique<design::root>();
    root->design = reg.name;
    root->location = reg.location;
    root->api.name = reg.name;

    current_ = root.get();
    current_design_ = &reg;
    scope_ = {};
    api_defined_ = false;

    const std::size_t before = diagnostics_.size();
    try {
        reg.fn();
    } catch (const eval_error&) {
        throw;
    } catch (const std::exception& e) {
        report("D000", std::string("design function threw: ") + e.what());
    }

    scope_ = {};
    validate(*root);
    if (diagnostics_.size() == before) {
        roots_.push_back(std::move(root));
    }
}

void Context::validate(const design::root& root) {
    if (root.services.empty()) {
        report("D012", "design defines no service");
        return;
    }

    std::set<std::string> routes;
    for (const auto& service : root.services) {
        if (service.methods.empty()) {
            diagnostics_.push_back({"D013", "service defines no method",
                                    "service " + quote_name(service.name), root.location});
        }
        for (const auto& method : service.methods) {
            const std::string where = "service " + quote_name(service.name) + ", method " + quote_name(method.name);
            if (!method.has_route) {
                diagnostics_.push_back({"D014", "method has no HTTP route", where, root.location});
                continue;
            }
            const std::string route = method.verb + " " + design::route_pattern(method.path);
            if (!routes.insert(route).second) {
                diagnostics_.push_back({"D015", "route " + method.verb + " " + method.path +
                                        " is already used by another method", where, root.location});
            }
        }
    }
}

// ============================================================================
// DSL hooks
// ============================================================================

Context& Context::active() {
    if (active_context == nullptr || active_context->current_ == nullptr) {
        throw eval_error("DSL functions may only be called while a design is evaluated");
    }
    return *active_context;
}

void Context::report(const std::string& code, const std::string& message) {
    diagnostic d;
    d.code = code;
    d.message = message;
    d.scope = describe_scope();
    if (current_design_) {
        d.location = current_design_->location;
    }
    diagnostics_.push_back(std::move(d));
}

std::string Context::describe_scope() const {
    if (current_ == nullptr) {
        return current_design_ ? "design " + quote_name(current_design_->name) : "";
    }
    switch (scope_.kind) {
        case scope_kind::design:
            return "design " + quote_name(current_->design);
        case scope_kind::api:
            return "api " + quote_name(current_->api.name);
        case scope_kind::service:
            return "service " + quote_name(current_->services[scope_.service].name);
        case scope_kind::method: {
            const auto& service = current_->services[scope_.service];
            return "service " + quote_name(service.name) + ", method " +
                   quote_name(service.methods[scope_.method].name);
        }
    }
    return "";
}

bool Context::expect_scope(const char* function, std::initializer_list<scope_kind> allowed) {
    if (std::find(allowed.begin(), allowed.end(), scope_.kind) != allowed.end()) {
        return true;
    }
    report("D001", std::string(function) + "() is not allowed here");
    return false;
}

void Context::run_in_scope(scope inner, const design_fn& fn) {
    const scope outer = scope_;
    scope_ = inner;
    try {
        if (fn) {
            fn();
        }
    } catch (...) {
        scope_ = outer;
        throw;
    }
    scope_ = outer;
}

design::method_def& Context::current_method() {
    return current_->services[scope_.service].methods[scope_.method];
}

void Context::define_api(const std::string& name, const design_fn& fn) {
    if (!expect_scope("api", {scope_kind::design})) {
        return;
    }
    if (api_defined_) {
        report("D002", "api is already defined");
        return;
    }
    if (name.empty()) {
        report("D003", "api name must not be empty");
        return;
    }
    api_defined_ = true;
    current_->api.name = name;
    run_in_scope({scope_kind::api, 0, 0}, fn);
}

void Context::define_service(const std::string& name, const design_fn& fn) {
    if (!expect_scope("service", {scope_kind::design})) {
        return;
    }
    if (!is_identifier(name)) {
        report("D003", "service name " + quote_name(name) + " is not an identifier");
        return;
    }
    if (current_->find_service(name) != nullptr) {
        report("D004", "service " + quote_name(name) + " is already defined");
        return;
    }
    design::service_def service;
    service.name = name;
    current_->services.push_back(std::move(service));
    run_in_scope({scope_kind::service, current_->services.size() - 1, 0}, fn);
}

void Context::define_method(const std::string& name, const design_fn& fn) {
    if (!expect_scope("method", {scope_kind::service})) {
        return;
    }
    auto& service = current_->services[scope_.service];
    if (!is_identifier(name)) {
        report("D003", "method name " + quote_name(name) + " is not an identifier");
        return;
    }
    for (const auto& m : service.methods) {
        if (m.name == name) {
            report("D005", "method " + quote_name(name) + " is already defined");
            return;
        }
    }
    design::method_def method;
    method.name = name;
    service.methods.push_back(std::move(method));
    run_in_scope({scope_kind::method, scope_.service, service.methods.size() - 1}, fn);
}

void Context::set_title(const std::string& title) {
    if (expect_scope("title", {scope_kind::api})) {
        current_->api.title = title;
    }
}

void Context::set_version(const std::string& version) {
    if (expect_scope("version", {scope_kind::api})) {
        current_->api.version = version;
    }
}

void Context::set_description(const std::string& text) {
    if (!expect_scope("description", {scope_kind::api, scope_kind::service, scope_kind::method})) {
        return;
    }
    switch (scope_.kind) {
        case scope_kind::api:
            current_->api.description = text;
            break;
        case scope_kind::service:
            current_->services[scope_.service].description = text;
            break;
        case scope_kind::method:
            current_method().description = text;
            break;
        case scope_kind::design:
            break;
    }
}

void Context::set_route(const std::string& verb, const std::string& path) {
    if (!expect_scope("http", {scope_kind::method})) {
        return;
    }
    auto& method = current_method();
    if (method.has_route) {
        report("D010", "method already has an HTTP route");
        return;
    }
    const std::string canonical = upper(verb);
    if (!design::is_http_verb(canonical)) {
        report("D006", "invalid HTTP method " + quote_name(verb));
        return;
    }
    if (path.empty() || path.front() != '/') {
        report("D007", "path " + quote_name(path) + " must start with '/'");
        return;
    }
    if (std::any_of(path.begin(), path.end(), [](unsigned char c) { return std::iscntrl(c) != 0; })) {
        report("D007", "path " + quote_name(path) + " contains a control character");
        return;
    }

    std::vector<std::string> params;
    try {
        params = design::path_params(path);
    } catch (const std::invalid_argument& e) {
        report("D008", e.what());
        return;
    }
    std::set<std::string> unique;
    for (const auto& p : params) {
        if (!is_identifier(p)) {
            report("D008", "path parameter " + quote_name(p) + " is not an identifier");
            return;
        }
        if (!unique.insert(p).second) {
            report("D009", "path parameter " + quote_name(p) + " appears more than once");
            return;
        }
    }

    method.verb = canonical;
    method.path = path;
    method.path_params = std::move(params);
    method.has_route = true;
    if (method.status == 0) {
        method.status = design::default_status(canonical);
    }
}

void Context::set_status(int status) {
    if (!expect_scope("status", {scope_kind::method})) {
        return;
    }
    if (status < 100 || status > 599) {
        report("D011", "status " + std::to_string(status) + " is not an HTTP status code");
        return;
    }
    current_method().status = status;
}

}  // namespace svcgen::eval
