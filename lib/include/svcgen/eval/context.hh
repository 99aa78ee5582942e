//
// Design Evaluation
//
// Designs are C++ functions registered with a Context (usually through
// SVCGEN_DESIGN, see dsl.hh). run_dsl() executes every registered design,
// collecting the calls of the svcgen::dsl functions into one design::root
// per design, and validates the result. All problems of a run are reported
// together in a single eval_error.
//

#pragma once

#include <svcgen/design/model.hh>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace svcgen::eval {

// ============================================================================
// Diagnostics
// ============================================================================

struct diagnostic {
    std::string code;                   ///< "D001".."D099"
    std::string message;
    std::string scope;                  ///< e.g. service "account", method "show"
    design::source_location location;   ///< Design function location

    /// "file:line: error D004: service \"a\": duplicate service"
    [[nodiscard]] std::string format() const;
};

class eval_error : public std::runtime_error {
public:
    explicit eval_error(std::vector<diagnostic> diagnostics);
    explicit eval_error(const std::string& message);

    [[nodiscard]] const std::vector<diagnostic>& diagnostics() const { return diagnostics_; }

private:
    std::vector<diagnostic> diagnostics_;
};

// ============================================================================
// Context
// ============================================================================

class Context {
public:
    using design_fn = std::function<void()>;

    /// Context SVCGEN_DESIGN registers into.
    static Context& instance();

    Context();
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    void register_design(std::string name, design_fn fn, design::source_location location = {});
    [[nodiscard]] std::size_t design_count() const { return designs_.size(); }

    /**
     * Evaluate every registered design, in name order.
     * @throws eval_error listing every diagnostic of the run
     */
    void run_dsl();

    /**
     * Roots produced by the last successful run_dsl().
     * @throws eval_error if run_dsl() has not succeeded or produced no root
     */
    [[nodiscard]] std::vector<const design::root*> roots() const;

    // ========================================================================
    // DSL hooks (called by svcgen::dsl)
    // ========================================================================

    /// Context evaluating a design right now.
    /// @throws eval_error when called outside run_dsl()
    static Context& active();

    void define_api(const std::string& name, const design_fn& fn);
    void define_service(const std::string& name, const design_fn& fn);
    void define_method(const std::string& name, const design_fn& fn);
    void set_title(const std::string& title);
    void set_version(const std::string& version);
    void set_description(const std::string& text);
    void set_route(const std::string& verb, const std::string& path);
    void set_status(int status);

private:
    enum class scope_kind { design, api, service, method };

    struct registration {
        std::string name;
        design_fn fn;
        design::source_location location;
    };

    struct scope {
        scope_kind kind = scope_kind::design;
        std::size_t service = 0;
        std::size_t method = 0;
    };

    std::vector<registration> designs_;
    std::vector<std::unique_ptr<design::root>> roots_;
    bool evaluated_ = false;

    // State of the design being evaluated
    design::root* current_ = nullptr;
    const registration* current_design_ = nullptr;
    scope scope_;
    bool api_defined_ = false;
    std::vector<diagnostic> diagnostics_;

    void evaluate(const registration& reg);
    void validate(const design::root& root);
    void run_in_scope(scope inner, const design_fn& fn);
    bool expect_scope(const char* function, std::initializer_list<scope_kind> allowed);
    void report(const std::string& code, const std::string& message);
    [[nodiscard]] std::string describe_scope() const;
    [[nodiscard]] design::method_def& current_method();
};

}  // namespace svcgen::eval
