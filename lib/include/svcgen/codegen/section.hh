//
// Templates and Sections
//
// A Template is a named render function over one data type. Templates are
// built once and shared; a Section binds a template to one data value and is
// the unit a File is assembled from.
//
// Usage:
// \code
//   static const auto tmpl = make_template<std::string>("greeting",
//       [](CppCodeWriter& w, const std::string& name) {
//           w.write_line("// hello " + name);
//       });
//   Section s(tmpl, std::string("world"));
//   s.write(out);
// \endcode
//

#pragma once

#include <svcgen/codegen/cpp_code_writer.hh>

#include <functional>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace svcgen::codegen {

// ============================================================================
// Errors
// ============================================================================

/**
 * Thrown when a template fails while rendering.
 *
 * The message is "template <name>: <original message>" so the failure from
 * inside the render function reaches the caller unchanged.
 */
class render_error : public std::runtime_error {
public:
    render_error(const std::string& template_name, const std::string& message)
        : std::runtime_error("template " + template_name + ": " + message),
          template_name_(template_name) {}

    [[nodiscard]] const std::string& template_name() const { return template_name_; }

private:
    std::string template_name_;
};

// ============================================================================
// Template
// ============================================================================

template<typename Data>
class Template {
public:
    using render_fn = std::function<void(CppCodeWriter&, const Data&)>;

    Template(std::string name, render_fn fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    [[nodiscard]] const std::string& name() const { return name_; }

    /// Render data into out. Failures are rethrown as render_error.
    void execute(std::ostream& out, const Data& data) const {
        CppCodeWriter writer(out);
        try {
            fn_(writer, data);
        } catch (const render_error&) {
            throw;
        } catch (const std::exception& e) {
            throw render_error(name_, e.what());
        }
    }

private:
    std::string name_;
    render_fn fn_;
};

template<typename Data>
std::shared_ptr<const Template<Data>> make_template(
    std::string name, typename Template<Data>::render_fn fn)
{
    return std::make_shared<const Template<Data>>(std::move(name), std::move(fn));
}

// ============================================================================
// Section
// ============================================================================

class Section {
public:
    template<typename Data>
    Section(std::shared_ptr<const Template<Data>> tmpl, Data data)
        : template_name_(tmpl->name()),
          render_([tmpl = std::move(tmpl), data = std::move(data)](std::ostream& out) {
              tmpl->execute(out, data);
          }) {}

    /// Render the section into out.
    void write(std::ostream& out) const { render_(out); }

    [[nodiscard]] const std::string& template_name() const { return template_name_; }

private:
    std::string template_name_;
    std::function<void(std::ostream&)> render_;
};

}  // namespace svcgen::codegen
