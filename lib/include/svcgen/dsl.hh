//
// Design DSL
//
// A design is an ordinary C++ function made of calls to the functions below.
// SVCGEN_DESIGN defines such a function and registers it with
// eval::Context::instance() during static initialization, so linking the
// design source into a program is all it takes to make it available.
//
// Usage:
// \code
//   #include <svcgen/dsl.hh>
//
//   SVCGEN_DESIGN(cellar) {
//       using namespace svcgen::dsl;
//
//       api("cellar", [] {
//           title("Cellar API");
//           version("1.0");
//       });
//
//       service("account", [] {
//           description("Manage accounts");
//           method("show", [] {
//               http("GET", "/accounts/{id}");
//           });
//       });
//   }
// \endcode
//
// Misplaced or invalid calls do not throw; they are recorded and reported
// together when eval::Context::run_dsl() finishes.
//

#pragma once

#include <svcgen/eval/context.hh>

#include <functional>
#include <string>

namespace svcgen::dsl {

using body = std::function<void()>;

/// API name and metadata. At most once per design.
void api(const std::string& name, const body& fn = {});
void title(const std::string& text);
void version(const std::string& text);

/// Applies to the enclosing api, service or method.
void description(const std::string& text);

void service(const std::string& name, const body& fn);
void method(const std::string& name, const body& fn);

/// Route of the enclosing method; path parameters are written "{name}".
void http(const std::string& verb, const std::string& path);

/// Success status of the enclosing method (default depends on the verb).
void status(int code);

}  // namespace svcgen::dsl

/**
 * Define and register a design function.
 *
 * How it works:
 * 1. Declares the design function
 * 2. A static registrar object registers it with eval::Context::instance()
 * 3. The macro ends with the function head; the braces that follow are
 *    the design body
 */
#define SVCGEN_DESIGN(Name)                                                     \
    static void svcgen_design_##Name();                                        \
    namespace {                                                                \
        struct svcgen_design_##Name##_registrar {                              \
            svcgen_design_##Name##_registrar() {                               \
                ::svcgen::eval::Context::instance().register_design(           \
                    #Name, &svcgen_design_##Name, {__FILE__, __LINE__});       \
            }                                                                  \
        };                                                                     \
        static svcgen_design_##Name##_registrar g_svcgen_design_##Name;       \
    }                                                                          \
    static void svcgen_design_##Name()
