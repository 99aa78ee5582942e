//
// Generators
//
// A generator turns the evaluated design roots into Files. Each one either
// returns all of its files or throws; nothing is written until every
// selected generator has succeeded.
//
//   server    gen/services/<svc>.hh, gen/transport/<svc>_http_server.hh
//   client    gen/transport/<svc>_http_client.hh
//   openapi   gen/openapi.yaml (one document per root)
//   scaffold  <svc>_service.cc, never overwritten
//

#pragma once

#include <svcgen/codegen/file.hh>
#include <svcgen/design/model.hh>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace svcgen::generators {

using file_list = std::vector<std::unique_ptr<codegen::File>>;

/// Message is "<generator>: <message>".
class generator_error : public std::runtime_error {
public:
    generator_error(const std::string& generator, const std::string& message)
        : std::runtime_error(generator + ": " + message), generator_(generator) {}

    [[nodiscard]] const std::string& generator() const { return generator_; }

private:
    std::string generator_;
};

enum class GeneratorKind {
    Server,
    Client,
    OpenAPI,
    Scaffold
};

/// "server", "client", "openapi", "scaffold"
const char* generator_name(GeneratorKind kind);

/// Inverse of generator_name.
/// @throws std::invalid_argument for any other name
GeneratorKind parse_generator_kind(const std::string& name);

/// Fully qualified name of the generator function, for generated code.
std::string generator_function(GeneratorKind kind);

file_list server(const std::vector<const design::root*>& roots);
file_list client(const std::vector<const design::root*>& roots);
file_list openapi(const std::vector<const design::root*>& roots);
file_list scaffold(const std::vector<const design::root*>& roots);

/// Run the generator of kind.
file_list generate(GeneratorKind kind, const std::vector<const design::root*>& roots);

}  // namespace svcgen::generators
