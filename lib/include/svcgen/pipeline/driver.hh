//
// Generator Synthesis
//
// Builds the source of the generator driver: a program that evaluates one
// design and runs the selected generators over it. The design source is
// compiled into the driver by including it, so its SVCGEN_DESIGN registers
// itself before main() runs.
//
// The driver accepts exactly two flags, both mandatory:
//
//   svcgen-driver --output=<dir> --version=<svcgen version>
//
// and refuses to run when --version differs from the svcgen version it was
// compiled against. On success it prints the written paths, sorted, one per
// line. Every failure is reported on stderr with exit status 1.
//

#pragma once

#include <svcgen/codegen/file.hh>
#include <svcgen/generators/generators.hh>

#include <filesystem>
#include <memory>
#include <vector>

namespace svcgen::pipeline {

/// Name of the driver source inside the workspace.
inline constexpr const char* driver_source_name = "main.cc";

struct DriverSpec {
    std::vector<generators::GeneratorKind> generators;  ///< In invocation order
    std::filesystem::path design;                       ///< Absolute design source
    bool scaffold = false;                              ///< Also run the scaffold generator
    std::vector<std::filesystem::path> include_dirs;    ///< Given to the writer for normalization
};

/// Generators the driver runs, scaffold appended when requested.
std::vector<generators::GeneratorKind> driver_generators(const DriverSpec& spec);

/// The driver main.cc for spec.
std::unique_ptr<codegen::File> driver_file(const DriverSpec& spec);

}  // namespace svcgen::pipeline
