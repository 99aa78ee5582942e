#pragma once

namespace svcgen {

/// Version of the svcgen library. A generator driver compiles this value in
/// and refuses to run when the orchestrator that built it reports another.
const char* version();

}  // namespace svcgen
