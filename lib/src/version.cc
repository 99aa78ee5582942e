#include <svcgen/version.hh>

namespace svcgen {

const char* version() {
    return SVCGEN_VERSION_STRING;
}

}  // namespace svcgen
