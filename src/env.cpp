#include "objsh/env.hpp"
#include <cstdlib>
#include <string>

namespace objsh {

RuntimeEnv detectEnv(){
    RuntimeEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("OBJSH_MAX_CALL_DEPTH")) {
        char* end = nullptr;
        long n = std::strtol(v, &end, 10);
        if (end && *end=='\0' && n > 0) e.maxCallDepth = n > kMaxCallDepthCeiling ? kMaxCallDepthCeiling : (int)n;
    }

    e.traceCalls = flag_enabled("OBJSH_TRACE");
    e.traceScope = flag_enabled("OBJSH_DEBUG_SCOPE");

    // default ON if unset; explicit 0 disables
    if (const char* v = get("OBJSH_SUGGEST")) e.suggestions = (v[0] != '0');

    if (const char* v = get("OBJSH_DIAG_JSON")) e.diagJson = (std::string(v) == "1");

    return e;
}

} // namespace objsh
