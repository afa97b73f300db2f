// Runtime configuration read from OBJSH_* environment variables.
#pragma once
#include <cstdlib>

namespace objsh {

// Each script-level call nests a dozen or so native frames; deeper limits overflow the stack.
constexpr int kMaxCallDepthCeiling = 1000;

struct RuntimeEnv {
    int maxCallDepth = 256;   // OBJSH_MAX_CALL_DEPTH
    bool traceCalls = false;  // OBJSH_TRACE: function calls and pipeline stages
    bool traceScope = false;  // OBJSH_DEBUG_SCOPE: frame push/pop
    bool suggestions = true;  // OBJSH_SUGGEST (0 disables)
    bool diagJson = false;    // OBJSH_DIAG_JSON=1
};

inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

// Reads process env vars once; callers keep the struct.
RuntimeEnv detectEnv();

} // namespace objsh
