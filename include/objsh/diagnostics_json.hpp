// diagnostics_json.hpp - JSON serialization for evaluation results
#pragma once
#include "objsh/env.hpp"
#include "objsh/errors.hpp"
#include "objsh/evaluator.hpp"
#include <string>

namespace objsh {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a single diagnostic / a whole result to a compact JSON string.
std::string diagnostic_to_json(const Diagnostic& d);
std::string diagnostics_to_json(const EvalResult& r);

// If env.diagJson is set, print diagnostics JSON to stderr.
void maybe_print_json(const EvalResult& r, const RuntimeEnv& env);

} // namespace objsh
