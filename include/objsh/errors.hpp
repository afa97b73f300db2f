// Runtime diagnostics: error kinds, stable codes, notes, and the reporter used by the evaluator.
#pragma once
#include <string>
#include <vector>
#include <stdexcept>

namespace objsh {

enum class ErrorKind {
    UndefinedVariable,
    TypeMismatch,
    DivisionByZero,
    CommandNotFound,
    InvalidPropertyAccess,
    ReturnOutsideFunction,
    RecursionLimit,
    InvalidOperation
};

const char* error_kind_name(ErrorKind k);

struct ErrorNote { std::string message; int line=-1; int col=-1; };

struct Diagnostic {
    ErrorKind kind = ErrorKind::InvalidOperation;
    std::string code;
    std::string message;
    std::string hint;
    std::string subject; // variable/command/property name the error is about
    int line=-1;
    int col=-1;
    std::vector<ErrorNote> notes;
};

// Thrown through expression, statement, call and pipeline layers; converted to EvalResult at the boundary.
class RuntimeError : public std::runtime_error {
public:
    explicit RuntimeError(Diagnostic d): std::runtime_error(d.message), diag_(std::move(d)) {}
    ErrorKind kind() const { return diag_.kind; }
    const std::string& code() const { return diag_.code; }
    const Diagnostic& diagnostic() const { return diag_; }
    Diagnostic& diagnostic() { return diag_; }
private:
    Diagnostic diag_;
};

namespace errors {
RuntimeError undefined_variable(const std::string& name);
RuntimeError type_mismatch(const std::string& operation, const std::string& expected, const std::string& got);
RuntimeError division_by_zero();
RuntimeError command_not_found(const std::string& name);
RuntimeError property_not_found(const std::string& name, const std::string& base_kind);
RuntimeError not_a_record(const std::string& name, const std::string& base_kind);
RuntimeError return_outside_function();
RuntimeError recursion_limit(const std::string& function, int limit);
RuntimeError invalid_operation(std::string message, std::string hint = "");
}

// Suggestion helpers ("did you mean ...").
int edit_distance(const std::string& a, const std::string& b);
std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist=2);
void append_suggestions(Diagnostic& d, const std::vector<std::string>& suggs, bool enabled);

// Single-line human readable form: "error[E0101]: Variable '$x' is not defined (line 1, col 5)".
std::string format_diagnostic(const Diagnostic& d);

} // namespace objsh
