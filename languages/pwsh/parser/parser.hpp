#pragma once
#include "objsh/ast.hpp"
#include <string>
#include <string_view>

namespace pwsh {

struct ParseResult {
    bool success{false};
    objsh::ast::Program program;  // Lowered syntax tree
    std::string error_message;    // If !success, human-readable message
    int line{0};
    int column{0};
};

class Parser {
public:
    // Parse script text into statements. Never throws; failures are reported in the result.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;
};

// False while braces, parens or quotes are still open (interactive continuation lines).
bool is_complete_input(std::string_view src);

} // namespace pwsh
