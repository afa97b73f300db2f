#include "objsh/ast.hpp"

namespace objsh::ast {

const char* operator_name(BinaryOperator op){
    switch(op){
        case BinaryOperator::Add: return "addition";
        case BinaryOperator::Sub: return "subtraction";
        case BinaryOperator::Mul: return "multiplication";
        case BinaryOperator::Div: return "division";
        case BinaryOperator::Mod: return "modulo";
        case BinaryOperator::Eq: return "equality";
        case BinaryOperator::Ne: return "inequality";
        case BinaryOperator::Gt: return "greater-than comparison";
        case BinaryOperator::Lt: return "less-than comparison";
        case BinaryOperator::Ge: return "greater-or-equal comparison";
        case BinaryOperator::Le: return "less-or-equal comparison";
    }
    return "operation";
}

const char* operator_symbol(BinaryOperator op){
    switch(op){
        case BinaryOperator::Add: return "+";
        case BinaryOperator::Sub: return "-";
        case BinaryOperator::Mul: return "*";
        case BinaryOperator::Div: return "/";
        case BinaryOperator::Mod: return "%";
        case BinaryOperator::Eq: return "-eq";
        case BinaryOperator::Ne: return "-ne";
        case BinaryOperator::Gt: return "-gt";
        case BinaryOperator::Lt: return "-lt";
        case BinaryOperator::Ge: return "-ge";
        case BinaryOperator::Le: return "-le";
    }
    return "?";
}

} // namespace objsh::ast
