// Syntax tree consumed by the evaluator. Produced by the language front-end or built directly.
#pragma once
#include "objsh/value.hpp"
#include <string>
#include <variant>
#include <vector>
#include <memory>
#include <utility>
#include <initializer_list>

namespace objsh::ast
{

    enum class BinaryOperator
    {
        Add,
        Sub,
        Mul,
        Div,
        Mod,
        Eq,
        Ne,
        Gt,
        Lt,
        Ge,
        Le
    };
    enum class UnaryOperator
    {
        Negate,
        Not
    };

    const char *operator_name(BinaryOperator op);
    const char *operator_symbol(BinaryOperator op);

    struct Literal
    {
        Value value;
    };
    struct VariableRef
    {
        std::string name; // may carry a scope qualifier
    };
    struct BinaryOp
    {
        BinaryOperator op;
        ExprPtr lhs;
        ExprPtr rhs;
    };
    struct UnaryOp
    {
        UnaryOperator op;
        ExprPtr operand;
    };
    // Each part is either literal text or an embedded expression.
    struct InterpolationPart
    {
        std::string text;
        ExprPtr expr;
    };
    struct StringInterpolation
    {
        std::vector<InterpolationPart> parts;
    };
    struct MemberAccess
    {
        ExprPtr object;
        std::string member;
    };
    struct RecordLiteral
    {
        std::vector<std::pair<std::string, ExprPtr>> entries;
    };
    struct ListLiteral
    {
        std::vector<ExprPtr> elements;
    };
    struct BlockLiteral
    {
        StmtList body;
    };
    struct NamedArgument
    {
        std::string name;
        ExprPtr value;
    };
    struct Call
    {
        std::string name;
        std::vector<ExprPtr> positional;
        std::vector<NamedArgument> named;
    };
    struct PipelineExpr
    {
        std::vector<ExprPtr> stages;
    };

    using expr_data = std::variant<Literal, VariableRef, BinaryOp, UnaryOp, StringInterpolation, MemberAccess,
                                   RecordLiteral, ListLiteral, BlockLiteral, Call, PipelineExpr>;

    struct Expr
    {
        expr_data data;
        int line = -1;
        int col = -1;
    };

    struct ExprStmt
    {
        ExprPtr expr;
    };
    struct Assignment
    {
        std::string target;
        ExprPtr value;
    };
    struct FunctionDef
    {
        std::string name;
        std::vector<Parameter> params;
        StmtList body;
    };
    struct If
    {
        ExprPtr condition;
        StmtList then_branch;
        StmtList else_branch;
        bool has_else = false;
    };
    struct Return
    {
        ExprPtr value; // may be null
    };
    struct Pipeline
    {
        std::vector<ExprPtr> stages;
    };

    using stmt_data = std::variant<ExprStmt, Assignment, FunctionDef, If, Return, Pipeline>;

    struct Stmt
    {
        stmt_data data;
        int line = -1;
        int col = -1;
    };

    struct Program
    {
        StmtList statements;
    };

    // Builders
    inline ExprPtr make_expr(expr_data d, int line = -1, int col = -1) { return std::make_shared<Expr>(Expr{std::move(d), line, col}); }
    inline StmtPtr make_stmt(stmt_data d, int line = -1, int col = -1) { return std::make_shared<Stmt>(Stmt{std::move(d), line, col}); }

    inline ExprPtr lit(Value v) { return make_expr(Literal{std::move(v)}); }
    inline ExprPtr num(double d) { return lit(Value(d)); }
    inline ExprPtr str(std::string s) { return lit(Value(std::move(s))); }
    inline ExprPtr boolean(bool b) { return lit(Value(b)); }
    inline ExprPtr null() { return lit(Value::null()); }
    inline ExprPtr var(std::string name) { return make_expr(VariableRef{std::move(name)}); }
    inline ExprPtr binary(BinaryOperator op, ExprPtr l, ExprPtr r) { return make_expr(BinaryOp{op, std::move(l), std::move(r)}); }
    inline ExprPtr unary(UnaryOperator op, ExprPtr e) { return make_expr(UnaryOp{op, std::move(e)}); }
    inline ExprPtr member(ExprPtr obj, std::string name) { return make_expr(MemberAccess{std::move(obj), std::move(name)}); }
    inline ExprPtr list(std::vector<ExprPtr> xs) { return make_expr(ListLiteral{std::move(xs)}); }
    inline ExprPtr record(std::vector<std::pair<std::string, ExprPtr>> kv) { return make_expr(RecordLiteral{std::move(kv)}); }
    inline ExprPtr block(StmtList body) { return make_expr(BlockLiteral{std::move(body)}); }
    inline ExprPtr call(std::string name, std::vector<ExprPtr> positional = {}, std::vector<NamedArgument> named = {})
    {
        return make_expr(Call{std::move(name), std::move(positional), std::move(named)});
    }
    inline ExprPtr interpolate(std::vector<InterpolationPart> parts) { return make_expr(StringInterpolation{std::move(parts)}); }

    inline StmtPtr expr_stmt(ExprPtr e) { return make_stmt(ExprStmt{std::move(e)}); }
    inline StmtPtr assign(std::string target, ExprPtr e) { return make_stmt(Assignment{std::move(target), std::move(e)}); }
    inline StmtPtr ret(ExprPtr e = nullptr) { return make_stmt(Return{std::move(e)}); }
    inline StmtPtr pipeline(std::vector<ExprPtr> stages) { return make_stmt(Pipeline{std::move(stages)}); }
    inline StmtPtr function(std::string name, std::vector<Parameter> params, StmtList body)
    {
        return make_stmt(FunctionDef{std::move(name), std::move(params), std::move(body)});
    }
    inline StmtPtr if_else(ExprPtr cond, StmtList then_branch, StmtList else_branch = {}, bool has_else = false)
    {
        return make_stmt(If{std::move(cond), std::move(then_branch), std::move(else_branch), has_else});
    }

} // namespace objsh::ast
