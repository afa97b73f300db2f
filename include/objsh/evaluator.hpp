// Tree-walking evaluator: expressions, statements, function calls and deferred blocks.
#pragma once
#include "objsh/ast.hpp"
#include "objsh/env.hpp"
#include "objsh/errors.hpp"
#include "objsh/scope.hpp"
#include "objsh/stage_registry.hpp"
#include "objsh/value.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace objsh {

struct EvalResult {
    bool success=false;
    Value value;
    std::optional<Diagnostic> error;
};

// Result of executing a statement; `returned` marks an early return travelling to the enclosing call.
struct Flow {
    Value value;
    bool returned=false;
};

struct CallTarget {
    enum class Kind { UserFunction, BuiltinStage, NotFound };
    Kind kind = Kind::NotFound;
    Value function;                            // set for UserFunction
    std::optional<StageRegistry::Handle> stage; // set for BuiltinStage
};

struct CallArguments {
    List positional;
    Record named;
};

class Evaluator : public BlockRunner {
public:
    explicit Evaluator(std::shared_ptr<const StageRegistry> stages = nullptr, RuntimeEnv env = detectEnv());

    // Entry points for hosts; errors come back as diagnostics, never as exceptions.
    EvalResult evaluate_program(const ast::Program& program);
    // Incremental form for interactive use: the global frame persists between lines.
    EvalResult evaluate_line(const ast::StmtList& statements);

    // Throwing layer (RuntimeError).
    Value evaluate(const ast::Expr& e);
    Flow execute(const ast::Stmt& s);
    Flow execute_body(const ast::StmtList& body);
    Value call_function(const Function& fn, const List& positional, const Record& named, const List* pipeline_input = nullptr);
    Value execute_block(const DeferredBlock& block, const Value& input);
    List execute_pipeline(const std::vector<ast::ExprPtr>& stages);

    CallTarget resolve_call(const std::string& name) const;
    CallArguments evaluate_arguments(const ast::Call& call);
    // Invokes a resolved target with an explicit input collection (empty outside pipelines).
    Value invoke(const CallTarget& target, const std::string& name, const CallArguments& args, const List* pipeline_input);

    Value run_block(const DeferredBlock& block, const Value& input) override { return execute_block(block, input); }

    ScopeStack& scope(){ return scope_; }
    const ScopeStack& scope() const { return scope_; }
    const RuntimeEnv& env() const { return env_; }
    const StageRegistry* stages() const { return stages_.get(); }
    int call_depth() const { return call_depth_; }

private:
    EvalResult run_statements(const ast::StmtList& statements);
    Value evaluate_binary(const ast::BinaryOp& b);
    Value evaluate_member(const ast::MemberAccess& m);
    Value evaluate_call(const ast::Call& c);
    std::vector<std::string> command_names() const;

    ScopeStack scope_;
    std::shared_ptr<const StageRegistry> stages_;
    RuntimeEnv env_;
    int call_depth_ = 0;
};

// Arithmetic and comparison on already evaluated operands.
Value apply_binary(ast::BinaryOperator op, const Value& lhs, const Value& rhs);

} // namespace objsh
