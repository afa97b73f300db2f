// Pipeline engine: threads a collection of values through successive stages.
#pragma once
#include "objsh/ast.hpp"
#include "objsh/value.hpp"
#include <vector>

namespace objsh {

class Evaluator;

class PipelineExecutor {
public:
    explicit PipelineExecutor(Evaluator& ev): ev_(ev) {}

    // Any stage error aborts the whole pipeline and propagates.
    List run(const std::vector<ast::ExprPtr>& stages);

private:
    List run_call_stage(const ast::Call& call, const List& current);
    List run_block_stage(const ast::BlockLiteral& block, const List& current);
    List run_item_stage(const ast::Expr& stage, const List& current);
    List seed(const ast::Expr& stage);

    Evaluator& ev_;
};

// Null for no items, the item itself for one, otherwise a List.
Value collapse_collection(List items);

// Appends v to out, unrolling one level when v is a List.
void append_flattened(List& out, const Value& v);

} // namespace objsh
