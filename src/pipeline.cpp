#include "objsh/pipeline.hpp"
#include "objsh/evaluator.hpp"
#include <cstdio>

namespace objsh {

Value collapse_collection(List items){
    if(items.empty()) return Value::null();
    if(items.size()==1) return std::move(items.front());
    return Value(std::move(items));
}

void append_flattened(List& out, const Value& v){
    if(v.is_list()){
        const List& l = v.as_list();
        out.insert(out.end(), l.begin(), l.end());
    } else {
        out.push_back(v);
    }
}

List PipelineExecutor::run(const std::vector<ast::ExprPtr>& stages){
    List current;
    for(size_t i=0;i<stages.size();++i){
        const ast::Expr& stage = *stages[i];
        size_t before = current.size();
        try {
            if(auto* call = std::get_if<ast::Call>(&stage.data)) current = run_call_stage(*call, current);
            else if(i==0) current = seed(stage);
            else if(auto* block = std::get_if<ast::BlockLiteral>(&stage.data)) current = run_block_stage(*block, current);
            else current = run_item_stage(stage, current);
        } catch(RuntimeError& err){
            auto& d = err.diagnostic();
            if(d.line<0 && stage.line>=0){ d.line=stage.line; d.col=stage.col; }
            if(ev_.env().traceCalls) std::fprintf(stderr, "[dbg][pipeline][abort] stage=%zu code=%s\n", i, err.code().c_str());
            throw;
        }
        if(ev_.env().traceCalls) std::fprintf(stderr, "[dbg][pipeline][stage] index=%zu in=%zu out=%zu\n", i, before, current.size());
    }
    return current;
}

List PipelineExecutor::run_call_stage(const ast::Call& call, const List& current){
    CallArguments args = ev_.evaluate_arguments(call);
    Value result = ev_.invoke(ev_.resolve_call(call.name), call.name, args, &current);
    List next;
    append_flattened(next, result);
    return next;
}

List PipelineExecutor::run_block_stage(const ast::BlockLiteral& block, const List& current){
    DeferredBlock body{block.body};
    List next;
    next.reserve(current.size());
    for(auto& item : current) next.push_back(ev_.execute_block(body, item));
    return next;
}

List PipelineExecutor::run_item_stage(const ast::Expr& stage, const List& current){
    List next;
    next.reserve(current.size());
    for(auto& item : current){
        FrameGuard frame(ev_.scope(), FrameKind::Block);
        ev_.scope().define("_", item);
        next.push_back(ev_.evaluate(stage));
    }
    return next;
}

// Leading non-call stage: a block stays a value, a List is unrolled, Null feeds nothing.
List PipelineExecutor::seed(const ast::Expr& stage){
    Value v = ev_.evaluate(stage);
    List items;
    if(v.is_null()) return items;
    append_flattened(items, v);
    return items;
}

} // namespace objsh
