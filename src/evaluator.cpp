#include "objsh/evaluator.hpp"
#include "objsh/pipeline.hpp"
#include <cmath>
#include <cstdio>

namespace objsh {

namespace {

struct DepthGuard {
    explicit DepthGuard(int& d): depth(d) { ++depth; }
    ~DepthGuard(){ --depth; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;
    int& depth;
};

void annotate(RuntimeError& err, int line, int col){
    auto& d = err.diagnostic();
    if(d.line<0 && line>=0){ d.line=line; d.col=col; }
}

bool is_comparison(ast::BinaryOperator op){
    switch(op){
        case ast::BinaryOperator::Eq: case ast::BinaryOperator::Ne: case ast::BinaryOperator::Gt:
        case ast::BinaryOperator::Lt: case ast::BinaryOperator::Ge: case ast::BinaryOperator::Le: return true;
        default: return false;
    }
}

} // namespace

Value apply_binary(ast::BinaryOperator op, const Value& lhs, const Value& rhs){
    using ast::BinaryOperator;
    if(is_comparison(op)){
        int c;
        auto a = to_number(lhs); auto b = to_number(rhs);
        if(a && b) c = (*a < *b) ? -1 : (*a > *b ? 1 : 0);
        else c = icompare(to_display_string(lhs), to_display_string(rhs));
        switch(op){
            case BinaryOperator::Eq: return Value(c==0);
            case BinaryOperator::Ne: return Value(c!=0);
            case BinaryOperator::Gt: return Value(c>0);
            case BinaryOperator::Lt: return Value(c<0);
            case BinaryOperator::Ge: return Value(c>=0);
            default: return Value(c<=0);
        }
    }
    if(op==BinaryOperator::Add && (lhs.is_string() || rhs.is_string()))
        return Value(to_display_string(lhs) + to_display_string(rhs));
    auto a = to_number(lhs);
    if(!a) throw errors::type_mismatch(ast::operator_name(op), "Number", kind_name(lhs));
    auto b = to_number(rhs);
    if(!b) throw errors::type_mismatch(ast::operator_name(op), "Number", kind_name(rhs));
    switch(op){
        case BinaryOperator::Add: return Value(*a + *b);
        case BinaryOperator::Sub: return Value(*a - *b);
        case BinaryOperator::Mul: return Value(*a * *b);
        case BinaryOperator::Div:
            if(*b==0.0) throw errors::division_by_zero();
            return Value(*a / *b);
        case BinaryOperator::Mod:
            if(*b==0.0) throw errors::division_by_zero();
            return Value(std::fmod(*a, *b));
        default: break;
    }
    throw errors::invalid_operation(std::string("unsupported operator ")+ast::operator_symbol(op));
}

Evaluator::Evaluator(std::shared_ptr<const StageRegistry> stages, RuntimeEnv env)
    : stages_(std::move(stages)), env_(env) {
    scope_.set_trace(env_.traceScope);
}

EvalResult Evaluator::evaluate_program(const ast::Program& program){
    return run_statements(program.statements);
}

EvalResult Evaluator::evaluate_line(const ast::StmtList& statements){
    return run_statements(statements);
}

EvalResult Evaluator::run_statements(const ast::StmtList& statements){
    EvalResult r;
    try {
        Value last;
        for(auto& s : statements){
            Flow f = execute(*s);
            if(f.returned){
                auto err = errors::return_outside_function();
                annotate(err, s->line, s->col);
                throw err;
            }
            last = std::move(f.value);
        }
        r.success = true;
        r.value = std::move(last);
    } catch(const RuntimeError& e){
        r.success = false;
        r.error = e.diagnostic();
        if(env_.traceCalls) std::fprintf(stderr, "[dbg][eval][error] code=%s msg=%s\n", e.code().c_str(), e.what());
    }
    return r;
}

Flow Evaluator::execute_body(const ast::StmtList& body){
    Flow last;
    for(auto& s : body){
        last = execute(*s);
        if(last.returned) return last;
    }
    return last;
}

Flow Evaluator::execute(const ast::Stmt& s){
    try {
        if(auto* e = std::get_if<ast::ExprStmt>(&s.data)){
            return Flow{evaluate(*e->expr)};
        }
        if(auto* a = std::get_if<ast::Assignment>(&s.data)){
            scope_.write(a->target, evaluate(*a->value));
            return Flow{};
        }
        if(auto* fd = std::get_if<ast::FunctionDef>(&s.data)){
            scope_.define(fd->name, Value(Function{fd->name, fd->params, fd->body}));
            return Flow{};
        }
        if(auto* i = std::get_if<ast::If>(&s.data)){
            if(to_boolean(evaluate(*i->condition))) return execute_body(i->then_branch);
            if(i->has_else) return execute_body(i->else_branch);
            return Flow{};
        }
        if(auto* r = std::get_if<ast::Return>(&s.data)){
            Value v = r->value ? evaluate(*r->value) : Value::null();
            return Flow{std::move(v), true};
        }
        if(auto* p = std::get_if<ast::Pipeline>(&s.data)){
            return Flow{collapse_collection(execute_pipeline(p->stages))};
        }
    } catch(RuntimeError& err){
        annotate(err, s.line, s.col);
        throw;
    }
    throw errors::invalid_operation("unknown statement kind");
}

Value Evaluator::evaluate(const ast::Expr& e){
    try {
        if(auto* l = std::get_if<ast::Literal>(&e.data)) return l->value;
        if(auto* v = std::get_if<ast::VariableRef>(&e.data)){
            if(auto val = scope_.read(v->name)) return *val;
            auto err = errors::undefined_variable(v->name);
            append_suggestions(err.diagnostic(), fuzzy_candidates(v->name, scope_.visible_names()), env_.suggestions);
            throw err;
        }
        if(auto* b = std::get_if<ast::BinaryOp>(&e.data)) return evaluate_binary(*b);
        if(auto* u = std::get_if<ast::UnaryOp>(&e.data)){
            Value operand = evaluate(*u->operand);
            if(u->op==ast::UnaryOperator::Not) return Value(!to_boolean(operand));
            auto n = to_number(operand);
            if(!n) throw errors::type_mismatch("negation", "Number", kind_name(operand));
            return Value(-*n);
        }
        if(auto* s = std::get_if<ast::StringInterpolation>(&e.data)){
            std::string out;
            for(auto& part : s->parts){
                if(part.expr) out += to_display_string(evaluate(*part.expr));
                else out += part.text;
            }
            return Value(std::move(out));
        }
        if(auto* m = std::get_if<ast::MemberAccess>(&e.data)) return evaluate_member(*m);
        if(auto* r = std::get_if<ast::RecordLiteral>(&e.data)){
            Record rec;
            for(auto& kv : r->entries) rec.set(kv.first, evaluate(*kv.second));
            return Value(std::move(rec));
        }
        if(auto* l = std::get_if<ast::ListLiteral>(&e.data)){
            List items;
            items.reserve(l->elements.size());
            for(auto& el : l->elements) items.push_back(evaluate(*el));
            return Value(std::move(items));
        }
        if(auto* bl = std::get_if<ast::BlockLiteral>(&e.data)) return Value(DeferredBlock{bl->body});
        if(auto* c = std::get_if<ast::Call>(&e.data)) return evaluate_call(*c);
        if(auto* p = std::get_if<ast::PipelineExpr>(&e.data)) return collapse_collection(execute_pipeline(p->stages));
    } catch(RuntimeError& err){
        annotate(err, e.line, e.col);
        throw;
    }
    throw errors::invalid_operation("unknown expression kind");
}

Value Evaluator::evaluate_binary(const ast::BinaryOp& b){
    Value lhs = evaluate(*b.lhs);
    Value rhs = evaluate(*b.rhs);
    return apply_binary(b.op, lhs, rhs);
}

Value Evaluator::evaluate_member(const ast::MemberAccess& m){
    Value base = evaluate(*m.object);
    if(!base.is_record()) throw errors::not_a_record(m.member, kind_name(base));
    if(auto v = get_property(base, m.member)) return *v;
    auto err = errors::property_not_found(m.member, "Record");
    std::vector<std::string> keys;
    for(auto& kv : base.as_record().entries()) keys.push_back(kv.first);
    append_suggestions(err.diagnostic(), fuzzy_candidates(m.member, keys), env_.suggestions);
    throw err;
}

CallTarget Evaluator::resolve_call(const std::string& name) const {
    CallTarget t;
    if(auto v = scope_.read(name); v && v->is_function()){
        t.kind = CallTarget::Kind::UserFunction;
        t.function = *v;
        return t;
    }
    if(stages_){
        if(auto h = stages_->resolve(name)){
            t.kind = CallTarget::Kind::BuiltinStage;
            t.stage = *h;
        }
    }
    return t;
}

CallArguments Evaluator::evaluate_arguments(const ast::Call& call){
    CallArguments args;
    args.positional.reserve(call.positional.size());
    for(auto& p : call.positional) args.positional.push_back(evaluate(*p));
    for(auto& n : call.named) args.named.set(n.name, n.value ? evaluate(*n.value) : Value(true));
    return args;
}

std::vector<std::string> Evaluator::command_names() const {
    std::vector<std::string> out;
    for(auto& n : scope_.visible_names()){
        if(auto v = scope_.read(n); v && v->is_function()) out.push_back(n);
    }
    if(stages_) for(auto& n : stages_->names()) out.push_back(n);
    return out;
}

Value Evaluator::invoke(const CallTarget& target, const std::string& name, const CallArguments& args, const List* pipeline_input){
    switch(target.kind){
        case CallTarget::Kind::UserFunction:
            return call_function(target.function.as_function(), args.positional, args.named, pipeline_input);
        case CallTarget::Kind::BuiltinStage: {
            static const List empty;
            if(env_.traceCalls)
                std::fprintf(stderr, "[dbg][stage][invoke] name=%s input=%zu args=%zu\n", name.c_str(),
                             pipeline_input ? pipeline_input->size() : (size_t)0, args.positional.size());
            return stages_->invoke(*target.stage, pipeline_input ? *pipeline_input : empty, args.positional, args.named, *this);
        }
        case CallTarget::Kind::NotFound: break;
    }
    auto err = errors::command_not_found(name);
    append_suggestions(err.diagnostic(), fuzzy_candidates(name, command_names()), env_.suggestions);
    throw err;
}

Value Evaluator::evaluate_call(const ast::Call& c){
    CallArguments args = evaluate_arguments(c);
    return invoke(resolve_call(c.name), c.name, args, nullptr);
}

Value Evaluator::call_function(const Function& fn, const List& positional, const Record& named, const List* pipeline_input){
    if(call_depth_ >= env_.maxCallDepth) throw errors::recursion_limit(fn.name, env_.maxCallDepth);
    for(auto& kv : named.entries()){
        bool known=false;
        for(auto& p : fn.params) if(iequals(p.name, kv.first)){ known=true; break; }
        if(!known) throw errors::invalid_operation("A parameter cannot be found that matches parameter name '"+kv.first+"' on '"+fn.name+"'",
                                                   "check the parameter list of "+fn.name);
    }
    if(env_.traceCalls) std::fprintf(stderr, "[dbg][call][enter] name=%s depth=%d args=%zu\n", fn.name.c_str(), call_depth_+1, positional.size());

    DepthGuard depth(call_depth_);
    FrameGuard frame(scope_, FrameKind::Function);
    if(pipeline_input) scope_.define("input", Value(*pipeline_input));
    // named first, then positionals fill the remaining parameters in order
    size_t next=0;
    for(auto& p : fn.params){
        if(const Value* v = named.find(p.name)) scope_.define(p.name, *v);
        else if(next<positional.size()) scope_.define(p.name, positional[next++]);
        else if(p.default_value) scope_.define(p.name, evaluate(*p.default_value));
        else scope_.define(p.name, Value::null());
    }
    if(next<positional.size())
        scope_.define("args", Value(List(positional.begin()+(std::ptrdiff_t)next, positional.end())));

    Flow f = execute_body(fn.body);
    if(env_.traceCalls) std::fprintf(stderr, "[dbg][call][exit] name=%s returned=%d\n", fn.name.c_str(), f.returned ? 1 : 0);
    return f.value;
}

Value Evaluator::execute_block(const DeferredBlock& block, const Value& input){
    // blocks re-entered through stages nest as deeply as calls do
    if(call_depth_ >= env_.maxCallDepth) throw errors::recursion_limit("<scriptblock>", env_.maxCallDepth);
    DepthGuard depth(call_depth_);
    FrameGuard frame(scope_, FrameKind::Block);
    scope_.define("_", input);
    return execute_body(block.body).value;
}

List Evaluator::execute_pipeline(const std::vector<ast::ExprPtr>& stages){
    return PipelineExecutor(*this).run(stages);
}

} // namespace objsh
