#include "parser.hpp"
#include "pegtl/grammar.hpp"
#include "objsh/value.hpp"
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>
#include <stdexcept>
#include <string>

namespace pegtl = tao::pegtl;

namespace pwsh {

namespace g = pegtl_front::grammar;
namespace ast = objsh::ast;
using objsh::Value;

// Parse-tree node selection: leaves keep their text, structural nodes keep only children,
// precedence levels and single-stage pipelines collapse to their only child.
template<typename Rule>
using selector = pegtl::parse_tree::selector< Rule,
    pegtl::parse_tree::store_content::on<
        g::number, g::sq_text, g::dq_text, g::dq_escape, g::var_name, g::member_name, g::command_name,
        g::param_name, g::bareword, g::hash_key, g::mul_op, g::add_op, g::cmp_op >,
    pegtl::parse_tree::remove_content::on<
        g::script, g::block, g::variable, g::sq_string, g::dq_string, g::hash_literal, g::hash_entry,
        g::array_literal, g::unary_minus, g::unary_not, g::command, g::named_arg, g::function_def,
        g::param_list, g::param_decl, g::if_stmt, g::elseif_clause, g::else_clause, g::return_stmt,
        g::assignment, g::true_lit, g::false_lit >,
    pegtl::parse_tree::fold_one::on<
        g::postfix, g::mul_expr, g::add_expr, g::cmp_expr, g::pipeline, g::arg_list > >;

namespace {

using node = pegtl::parse_tree::node;

struct lowering_error : std::runtime_error {
    lowering_error(const std::string& msg, int l, int c): std::runtime_error(msg), line(l), col(c) {}
    int line; int col;
};

int line_of(const node& n){ return (int)n.begin().line; }
int col_of(const node& n){ return (int)n.begin().column; }

char unescape(char prefix, char c){
    switch(c){
        case 'n': return '\n';
        case 'r': return '\r';
        case 't': return '\t';
        case '0': return '\0';
        case 'a': return prefix=='`' ? '\a' : c;
        default: return c;
    }
}

ast::BinaryOperator binary_op(const node& n){
    std::string op = objsh::to_lower(n.string());
    if(op=="+") return ast::BinaryOperator::Add;
    if(op=="-") return ast::BinaryOperator::Sub;
    if(op=="*") return ast::BinaryOperator::Mul;
    if(op=="/") return ast::BinaryOperator::Div;
    if(op=="%") return ast::BinaryOperator::Mod;
    if(op=="-eq") return ast::BinaryOperator::Eq;
    if(op=="-ne") return ast::BinaryOperator::Ne;
    if(op=="-gt") return ast::BinaryOperator::Gt;
    if(op=="-lt") return ast::BinaryOperator::Lt;
    if(op=="-ge") return ast::BinaryOperator::Ge;
    if(op=="-le") return ast::BinaryOperator::Le;
    throw lowering_error("unknown operator '"+n.string()+"'", line_of(n), col_of(n));
}

class Lowering {
public:
    ast::StmtList statements(const node& n){
        ast::StmtList out;
        for(auto& c : n.children) out.push_back(statement(*c));
        return out;
    }

private:
    ast::StmtPtr statement(const node& n){
        int l=line_of(n), c=col_of(n);
        if(n.is_type<g::function_def>()) return function_def(n);
        if(n.is_type<g::if_stmt>()) return if_stmt(n);
        if(n.is_type<g::return_stmt>()){
            ast::ExprPtr v = n.children.empty() ? nullptr : expression(*n.children.front());
            return ast::make_stmt(ast::Return{v}, l, c);
        }
        if(n.is_type<g::assignment>()){
            const node& target = *n.children.at(0);
            return ast::make_stmt(ast::Assignment{target.children.at(0)->string(), expression(*n.children.at(1))}, l, c);
        }
        if(n.is_type<g::pipeline>()) return ast::make_stmt(ast::Pipeline{stages(n)}, l, c);
        return ast::make_stmt(ast::ExprStmt{expression(n)}, l, c);
    }

    ast::StmtPtr function_def(const node& n){
        ast::FunctionDef fd;
        fd.name = n.children.at(0)->string();
        for(size_t i=1;i<n.children.size();++i){
            const node& c = *n.children[i];
            if(c.is_type<g::param_list>()){
                for(auto& p : c.children){
                    objsh::Parameter param;
                    param.name = p->children.at(0)->string();
                    if(p->children.size()>1) param.default_value = expression(*p->children[1]);
                    fd.params.push_back(std::move(param));
                }
            } else if(c.is_type<g::block>()){
                fd.body = statements(c);
            }
        }
        return ast::make_stmt(std::move(fd), line_of(n), col_of(n));
    }

    // elseif chains become nested If statements in the else branch.
    ast::StmtPtr if_stmt(const node& n){
        ast::ExprPtr cond = expression(*n.children.at(0));
        ast::StmtList then_branch = statements(*n.children.at(1));
        std::vector<const node*> elseifs;
        const node* else_clause = nullptr;
        for(size_t i=2;i<n.children.size();++i){
            const node& c = *n.children[i];
            if(c.is_type<g::elseif_clause>()) elseifs.push_back(&c);
            else if(c.is_type<g::else_clause>()) else_clause = &c;
        }
        ast::StmtList tail;
        bool has_tail = false;
        if(else_clause){ tail = statements(*else_clause->children.at(0)); has_tail = true; }
        for(auto it=elseifs.rbegin(); it!=elseifs.rend(); ++it){
            const node& ei = **it;
            auto nested = ast::make_stmt(ast::If{expression(*ei.children.at(0)), statements(*ei.children.at(1)), std::move(tail), has_tail},
                                         line_of(ei), col_of(ei));
            tail = ast::StmtList{nested};
            has_tail = true;
        }
        return ast::make_stmt(ast::If{cond, std::move(then_branch), std::move(tail), has_tail}, line_of(n), col_of(n));
    }

    std::vector<ast::ExprPtr> stages(const node& n){
        std::vector<ast::ExprPtr> out;
        for(auto& c : n.children) out.push_back(expression(*c));
        return out;
    }

    ast::ExprPtr expression(const node& n){
        int l=line_of(n), c=col_of(n);
        if(n.is_type<g::pipeline>()) return ast::make_expr(ast::PipelineExpr{stages(n)}, l, c);
        if(n.is_type<g::cmp_expr>() || n.is_type<g::add_expr>() || n.is_type<g::mul_expr>()){
            ast::ExprPtr lhs = expression(*n.children.at(0));
            for(size_t i=1;i+1<n.children.size();i+=2){
                lhs = ast::make_expr(ast::BinaryOp{binary_op(*n.children[i]), lhs, expression(*n.children[i+1])},
                                     line_of(*n.children[i]), col_of(*n.children[i]));
            }
            return lhs;
        }
        if(n.is_type<g::unary_minus>()) return ast::make_expr(ast::UnaryOp{ast::UnaryOperator::Negate, expression(*n.children.at(0))}, l, c);
        if(n.is_type<g::unary_not>()) return ast::make_expr(ast::UnaryOp{ast::UnaryOperator::Not, expression(*n.children.at(0))}, l, c);
        if(n.is_type<g::postfix>()){
            ast::ExprPtr base = expression(*n.children.at(0));
            for(size_t i=1;i<n.children.size();++i){
                base = ast::make_expr(ast::MemberAccess{base, n.children[i]->string()}, line_of(*n.children[i]), col_of(*n.children[i]));
            }
            return base;
        }
        if(n.is_type<g::number>()){
            auto d = objsh::parse_number(n.string());
            if(!d) throw lowering_error("invalid number '"+n.string()+"'", l, c);
            return ast::make_expr(ast::Literal{Value(*d)}, l, c);
        }
        if(n.is_type<g::sq_string>()) return ast::make_expr(ast::Literal{Value(single_quoted(n))}, l, c);
        if(n.is_type<g::dq_string>()) return double_quoted(n);
        if(n.is_type<g::variable>()) return variable(n);
        if(n.is_type<g::true_lit>()) return ast::make_expr(ast::Literal{Value(true)}, l, c);
        if(n.is_type<g::false_lit>()) return ast::make_expr(ast::Literal{Value(false)}, l, c);
        if(n.is_type<g::hash_literal>()){
            ast::RecordLiteral rec;
            for(auto& e : n.children) rec.entries.emplace_back(hash_key(*e->children.at(0)), expression(*e->children.at(1)));
            return ast::make_expr(std::move(rec), l, c);
        }
        if(n.is_type<g::array_literal>()){
            ast::ListLiteral list;
            for(auto& e : n.children) list.elements.push_back(expression(*e));
            return ast::make_expr(std::move(list), l, c);
        }
        if(n.is_type<g::block>()) return ast::make_expr(ast::BlockLiteral{statements(n)}, l, c);
        if(n.is_type<g::command>()) return command(n);
        if(n.is_type<g::bareword>()) return ast::make_expr(ast::Literal{Value(n.string())}, l, c);
        if(n.is_type<g::arg_list>()){
            ast::ListLiteral list;
            for(auto& e : n.children) list.elements.push_back(expression(*e));
            return ast::make_expr(std::move(list), l, c);
        }
        throw lowering_error("unexpected syntax node '"+std::string(n.type)+"'", l, c);
    }

    ast::ExprPtr variable(const node& n){
        std::string name = n.children.at(0)->string();
        int l=line_of(n), c=col_of(n);
        if(objsh::iequals(name,"true")) return ast::make_expr(ast::Literal{Value(true)}, l, c);
        if(objsh::iequals(name,"false")) return ast::make_expr(ast::Literal{Value(false)}, l, c);
        if(objsh::iequals(name,"null")) return ast::make_expr(ast::Literal{Value::null()}, l, c);
        return ast::make_expr(ast::VariableRef{std::move(name)}, l, c);
    }

    ast::ExprPtr command(const node& n){
        ast::Call call;
        call.name = n.children.at(0)->string();
        for(size_t i=1;i<n.children.size();++i){
            const node& a = *n.children[i];
            if(a.is_type<g::named_arg>()){
                ast::NamedArgument named;
                named.name = a.children.at(0)->string();
                named.value = a.children.size()>1 ? expression(*a.children[1])
                                                  : ast::make_expr(ast::Literal{Value(true)}, line_of(a), col_of(a));
                call.named.push_back(std::move(named));
            } else {
                call.positional.push_back(expression(a));
            }
        }
        return ast::make_expr(std::move(call), line_of(n), col_of(n));
    }

    static std::string single_quoted(const node& n){
        if(n.children.empty()) return {};
        std::string raw = n.children.front()->string();
        std::string out;
        for(size_t i=0;i<raw.size();++i){
            out += raw[i];
            if(raw[i]=='\'' && i+1<raw.size() && raw[i+1]=='\'') ++i;
        }
        return out;
    }

    ast::ExprPtr double_quoted(const node& n){
        std::vector<ast::InterpolationPart> parts;
        auto add_text = [&](const std::string& s){
            if(!parts.empty() && !parts.back().expr) parts.back().text += s;
            else parts.push_back(ast::InterpolationPart{s, nullptr});
        };
        for(auto& p : n.children){
            if(p->is_type<g::dq_text>()) add_text(p->string());
            else if(p->is_type<g::dq_escape>()){
                std::string e = p->string();
                if(e=="\"\"") add_text("\"");
                else if(e[0]=='\\' && std::string("nrt0\\\"$'").find(e[1])==std::string::npos) add_text(e);
                else add_text(std::string(1, unescape(e[0], e[1])));
            }
            else parts.push_back(ast::InterpolationPart{{}, expression(*p)});
        }
        int l=line_of(n), c=col_of(n);
        if(parts.empty()) return ast::make_expr(ast::Literal{Value(std::string())}, l, c);
        if(parts.size()==1 && !parts.front().expr) return ast::make_expr(ast::Literal{Value(parts.front().text)}, l, c);
        return ast::make_expr(ast::StringInterpolation{std::move(parts)}, l, c);
    }

    std::string hash_key(const node& k){
        if(k.is_type<g::hash_key>()) return k.string();
        if(k.is_type<g::sq_string>()) return single_quoted(k);
        auto e = double_quoted(k);
        if(auto lit = std::get_if<ast::Literal>(&e->data)) return objsh::to_display_string(lit->value);
        throw lowering_error("hashtable keys cannot contain expressions", line_of(k), col_of(k));
    }
};

} // namespace

bool is_complete_input(std::string_view src){
    int depth = 0;
    char quote = 0;
    for(size_t i=0;i<src.size();++i){
        char c = src[i];
        if(quote){
            if(quote=='"' && (c=='\\' || c=='`')){ ++i; continue; }
            if(c==quote){
                if(i+1<src.size() && src[i+1]==quote){ ++i; continue; }
                quote = 0;
            }
            continue;
        }
        switch(c){
            case '#': while(i<src.size() && src[i]!='\n') ++i; break;
            case '"': case '\'': quote = c; break;
            case '{': case '(': ++depth; break;
            case '}': case ')': --depth; break;
            default: break;
        }
    }
    return quote==0 && depth<=0;
}

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    ParseResult r;
    try {
        pegtl::memory_input<> in(src.data(), src.size(), std::string(filename));
        auto root = pegtl::parse_tree::parse<g::script, selector>(in);
        if(!root){
            r.error_message = "parse failed";
            return r;
        }
        Lowering lower;
        for(auto& top : root->children){
            auto stmts = lower.statements(*top);
            r.program.statements.insert(r.program.statements.end(), stmts.begin(), stmts.end());
        }
        r.success = true;
    } catch(const pegtl::parse_error& e){
        r.success = false;
        r.error_message = e.what();
        if(!e.positions().empty()){
            r.line = (int)e.positions().front().line;
            r.column = (int)e.positions().front().column;
        }
    } catch(const lowering_error& e){
        r.success = false;
        r.error_message = e.what();
        r.line = e.line;
        r.column = e.col;
    }
    return r;
}

} // namespace pwsh
