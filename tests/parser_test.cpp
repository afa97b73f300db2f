#include <cassert>
#include <iostream>
#include <string>
#include "../languages/pwsh/parser/parser.hpp"

using namespace objsh;

namespace {

const ast::Expr& expr_of(const ast::StmtPtr& s){
    auto* e = std::get_if<ast::ExprStmt>(&s->data);
    assert(e && "expected an expression statement");
    return *e->expr;
}

pwsh::ParseResult parse(const char* src){
    pwsh::Parser p;
    return p.parse_string(src, "parser_test");
}

} // namespace

static void test_statements_and_separators(){
    auto r = parse("$x = 5; $y = 10\n$x + $y");
    assert(r.success);
    assert(r.program.statements.size()==3);
    auto* a = std::get_if<ast::Assignment>(&r.program.statements[0]->data);
    assert(a && a->target=="x");
    auto* b = std::get_if<ast::BinaryOp>(&expr_of(r.program.statements[2]).data);
    assert(b && b->op==ast::BinaryOperator::Add);
    assert(r.program.statements[2]->line==2);

    r = parse("  \n# comment only\n ; ");
    assert(r.success && r.program.statements.empty());
}

static void test_precedence(){
    auto r = parse("1 + 2 * 3 -gt 6");
    assert(r.success);
    auto* cmp = std::get_if<ast::BinaryOp>(&expr_of(r.program.statements[0]).data);
    assert(cmp && cmp->op==ast::BinaryOperator::Gt);
    auto* add = std::get_if<ast::BinaryOp>(&cmp->lhs->data);
    assert(add && add->op==ast::BinaryOperator::Add);
    auto* mul = std::get_if<ast::BinaryOp>(&add->rhs->data);
    assert(mul && mul->op==ast::BinaryOperator::Mul);

    r = parse("10 - 2 - 3");
    auto* outer = std::get_if<ast::BinaryOp>(&expr_of(r.program.statements[0]).data);
    assert(outer && std::get_if<ast::BinaryOp>(&outer->lhs->data)); // left associative

    r = parse("-not $false");
    assert(r.success && std::get_if<ast::UnaryOp>(&expr_of(r.program.statements[0]).data));
    r = parse("-5");
    assert(r.success && std::get_if<ast::UnaryOp>(&expr_of(r.program.statements[0]).data)->op==ast::UnaryOperator::Negate);
}

static void test_literals(){
    auto r = parse("@{Name=\"John\"; 'Age' = 30}");
    assert(r.success);
    auto* rec = std::get_if<ast::RecordLiteral>(&expr_of(r.program.statements[0]).data);
    assert(rec && rec->entries.size()==2 && rec->entries[1].first=="Age");

    r = parse("@(1, 2,\n 3)");
    auto* lst = std::get_if<ast::ListLiteral>(&expr_of(r.program.statements[0]).data);
    assert(lst && lst->elements.size()==3);

    r = parse("'it''s'");
    auto* sq = std::get_if<ast::Literal>(&expr_of(r.program.statements[0]).data);
    assert(sq && sq->value.as_string()=="it's");

    r = parse("\"Hi $name, total $($a + 1)`n\"");
    auto* interp = std::get_if<ast::StringInterpolation>(&expr_of(r.program.statements[0]).data);
    assert(interp && interp->parts.size()==5);
    assert(interp->parts[0].text=="Hi " && interp->parts[1].expr);
    assert(interp->parts[4].text=="\n");

    r = parse("$true; $False; $null");
    assert(std::get<ast::Literal>(expr_of(r.program.statements[0]).data).value.as_bool());
    assert(std::get<ast::Literal>(expr_of(r.program.statements[2]).data).value.is_null());

    r = parse("{ $_ * 2 }");
    auto* blk = std::get_if<ast::BlockLiteral>(&expr_of(r.program.statements[0]).data);
    assert(blk && blk->body.size()==1);
}

static void test_variables_and_members(){
    auto r = parse("$global:c = $obj.Address.City");
    assert(r.success);
    auto& a = std::get<ast::Assignment>(r.program.statements[0]->data);
    assert(a.target=="global:c");
    auto* m = std::get_if<ast::MemberAccess>(&a.value->data);
    assert(m && m->member=="City");
    auto* inner = std::get_if<ast::MemberAccess>(&m->object->data);
    assert(inner && inner->member=="Address");
}

static void test_commands_and_pipelines(){
    auto r = parse("@(1,2,3,4,5) | Where-Object { $_ -gt 2 } | Select-Object -First 2");
    assert(r.success);
    auto* p = std::get_if<ast::Pipeline>(&r.program.statements[0]->data);
    assert(p && p->stages.size()==3);
    auto* where = std::get_if<ast::Call>(&p->stages[1]->data);
    assert(where && where->name=="Where-Object" && where->positional.size()==1);
    assert(std::get_if<ast::BlockLiteral>(&where->positional[0]->data));
    auto* select = std::get_if<ast::Call>(&p->stages[2]->data);
    assert(select && select->named.size()==1 && select->named[0].name=="First");

    r = parse("Sort-Object -Property Name, Age -Descending");
    auto* sort = std::get_if<ast::Call>(&expr_of(r.program.statements[0]).data);
    assert(sort && sort->named.size()==2);
    assert(std::get_if<ast::ListLiteral>(&sort->named[0].value->data));
    auto* sw = std::get_if<ast::Literal>(&sort->named[1].value->data);
    assert(sw && sw->value.as_bool());

    r = parse("Add 5 10");
    auto* add = std::get_if<ast::Call>(&expr_of(r.program.statements[0]).data);
    assert(add && add->positional.size()==2);

    r = parse("Select-Object -First:1");
    auto* colon = std::get_if<ast::Call>(&expr_of(r.program.statements[0]).data);
    assert(colon && colon->named.size()==1 && colon->named[0].value);

    r = parse("$items |\n  ForEach-Object { $_ }");
    assert(r.success && std::get_if<ast::Pipeline>(&r.program.statements[0]->data));
}

static void test_functions_and_control_flow(){
    auto r = parse("function Add($a, $b = 2) {\n  return $a + $b\n}\nAdd 1");
    assert(r.success && r.program.statements.size()==2);
    auto& fd = std::get<ast::FunctionDef>(r.program.statements[0]->data);
    assert(fd.name=="Add" && fd.params.size()==2);
    assert(!fd.params[0].default_value && fd.params[1].default_value);
    assert(std::get_if<ast::Return>(&fd.body[0]->data));

    r = parse("function Inc { $global:c = $global:c + 1 }");
    assert(r.success && std::get<ast::FunctionDef>(r.program.statements[0]->data).params.empty());

    r = parse("if ($x -eq 1) { 'one' } elseif ($x -eq 2) { 'two' } else { 'many' }");
    assert(r.success);
    auto& top = std::get<ast::If>(r.program.statements[0]->data);
    assert(top.has_else && top.else_branch.size()==1);
    auto& nested = std::get<ast::If>(top.else_branch[0]->data);
    assert(nested.has_else && nested.then_branch.size()==1);

    r = parse("IF ($x) { 1 }\nElse { 2 }");
    assert(r.success && std::get<ast::If>(r.program.statements[0]->data).has_else);

    r = parse("return");
    auto& ret = std::get<ast::Return>(r.program.statements[0]->data);
    assert(!ret.value);
}

static void test_errors(){
    auto r = parse("$x = (1 + ");
    assert(!r.success && !r.error_message.empty());
    assert(r.line==1);
    r = parse("@{ Name = 1 ");
    assert(!r.success);
    r = parse("function { }");
    assert(!r.success);
    r = parse("@{ \"$k\" = 1 }");
    assert(!r.success);
}

static void test_complete_input(){
    assert(pwsh::is_complete_input("$x = 1"));
    assert(!pwsh::is_complete_input("function F {"));
    assert(pwsh::is_complete_input("function F {\n 1\n}"));
    assert(!pwsh::is_complete_input("'open"));
    assert(pwsh::is_complete_input("'{'"));
    assert(pwsh::is_complete_input("# {"));
    assert(!pwsh::is_complete_input("Foo (1,"));
}

void run_parser_tests(){
    std::cout << "[pwsh] parser tests...\n";
    test_statements_and_separators();
    test_precedence();
    test_literals();
    test_variables_and_members();
    test_commands_and_pipelines();
    test_functions_and_control_flow();
    test_errors();
    test_complete_input();
    std::cout << "[pwsh] parser tests passed\n";
}
