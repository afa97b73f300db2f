#include <cassert>
#include <iostream>
#include <string>
#include "test_env.hpp"
#include "objsh/diagnostics_json.hpp"
#include "objsh/evaluator.hpp"

using namespace objsh;
using namespace objsh::ast;

static EvalResult run_one(Evaluator& ev, StmtPtr s){
    Program p; p.statements.push_back(std::move(s));
    return ev.evaluate_program(p);
}

static void test_json_success(){
    Evaluator ev(nullptr, RuntimeEnv{});
    auto js = diagnostics_to_json(run_one(ev, expr_stmt(num(1))));
    assert(js=="{\"success\":true,\"errors\":[]}");
}

static void test_json_error_with_notes(){
    Evaluator ev(nullptr, RuntimeEnv{});
    auto r = run_one(ev, make_stmt(ExprStmt{binary(BinaryOperator::Add, boolean(true), num(1))}, 3, 7));
    auto js = diagnostics_to_json(r);
    assert(js.find("\"success\":false")!=std::string::npos);
    assert(js.find("\"code\":\"E0201\"")!=std::string::npos);
    assert(js.find("\"kind\":\"TypeMismatch\"")!=std::string::npos);
    assert(js.find("\"line\":3,\"col\":7")!=std::string::npos);
    auto notesPos = js.find("\"notes\":[");
    assert(notesPos!=std::string::npos);
    auto closing = js.find(']', notesPos);
    auto segment = js.substr(notesPos, closing - notesPos);
    assert(segment.find("},{")!=std::string::npos); // expected and found
}

static void test_escape(){
    assert(json_escape("a\"b\\c\n")=="\"a\\\"b\\\\c\\n\"");
    assert(json_escape(std::string(1, '\x01'))=="\"\\u0001\"");
}

static void test_env_detection(){
    {
        RuntimeEnv defaults = detectEnv();
        assert(defaults.maxCallDepth==256);
        assert(defaults.suggestions);
        assert(!defaults.diagJson);
    }
    {
        ScopedEnv depth("OBJSH_MAX_CALL_DEPTH", "12");
        ScopedEnv suggest("OBJSH_SUGGEST", "0");
        ScopedEnv json("OBJSH_DIAG_JSON", "1");
        ScopedEnv trace("OBJSH_TRACE", "yes");
        RuntimeEnv e = detectEnv();
        assert(e.maxCallDepth==12);
        assert(!e.suggestions);
        assert(e.diagJson);
        assert(e.traceCalls);
        assert(!e.traceScope);
    }
    {
        ScopedEnv huge("OBJSH_MAX_CALL_DEPTH", "100000");
        assert(detectEnv().maxCallDepth==kMaxCallDepthCeiling);
    }
    {
        ScopedEnv bad("OBJSH_MAX_CALL_DEPTH", "lots");
        assert(detectEnv().maxCallDepth==256);
    }
}

static void test_suggestions_disabled(){
    RuntimeEnv env; env.suggestions = false;
    Evaluator ev(nullptr, env);
    run_one(ev, assign("counter", num(1)));
    auto r = run_one(ev, expr_stmt(var("countr")));
    assert(!r.success && r.error->notes.empty());
}

void run_diagnostics_json_tests(){
    std::cout << "[core] diagnostics JSON tests...\n";
    test_json_success();
    test_json_error_with_notes();
    test_escape();
    test_env_detection();
    test_suggestions_disabled();
    std::cout << "[core] diagnostics JSON tests passed\n";
}
