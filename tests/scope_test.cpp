#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <algorithm>
#include "objsh/scope.hpp"

using namespace objsh;

static void test_qualifiers(){
    auto q = parse_qualifier("global:x");
    assert(q.qualifier==ScopeQualifier::Global && q.base=="x");
    q = parse_qualifier("LOCAL:y");
    assert(q.qualifier==ScopeQualifier::Local && q.base=="y");
    q = parse_qualifier("script:z");
    assert(q.qualifier==ScopeQualifier::Script && q.base=="z");
    q = parse_qualifier("env:PATH");
    assert(q.qualifier==ScopeQualifier::None && q.base=="env:PATH");
    q = parse_qualifier("plain");
    assert(q.qualifier==ScopeQualifier::None && q.base=="plain");
}

static void test_read_write_global(){
    ScopeStack s;
    assert(s.depth()==1);
    s.write("x", Value(1));
    assert(s.read("X")->as_number()==1.0);
    assert(s.read("global:x")->as_number()==1.0);
    assert(s.read("script:x")->as_number()==1.0);
    s.write("script:y", Value(2));
    assert(s.global_frame().get("y")->as_number()==2.0);
    assert(!s.read("missing"));
}

static void test_function_isolation(){
    ScopeStack s;
    s.write("n", Value("outer"));
    {
        FrameGuard fn(s, FrameKind::Function);
        assert(s.read("n")->as_string()=="outer"); // globals stay readable
        s.write("n", Value("inner"));
        assert(s.read("n")->as_string()=="inner");
        assert(s.read("global:n")->as_string()=="outer");
        assert(s.read("local:n")->as_string()=="inner");
    }
    assert(s.depth()==1);
    assert(s.read("n")->as_string()=="outer");
    {
        FrameGuard fn(s, FrameKind::Function);
        s.write("global:n", Value("changed"));
    }
    assert(s.read("n")->as_string()=="changed");
}

static void test_nested_function_frames_do_not_leak(){
    ScopeStack s;
    FrameGuard caller(s, FrameKind::Function);
    s.write("secret", Value(1));
    {
        FrameGuard callee(s, FrameKind::Function);
        assert(!s.read("secret"));
    }
    assert(s.read("secret")->as_number()==1.0);
}

static void test_block_frames_update_in_place(){
    ScopeStack s;
    s.write("sum", Value(0));
    {
        FrameGuard blk(s, FrameKind::Block);
        s.define("_", Value(5));
        s.write("sum", Value(5)); // found in an enclosing frame
        s.write("tmp", Value(1)); // new binding goes to the block frame
    }
    assert(s.read("sum")->as_number()==5.0);
    assert(!s.read("tmp"));
    assert(!s.read("_"));
}

static void test_pop_global_is_fatal(){
    ScopeStack s;
    bool threw=false;
    try { s.pop_frame(); } catch(const std::logic_error&){ threw=true; }
    assert(threw);
    assert(s.depth()==1);
}

static void test_guard_pops_on_exception(){
    ScopeStack s;
    try {
        FrameGuard g(s, FrameKind::Function);
        assert(s.depth()==2);
        throw std::runtime_error("boom");
    } catch(const std::runtime_error&){}
    assert(s.depth()==1);
}

static void test_visible_names(){
    ScopeStack s;
    s.write("alpha", Value(1));
    FrameGuard fn(s, FrameKind::Function);
    s.define("beta", Value(2));
    auto names = s.visible_names();
    assert(std::find(names.begin(), names.end(), "alpha")!=names.end());
    assert(std::find(names.begin(), names.end(), "beta")!=names.end());
}

void run_scope_tests(){
    std::cout << "[core] scope tests...\n";
    test_qualifiers();
    test_read_write_global();
    test_function_isolation();
    test_nested_function_frames_do_not_leak();
    test_block_frames_update_in_place();
    test_pop_global_is_fatal();
    test_guard_pops_on_exception();
    test_visible_names();
    std::cout << "[core] scope tests passed\n";
}
