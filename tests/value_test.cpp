#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include "objsh/value.hpp"

using namespace objsh;

static void test_truthiness(){
    assert(!to_boolean(Value::null()));
    assert(!to_boolean(Value(false)));
    assert(!to_boolean(Value(0.0)));
    assert(!to_boolean(Value("")));
    assert(to_boolean(Value(true)));
    assert(to_boolean(Value(-1.5)));
    assert(to_boolean(Value("0"))); // non-empty string
    assert(to_boolean(Value(List{})));
    assert(to_boolean(Value(Record{})));
    assert(to_boolean(Value(Function{"f", {}, {}})));
    assert(to_boolean(Value(DeferredBlock{})));
}

static void test_numbers(){
    assert(to_number(Value(2.5)).value()==2.5);
    assert(to_number(Value(" 42 ")).value()==42.0);
    assert(to_number(Value("-3.5")).value()==-3.5);
    assert(to_number(Value("1e3")).value()==1000.0);
    assert(!to_number(Value("abc")));
    assert(!to_number(Value("12abc")));
    assert(!to_number(Value("inf")));
    assert(!to_number(Value("")));
    assert(!to_number(Value(true)));
    assert(!to_number(Value::null()));
    assert(!to_number(Value(List{Value(1)})));
}

static void test_display(){
    assert(to_display_string(Value::null()).empty());
    assert(to_display_string(Value(true))=="True");
    assert(to_display_string(Value(false))=="False");
    assert(to_display_string(Value(15))=="15");
    assert(to_display_string(Value(0.1))=="0.1");
    assert(to_display_string(Value(-0.0))=="0");
    assert(to_display_string(Value(2.5e20))=="2.5e+20");
    assert(format_number(std::nan(""))=="NaN");
    assert(format_number(-INFINITY)=="-Infinity");
    Record r; r.set("Name", Value("John")); r.set("Age", Value(30));
    assert(to_display_string(Value(r))=="@{Name=John; Age=30}");
    assert(to_display_string(Value(List{Value(1), Value("a"), Value(true)}))=="1, a, True");
    assert(to_display_string(Value(Function{"Add", {}, {}}))=="Add");
}

static void test_records(){
    Record r;
    r.set("Name", Value("John"));
    r.set("Age", Value(30));
    r.set("name", Value("Jane")); // replaces in place, keeps spelling and slot
    assert(r.size()==2);
    assert(r.entries()[0].first=="Name");
    assert(r.find("NAME")->as_string()=="Jane");
    assert(r.contains("age"));
    assert(!r.contains("Missing"));

    Value v(r);
    assert(get_property(v, "AGE")->as_number()==30.0);
    assert(!get_property(v, "Missing"));
    assert(!get_property(Value("text"), "Length"));
    assert(!get_property(Value::null(), "x"));
}

static void test_equality_and_names(){
    assert(values_equal(Value(List{Value(1), Value("x")}), Value(List{Value(1.0), Value("x")})));
    assert(!values_equal(Value(1), Value("1")));
    Record a; a.set("k", Value(1));
    Record b; b.set("K", Value(1));
    assert(values_equal(Value(a), Value(b)));
    Value f(Function{"f", {}, {}});
    Value g = f;
    assert(values_equal(f, g));
    assert(!values_equal(f, Value(Function{"f", {}, {}})));
    assert(std::string(kind_name(Value(DeferredBlock{})))=="ScriptBlock");
    assert(std::string(kind_name(Value::null()))=="Null");
    assert(iequals("Where-Object", "where-object"));
    assert(icompare("apple", "Banana")<0);
    assert(icompare("b", "B")==0);
}

void run_value_tests(){
    std::cout << "[core] value tests...\n";
    test_truthiness();
    test_numbers();
    test_display();
    test_records();
    test_equality_and_names();
    std::cout << "[core] value tests passed\n";
}
