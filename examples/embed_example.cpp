// Embedding example: host-defined stage plus the built-ins, driven from C++.
#include <iostream>
#include <string>
#include "objsh/evaluator.hpp"
#include "objsh/diagnostics_json.hpp"
#include "pwsh/stages.hpp"
#include "../languages/pwsh/parser/parser.hpp"

using namespace objsh;

// Measure-Sum [-Property Name]: adds up the input (or one property of each record).
static Value measure_sum(StageContext& ctx){
    double total = 0;
    const Value* prop = ctx.named_arg("Property");
    for(auto& item : ctx.input){
        Value v = prop ? get_property(item, to_display_string(*prop)).value_or(Value::null()) : item;
        if(v.is_null()) continue;
        auto n = to_number(v);
        if(!n) throw errors::type_mismatch("Measure-Sum", "Number", kind_name(v));
        total += *n;
    }
    return Value(total);
}

int main(){
    const char* src = R"PS(
        $orders = @(
            @{ Id = 1; Customer = 'acme';   Total = 120 }
            @{ Id = 2; Customer = 'globex'; Total = 75.5 }
            @{ Id = 3; Customer = 'acme';   Total = 30 }
        )
        function Big($min = 50) { $input | Where-Object { $_.Total -ge $min } }
        $orders | Big | Measure-Sum -Property Total
    )PS";

    auto reg = pwsh::make_builtin_registry();
    reg->add_stage("Measure-Sum", measure_sum);

    pwsh::Parser parser;
    auto parsed = parser.parse_string(src, "embed_example");
    if(!parsed.success){
        std::cerr << "parse error (" << parsed.line << ":" << parsed.column << "): " << parsed.error_message << "\n";
        return 1;
    }

    Evaluator ev(reg, detectEnv());
    auto r = ev.evaluate_program(parsed.program);
    if(!r.success){
        std::cerr << format_diagnostic(*r.error) << "\n";
        maybe_print_json(r, ev.env());
        return 2;
    }
    std::cout << "big orders total: " << to_display_string(r.value) << "\n";
    return r.value.is_number() && r.value.as_number()==195.5 ? 0 : 3;
}
