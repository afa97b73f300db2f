#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "../parser/parser.hpp"
#include "pwsh/stages.hpp"
#include "objsh/diagnostics_json.hpp"
#include "objsh/evaluator.hpp"

static const char* kVersion = "objsh 0.3.0";

static std::string read_all(std::istream& is){
    std::ostringstream ss; ss << is.rdbuf(); return ss.str();
}

static void usage(){
    std::cerr << "usage: objsh [--version] [--help] [-c <code>] [script]\n"
                 "  with no arguments an interactive prompt is started\n";
}

static void print_value(const objsh::Value& v){
    if(v.is_null()) return;
    if(v.is_list()){
        for(auto& item : v.as_list()) std::cout << objsh::to_display_string(item) << "\n";
        return;
    }
    std::cout << objsh::to_display_string(v) << "\n";
}

static void report(const objsh::EvalResult& r, const objsh::RuntimeEnv& env){
    if(r.error) std::cerr << objsh::format_diagnostic(*r.error) << "\n";
    objsh::maybe_print_json(r, env);
}

// Returns the process exit code.
static int run_source(objsh::Evaluator& ev, const std::string& src, const std::string& name){
    pwsh::Parser p;
    auto parsed = p.parse_string(src, name);
    if(!parsed.success){
        std::cerr << name << ":" << parsed.line << ":" << parsed.column << ": parse error: " << parsed.error_message << "\n";
        return 1;
    }
    auto r = ev.evaluate_program(parsed.program);
    if(!r.success){ report(r, ev.env()); return 1; }
    print_value(r.value);
    return 0;
}

static int repl(objsh::Evaluator& ev){
    pwsh::Parser p;
    std::string buffer, line;
    std::cout << kVersion << " (type 'exit' to quit)\n";
    while(true){
        std::cout << (buffer.empty() ? "PS > " : ">> ") << std::flush;
        if(!std::getline(std::cin, line)) break;
        if(buffer.empty() && (line=="exit" || line=="quit")) break;
        buffer += line;
        buffer += '\n';
        if(!pwsh::is_complete_input(buffer)) continue;
        auto parsed = p.parse_string(buffer, "<stdin>");
        buffer.clear();
        if(!parsed.success){
            std::cerr << "parse error (line " << parsed.line << ", col " << parsed.column << "): " << parsed.error_message << "\n";
            continue;
        }
        auto r = ev.evaluate_line(parsed.program.statements);
        if(!r.success){ report(r, ev.env()); continue; }
        print_value(r.value);
    }
    return 0;
}

int main(int argc, char** argv){
    try{
        objsh::Evaluator ev(pwsh::make_builtin_registry(), objsh::detectEnv());
        if(argc < 2) return repl(ev);
        const std::string arg = argv[1];
        if(arg == "--version"){ std::cout << kVersion << "\n"; return 0; }
        if(arg == "--help" || arg == "-h"){ usage(); return 0; }
        if(arg == "-c"){
            if(argc < 3){ usage(); return 2; }
            return run_source(ev, argv[2], "<command>");
        }
        std::ifstream f(arg, std::ios::binary);
        if(!f){ std::cerr << "objsh: cannot open '" << arg << "'\n"; return 2; }
        return run_source(ev, read_all(f), arg);
    } catch(const std::exception& e){
        std::cerr << "objsh: exception: " << e.what() << "\n";
        return 1;
    }
}
