#include "objsh/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace objsh {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_notes_json(std::ostringstream& os, const std::vector<ErrorNote>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)
          <<",\"line\":"<<notes[i].line
          <<",\"col\":"<<notes[i].col
          <<"}";
    }
    os<<"]";
}

std::string diagnostic_to_json(const Diagnostic& d){
    std::ostringstream os;
    os<<"{"
        "\"code\":"<<json_escape(d.code)
        <<",\"kind\":"<<json_escape(error_kind_name(d.kind))
        <<",\"message\":"<<json_escape(d.message)
        <<",\"hint\":"<<json_escape(d.hint)
        <<",\"subject\":"<<json_escape(d.subject)
        <<",\"line\":"<<d.line
        <<",\"col\":"<<d.col
        <<",\"notes\":";
    append_notes_json(os,d.notes);
    os<<"}";
    return os.str();
}

std::string diagnostics_to_json(const EvalResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    if(r.error) os<<diagnostic_to_json(*r.error);
    os<<"]}";
    return os.str();
}

void maybe_print_json(const EvalResult& r, const RuntimeEnv& env){
    if(!env.diagJson) return;
    auto js=diagnostics_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace objsh
