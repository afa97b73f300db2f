#include "objsh/errors.hpp"
#include "objsh/value.hpp"
#include <algorithm>
#include <sstream>
#include <cctype>
#include <string>

namespace objsh {

const char* error_kind_name(ErrorKind k){
    switch(k){
        case ErrorKind::UndefinedVariable: return "UndefinedVariable";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
        case ErrorKind::DivisionByZero: return "DivisionByZero";
        case ErrorKind::CommandNotFound: return "CommandNotFound";
        case ErrorKind::InvalidPropertyAccess: return "InvalidPropertyAccess";
        case ErrorKind::ReturnOutsideFunction: return "ReturnOutsideFunction";
        case ErrorKind::RecursionLimit: return "RecursionLimit";
        case ErrorKind::InvalidOperation: return "InvalidOperation";
    }
    return "Unknown";
}

namespace {
RuntimeError make(ErrorKind kind, std::string code, std::string message, std::string hint, std::string subject = {}){
    Diagnostic d;
    d.kind=kind; d.code=std::move(code); d.message=std::move(message); d.hint=std::move(hint); d.subject=std::move(subject);
    return RuntimeError(std::move(d));
}
}

namespace errors {

RuntimeError undefined_variable(const std::string& name){
    return make(ErrorKind::UndefinedVariable, "E0101", "Variable '$"+name+"' is not defined", "assign $"+name+" before reading it", name);
}
RuntimeError type_mismatch(const std::string& operation, const std::string& expected, const std::string& got){
    auto e = make(ErrorKind::TypeMismatch, "E0201", "Type mismatch in "+operation+": expected "+expected+", got "+got,
                  "convert the operand to "+expected);
    e.diagnostic().notes.push_back(ErrorNote{"expected: "+expected});
    e.diagnostic().notes.push_back(ErrorNote{"   found: "+got});
    return e;
}
RuntimeError division_by_zero(){
    return make(ErrorKind::DivisionByZero, "E0202", "Division by zero", "check the divisor before dividing");
}
RuntimeError command_not_found(const std::string& name){
    return make(ErrorKind::CommandNotFound, "E0301", "The term '"+name+"' is not recognized as a function or stage",
                "define a function named "+name+" or register a stage", name);
}
RuntimeError property_not_found(const std::string& name, const std::string& base_kind){
    return make(ErrorKind::InvalidPropertyAccess, "E0401", "Invalid property access: property '"+name+"' not found on "+base_kind,
                "check the property name", name);
}
RuntimeError not_a_record(const std::string& name, const std::string& base_kind){
    return make(ErrorKind::InvalidPropertyAccess, "E0402", "Invalid property access: cannot read '"+name+"' from a "+base_kind,
                "only Records have properties", name);
}
RuntimeError return_outside_function(){
    return make(ErrorKind::ReturnOutsideFunction, "E0501", "Return statement outside of function", "move return into a function body");
}
RuntimeError recursion_limit(const std::string& function, int limit){
    return make(ErrorKind::RecursionLimit, "E0601", "Call depth limit of "+std::to_string(limit)+" exceeded in '"+function+"'",
                "raise OBJSH_MAX_CALL_DEPTH or add a base case", function);
}
RuntimeError invalid_operation(std::string message, std::string hint){
    return make(ErrorKind::InvalidOperation, "E0701", std::move(message), std::move(hint));
}

} // namespace errors

int edit_distance(const std::string& a, const std::string& b){
    size_t n=a.size(), m=b.size();
    if(n>64||m>64){ // cap to avoid large allocs; positional mismatch count instead
        int dist=0; for(size_t i=0;i<std::min(n,m);++i) if(std::tolower((unsigned char)a[i])!=std::tolower((unsigned char)b[i])) ++dist;
        return dist + (int)std::max(n,m) - (int)std::min(n,m);
    }
    int dp[65][65];
    for(size_t i=0;i<=n;++i) dp[i][0]=(int)i;
    for(size_t j=0;j<=m;++j) dp[0][j]=(int)j;
    for(size_t i=1;i<=n;++i){
        for(size_t j=1;j<=m;++j){
            int c = std::tolower((unsigned char)a[i-1])==std::tolower((unsigned char)b[j-1]) ? 0 : 1;
            dp[i][j]=std::min({dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+c});
        }
    }
    return dp[n][m];
}

std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist){
    std::vector<std::string> out;
    for(auto &c: pool){
        if(c.empty() || iequals(c,target)) continue;
        if(std::find_if(out.begin(), out.end(), [&](const std::string& o){ return iequals(o,c); })!=out.end()) continue;
        if(edit_distance(target,c)<=maxDist) out.push_back(c);
    }
    if(out.size()>5) out.resize(5);
    return out;
}

void append_suggestions(Diagnostic& d, const std::vector<std::string>& suggs, bool enabled){
    if(!enabled || suggs.empty()) return;
    std::string msg="did you mean ";
    for(size_t i=0;i<suggs.size();++i){ msg+=suggs[i]; if(i+1<suggs.size()) msg+= i+2==suggs.size()?" or ":", "; }
    d.notes.push_back(ErrorNote{msg,d.line,d.col});
}

std::string format_diagnostic(const Diagnostic& d){
    std::ostringstream os;
    os<<"error["<<d.code<<"]: "<<d.message;
    if(d.line>=0) os<<" (line "<<d.line<<", col "<<d.col<<")";
    for(auto &n : d.notes) os<<"\n  note: "<<n.message;
    if(!d.hint.empty()) os<<"\n  hint: "<<d.hint;
    return os.str();
}

} // namespace objsh
