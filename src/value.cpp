#include "objsh/value.hpp"
#include <charconv>
#include <cctype>
#include <cmath>
#include <algorithm>

namespace objsh {

bool iequals(std::string_view a, std::string_view b){
    if(a.size()!=b.size()) return false;
    for(size_t i=0;i<a.size();++i){
        if(std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    }
    return true;
}

std::string to_lower(std::string_view s){
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return out;
}

int icompare(std::string_view a, std::string_view b){
    size_t n = std::min(a.size(), b.size());
    for(size_t i=0;i<n;++i){
        int ca = std::tolower((unsigned char)a[i]); int cb = std::tolower((unsigned char)b[i]);
        if(ca!=cb) return ca<cb ? -1 : 1;
    }
    if(a.size()==b.size()) return 0;
    return a.size()<b.size() ? -1 : 1;
}

const Value* Record::find(std::string_view key) const {
    for(auto &e : entries_) if(e.first==key) return &e.second;
    for(auto &e : entries_) if(iequals(e.first,key)) return &e.second;
    return nullptr;
}

void Record::set(std::string key, Value value){
    for(auto &e : entries_){
        if(iequals(e.first,key)){ e.second = std::move(value); return; }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

bool to_boolean(const Value& v){
    switch(v.kind()){
        case ValueKind::Null: return false;
        case ValueKind::Boolean: return v.as_bool();
        case ValueKind::Number: return v.as_number()!=0.0;
        case ValueKind::String: return !v.as_string().empty();
        default: return true;
    }
}

std::optional<double> parse_number(std::string_view text){
    size_t b=0, e=text.size();
    while(b<e && std::isspace((unsigned char)text[b])) ++b;
    while(e>b && std::isspace((unsigned char)text[e-1])) --e;
    if(b==e) return std::nullopt;
    bool neg=false;
    if(text[b]=='+' || text[b]=='-'){ neg = text[b]=='-'; ++b; }
    if(b==e) return std::nullopt;
    // from_chars would also take inf/nan spellings; only plain decimals count as numeric here
    if(!(std::isdigit((unsigned char)text[b]) || text[b]=='.')) return std::nullopt;
    double d=0.0;
    auto res = std::from_chars(text.data()+b, text.data()+e, d, std::chars_format::general);
    if(res.ec!=std::errc{} || res.ptr!=text.data()+e) return std::nullopt;
    return neg ? -d : d;
}

std::optional<double> to_number(const Value& v){
    if(v.is_number()) return v.as_number();
    if(v.is_string()) return parse_number(v.as_string());
    return std::nullopt;
}

std::string format_number(double d){
    if(std::isnan(d)) return "NaN";
    if(std::isinf(d)) return d<0 ? "-Infinity" : "Infinity";
    if(d==0.0) return "0";
    char buf[64];
    auto res = std::to_chars(buf, buf+sizeof(buf), d);
    return std::string(buf, res.ptr);
}

std::string to_display_string(const Value& v){
    switch(v.kind()){
        case ValueKind::Null: return "";
        case ValueKind::Boolean: return v.as_bool() ? "True" : "False";
        case ValueKind::Number: return format_number(v.as_number());
        case ValueKind::String: return v.as_string();
        case ValueKind::Record: {
            std::string out="@{";
            bool first=true;
            for(auto &e : v.as_record().entries()){
                if(!first) out+="; ";
                first=false;
                out+=e.first; out+='='; out+=to_display_string(e.second);
            }
            out+='}';
            return out;
        }
        case ValueKind::List: {
            std::string out;
            const auto &l = v.as_list();
            for(size_t i=0;i<l.size();++i){ if(i) out+=", "; out+=to_display_string(l[i]); }
            return out;
        }
        case ValueKind::Function: return v.as_function().name;
        case ValueKind::Block: return "{ ... }";
    }
    return "";
}

std::optional<Value> get_property(const Value& v, std::string_view name){
    if(!v.is_record()) return std::nullopt;
    if(const Value* p = v.as_record().find(name)) return *p;
    return std::nullopt;
}

const char* kind_name(const Value& v){
    switch(v.kind()){
        case ValueKind::Null: return "Null";
        case ValueKind::Boolean: return "Boolean";
        case ValueKind::Number: return "Number";
        case ValueKind::String: return "String";
        case ValueKind::Record: return "Record";
        case ValueKind::List: return "List";
        case ValueKind::Function: return "Function";
        case ValueKind::Block: return "ScriptBlock";
    }
    return "Unknown";
}

bool values_equal(const Value& a, const Value& b){
    if(a.kind()!=b.kind()) return false;
    switch(a.kind()){
        case ValueKind::Null: return true;
        case ValueKind::Boolean: return a.as_bool()==b.as_bool();
        case ValueKind::Number: return a.as_number()==b.as_number();
        case ValueKind::String: return a.as_string()==b.as_string();
        case ValueKind::Record: {
            auto &ra=a.as_record().entries(); auto &rb=b.as_record().entries();
            if(ra.size()!=rb.size()) return false;
            for(size_t i=0;i<ra.size();++i){
                if(!iequals(ra[i].first, rb[i].first) || !values_equal(ra[i].second, rb[i].second)) return false;
            }
            return true;
        }
        case ValueKind::List: {
            auto &la=a.as_list(); auto &lb=b.as_list();
            if(la.size()!=lb.size()) return false;
            for(size_t i=0;i<la.size();++i) if(!values_equal(la[i], lb[i])) return false;
            return true;
        }
        case ValueKind::Function: return std::get<Value::FunctionPtr>(a.data)==std::get<Value::FunctionPtr>(b.data);
        case ValueKind::Block: return std::get<Value::BlockPtr>(a.data)==std::get<Value::BlockPtr>(b.data);
    }
    return false;
}

} // namespace objsh
