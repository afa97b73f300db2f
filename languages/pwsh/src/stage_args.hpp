// Argument helpers shared by the built-in stages.
#pragma once
#include "objsh/errors.hpp"
#include "objsh/stage_registry.hpp"
#include "objsh/value.hpp"
#include <limits>
#include <string>
#include <vector>

namespace pwsh::detail {

// Script block passed as -<param> or as the first positional argument.
inline const objsh::DeferredBlock* block_arg(const objsh::StageContext& ctx, const char* param){
    if(auto v = ctx.named_arg(param); v && v->is_block()) return &v->as_block();
    if(!ctx.positional.empty() && ctx.positional.front().is_block()) return &ctx.positional.front().as_block();
    return nullptr;
}

// Property names from a String or a List of values.
inline void append_names(std::vector<std::string>& out, const objsh::Value& v){
    if(v.is_list()){ for(auto& e : v.as_list()) append_names(out, e); return; }
    if(v.is_null()) return;
    out.push_back(objsh::to_display_string(v));
}

// A bare switch followed by a value (`-Descending Age`) binds that value to the switch.
// Anything other than a Boolean is handed back as a positional and the switch counts as set.
inline bool switch_arg(const objsh::StageContext& ctx, const char* name, objsh::List& spilled){
    auto v = ctx.named_arg(name);
    if(!v) return false;
    if(v->is_bool()) return v->as_bool();
    spilled.push_back(*v);
    return true;
}

// -<param> if given, else the non-block positional arguments (plus any spilled switch values).
inline std::vector<std::string> property_names(const objsh::StageContext& ctx, const char* param, const objsh::List& spilled = {}){
    std::vector<std::string> out;
    if(auto v = ctx.named_arg(param)){ append_names(out, *v); return out; }
    for(auto& p : ctx.positional){ if(!p.is_block()) append_names(out, p); }
    for(auto& p : spilled){ if(!p.is_block()) append_names(out, p); }
    return out;
}

inline size_t count_arg(const objsh::Value& v, const char* stage, const char* param){
    auto n = objsh::to_number(v);
    if(!n || !(*n >= 0)) throw objsh::errors::invalid_operation(std::string(stage)+": -"+param+" expects a non-negative number, got "+objsh::kind_name(v),
                                                               std::string("pass -")+param+" <count>");
    if(*n >= static_cast<double>(std::numeric_limits<size_t>::max())) return std::numeric_limits<size_t>::max();
    return static_cast<size_t>(*n);
}

inline objsh::List unroll(const objsh::List& items){
    objsh::List out;
    for(auto& v : items){
        if(v.is_list()) out.insert(out.end(), v.as_list().begin(), v.as_list().end());
        else out.push_back(v);
    }
    return out;
}

} // namespace pwsh::detail
