#include "objsh/scope.hpp"
#include <stdexcept>
#include <cstdio>

namespace objsh {

const Value* Frame::get(std::string_view name) const {
    auto it = index_.find(to_lower(name));
    if(it==index_.end()) return nullptr;
    return &bindings_[it->second].second;
}

void Frame::set(std::string_view name, Value value){
    std::string key = to_lower(name);
    auto it = index_.find(key);
    if(it!=index_.end()){ bindings_[it->second].second = std::move(value); return; }
    index_.emplace(std::move(key), bindings_.size());
    bindings_.emplace_back(std::string(name), std::move(value));
}

QualifiedName parse_qualifier(std::string_view name){
    auto colon = name.find(':');
    if(colon==std::string_view::npos) return {ScopeQualifier::None, name};
    std::string_view prefix = name.substr(0, colon);
    std::string_view rest = name.substr(colon+1);
    if(iequals(prefix,"global")) return {ScopeQualifier::Global, rest};
    if(iequals(prefix,"local")) return {ScopeQualifier::Local, rest};
    if(iequals(prefix,"script")) return {ScopeQualifier::Script, rest};
    return {ScopeQualifier::None, name};
}

ScopeStack::ScopeStack(){ frames_.emplace_back(FrameKind::Global); }

void ScopeStack::push_frame(FrameKind kind){
    frames_.emplace_back(kind);
    if(trace_) std::fprintf(stderr, "[dbg][scope][push] kind=%d depth=%zu\n", (int)kind, frames_.size());
}

void ScopeStack::pop_frame(){
    if(frames_.size()<=1) throw std::logic_error("scope stack: attempt to pop the global frame");
    frames_.pop_back();
    if(trace_) std::fprintf(stderr, "[dbg][scope][pop] depth=%zu\n", frames_.size());
}

size_t ScopeStack::walk_floor() const {
    for(size_t i=frames_.size(); i-- > 1;){
        if(frames_[i].kind()==FrameKind::Function) return i;
    }
    return 0;
}

std::optional<Value> ScopeStack::read(std::string_view name) const {
    auto q = parse_qualifier(name);
    switch(q.qualifier){
        case ScopeQualifier::Global:
        case ScopeQualifier::Script:
            if(auto v = global_frame().get(q.base)) return *v;
            return std::nullopt;
        case ScopeQualifier::Local:
            if(auto v = local_frame().get(q.base)) return *v;
            return std::nullopt;
        case ScopeQualifier::None: break;
    }
    size_t floor = walk_floor();
    for(size_t i=frames_.size(); i-- > floor;){
        if(auto v = frames_[i].get(q.base)) return *v;
    }
    if(floor>0){
        if(auto v = global_frame().get(q.base)) return *v;
    }
    return std::nullopt;
}

void ScopeStack::write(std::string_view name, Value value){
    auto q = parse_qualifier(name);
    switch(q.qualifier){
        case ScopeQualifier::Global: global_frame().set(q.base, std::move(value)); return;
        case ScopeQualifier::Script: script_frame().set(q.base, std::move(value)); return;
        case ScopeQualifier::Local: local_frame().set(q.base, std::move(value)); return;
        case ScopeQualifier::None: break;
    }
    size_t floor = walk_floor();
    for(size_t i=frames_.size(); i-- > floor;){
        if(frames_[i].contains(q.base)){ frames_[i].set(q.base, std::move(value)); return; }
    }
    // inside a function the global frame is readable but not implicitly writable
    local_frame().set(q.base, std::move(value));
}

void ScopeStack::define(std::string_view name, Value value){
    local_frame().set(name, std::move(value));
}

std::vector<std::string> ScopeStack::visible_names() const {
    std::vector<std::string> out;
    size_t floor = walk_floor();
    for(size_t i=frames_.size(); i-- > floor;){
        for(auto &b : frames_[i].bindings()) out.push_back(b.first);
    }
    if(floor>0) for(auto &b : global_frame().bindings()) out.push_back(b.first);
    return out;
}

} // namespace objsh
