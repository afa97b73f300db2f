#include "pwsh/stages.hpp"
#include "stage_args.hpp"
#include <algorithm>
#include <cmath>
#include <optional>

using namespace objsh;

namespace pwsh {

namespace {

// Nulls first, then anything numeric (Numbers and numeric Strings) by value, then the rest by
// case-insensitive display text. Ranking by class keeps mixed keys a strict weak ordering.
int compare_keys(const Value& a, const Value& b){
    auto numeric = [](const Value& v)->std::optional<double>{
        auto n = to_number(v);
        if(n && std::isnan(*n)) return std::nullopt;
        return n;
    };
    auto rank = [&](const Value& v, const std::optional<double>& n){ return v.is_null() ? 0 : (n ? 1 : 2); };
    auto na = numeric(a), nb = numeric(b);
    int ra = rank(a, na), rb = rank(b, nb);
    if(ra!=rb) return ra<rb ? -1 : 1;
    if(ra==0) return 0;
    if(ra==1) return *na<*nb ? -1 : (*na>*nb ? 1 : 0);
    return icompare(to_display_string(a), to_display_string(b));
}

Value sort_key(const Value& item, const std::string& prop){
    if(prop.empty()) return item;
    return get_property(item, prop).value_or(Value::null());
}

std::string group_key(const Value& item, const std::vector<std::string>& props){
    if(props.empty()) return to_display_string(item);
    std::string key;
    for(size_t i=0;i<props.size();++i){
        if(i) key += ", ";
        key += to_display_string(sort_key(item, props[i]));
    }
    return key;
}

} // namespace

// Select-Object Name, Age  |  Select-Object -Property Name -First 2  |  Select-Object -Last 1
Value select_object(StageContext& ctx){
    List items = ctx.input;
    if(auto v = ctx.named_arg("First")){
        size_t n = detail::count_arg(*v, "Select-Object", "First");
        if(n < items.size()) items.resize(n);
    }
    if(auto v = ctx.named_arg("Last")){
        size_t n = detail::count_arg(*v, "Select-Object", "Last");
        if(n < items.size()) items.erase(items.begin(), items.end() - (std::ptrdiff_t)n);
    }
    auto props = detail::property_names(ctx, "Property");
    if(props.empty()) return Value(std::move(items));
    List out;
    out.reserve(items.size());
    for(auto& item : items){
        Record r;
        for(auto& p : props) r.set(p, get_property(item, p).value_or(Value::null()));
        out.push_back(Value(std::move(r)));
    }
    return Value(std::move(out));
}

// Sort-Object  |  Sort-Object Age -Descending  |  Sort-Object -Property Name
Value sort_object(StageContext& ctx){
    List items = detail::unroll(ctx.input);
    List spilled;
    bool descending = detail::switch_arg(ctx, "Descending", spilled);
    auto props = detail::property_names(ctx, "Property", spilled);
    if(props.empty()) props.push_back(std::string());
    std::stable_sort(items.begin(), items.end(), [&](const Value& a, const Value& b){
        for(auto& p : props){
            int c = compare_keys(sort_key(a, p), sort_key(b, p));
            if(c!=0) return descending ? c>0 : c<0;
        }
        return false;
    });
    return Value(std::move(items));
}

// Group-Object Department  |  Group-Object -Property Dept -NoElement  |  -AsHashTable
Value group_object(StageContext& ctx){
    List spilled;
    bool as_table = detail::switch_arg(ctx, "AsHashTable", spilled);
    bool no_element = detail::switch_arg(ctx, "NoElement", spilled);
    auto props = detail::property_names(ctx, "Property", spilled);
    std::vector<std::pair<std::string, List>> groups;
    for(auto& item : ctx.input){
        std::string key = group_key(item, props);
        auto it = std::find_if(groups.begin(), groups.end(), [&](const auto& g){ return iequals(g.first, key); });
        if(it==groups.end()){ groups.emplace_back(key, List{item}); }
        else it->second.push_back(item);
    }
    if(as_table){
        Record table;
        for(auto& g : groups) table.set(g.first, Value(std::move(g.second)));
        return Value(std::move(table));
    }
    List out;
    out.reserve(groups.size());
    for(auto& g : groups){
        Record r;
        r.set("Count", Value(static_cast<double>(g.second.size())));
        r.set("Name", Value(g.first));
        if(!no_element) r.set("Group", Value(std::move(g.second)));
        out.push_back(Value(std::move(r)));
    }
    return Value(std::move(out));
}

} // namespace pwsh
