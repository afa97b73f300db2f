#include "pwsh/stages.hpp"
#include "stage_args.hpp"

using namespace objsh;

namespace pwsh {

Value write_output(StageContext& ctx){
    if(!ctx.input.empty()) return Value(detail::unroll(ctx.input));
    return Value(detail::unroll(ctx.positional));
}

// Where-Object { $_ -gt 2 }  |  Where-Object -Property Enabled
Value where_object(StageContext& ctx){
    List out;
    if(auto filter = detail::block_arg(ctx, "FilterScript")){
        for(auto& item : ctx.input){
            if(to_boolean(ctx.runner.run_block(*filter, item))) out.push_back(item);
        }
        return Value(std::move(out));
    }
    auto props = detail::property_names(ctx, "Property");
    if(props.empty()) return Value(ctx.input);
    for(auto& item : ctx.input){
        auto v = get_property(item, props.front());
        if(v && to_boolean(*v)) out.push_back(item);
    }
    return Value(std::move(out));
}

// ForEach-Object { $_ * 2 }  |  ForEach-Object -MemberName Name
Value foreach_object(StageContext& ctx){
    List out;
    out.reserve(ctx.input.size());
    if(auto process = detail::block_arg(ctx, "Process")){
        for(auto& item : ctx.input) out.push_back(ctx.runner.run_block(*process, item));
        return Value(std::move(out));
    }
    auto members = detail::property_names(ctx, "MemberName");
    if(members.empty()) return Value(ctx.input);
    for(auto& item : ctx.input){
        if(auto v = get_property(item, members.front())) out.push_back(*v);
    }
    return Value(std::move(out));
}

} // namespace pwsh
