#include "objsh/stage_registry.hpp"

namespace objsh {

StageRegistry& StageRegistry::add_stage(std::string name, StageFn fn){
    std::string key = to_lower(name);
    auto it = stages_.find(key);
    if(it!=stages_.end()){ it->second.fn = std::move(fn); return *this; }
    order_.push_back(name);
    stages_.emplace(std::move(key), Entry{std::move(name), std::move(fn)});
    return *this;
}

std::optional<StageRegistry::Handle> StageRegistry::resolve(std::string_view name) const {
    auto it = stages_.find(to_lower(name));
    if(it==stages_.end()) return std::nullopt;
    return Handle(&it->second);
}

Value StageRegistry::invoke(const Handle& h, const List& input, const List& positional, const Record& named, BlockRunner& runner) const {
    StageContext ctx{input, positional, named, runner};
    return h.entry_->fn(ctx);
}

std::vector<std::string> StageRegistry::names() const { return order_; }

} // namespace objsh
