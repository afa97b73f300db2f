#pragma once
#include "objsh/stage_registry.hpp"
#include "objsh/value.hpp"
#include <memory>

namespace pwsh {

// Built-in pipeline stages. Each receives the whole upstream collection and returns a List.
objsh::Value write_output(objsh::StageContext& ctx);
objsh::Value where_object(objsh::StageContext& ctx);
objsh::Value foreach_object(objsh::StageContext& ctx);
objsh::Value select_object(objsh::StageContext& ctx);
objsh::Value sort_object(objsh::StageContext& ctx);
objsh::Value group_object(objsh::StageContext& ctx);

// Adds every built-in under its canonical name.
void register_builtin_stages(objsh::StageRegistry& reg);
std::shared_ptr<objsh::StageRegistry> make_builtin_registry();

} // namespace pwsh
