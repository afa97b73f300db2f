#include "pwsh/stages.hpp"

namespace pwsh {

void register_builtin_stages(objsh::StageRegistry& reg){
    reg.add_stage("Write-Output", write_output)
       .add_stage("Where-Object", where_object)
       .add_stage("ForEach-Object", foreach_object)
       .add_stage("Select-Object", select_object)
       .add_stage("Sort-Object", sort_object)
       .add_stage("Group-Object", group_object);
}

std::shared_ptr<objsh::StageRegistry> make_builtin_registry(){
    auto reg = std::make_shared<objsh::StageRegistry>();
    register_builtin_stages(*reg);
    return reg;
}

} // namespace pwsh
