#include "fee/plugins.hpp"

namespace fee {

const std::vector<std::string>& builtin_plugin_names(){
    static const std::vector<std::string> names{"LoadPlugin", "ClassDefinition", "Debug", "Variables", "Feature", "Routine",
                                                "Substitute", "Position", "Chain", "Anchors", "Conditional", "Include"};
    return names;
}

std::optional<PluginModule> builtin_plugin(const std::string& name){
    if(name=="LoadPlugin") return plugins::load_plugin();
    if(name=="ClassDefinition") return plugins::class_definition();
    if(name=="Debug") return plugins::debug();
    if(name=="Variables") return plugins::variables();
    if(name=="Feature") return plugins::feature();
    if(name=="Routine") return plugins::routine();
    if(name=="Substitute") return plugins::substitute();
    if(name=="Position") return plugins::position();
    if(name=="Chain") return plugins::chain();
    if(name=="Anchors") return plugins::anchors();
    if(name=="Conditional") return plugins::conditional();
    if(name=="Include") return plugins::include();
    return std::nullopt;
}

} // namespace fee
