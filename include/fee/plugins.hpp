// Built-in verb plugins. The catalog is closed; external verbs register through VerbRegistry.
#pragma once
#include "fee/verb.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fee::plugins {

PluginModule load_plugin();
PluginModule class_definition();
PluginModule debug();
PluginModule variables();
PluginModule feature();
PluginModule routine();
PluginModule substitute();
PluginModule position();
PluginModule chain();
PluginModule anchors();
PluginModule conditional();
PluginModule include();

} // namespace fee::plugins

namespace fee {

// Built-in plugin by name, or nothing for a name outside the catalog.
std::optional<PluginModule> builtin_plugin(const std::string& name);
const std::vector<std::string>& builtin_plugin_names();

} // namespace fee
