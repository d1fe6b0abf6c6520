#pragma once

#include <string>
#include <vector>

#include "behavior/definition.hpp"
#include "behavior/error.hpp"
#include "orbital/value.hpp"

namespace behavior {

// Builds a definition from a JSON behavior document. Shape problems (wrong member
// types, no states, no resolvable initial state) throw behavior_compile_error.
definition compile_definition(const orbital::value& doc);
definition compile_definition_text(const std::string& json_text);

// Catalog-level checks on an already compiled definition. Empty means valid.
std::vector<std::string> validate_definition(const definition& def);

// Optional defaults, then overrides. A missing required field throws behavior_error.
orbital::value resolve_config(const definition& def, const orbital::value& overrides);

// Every data entity's field defaults merged into one map, later entities winning.
orbital::value default_entity_data(const definition& def);

}  // namespace behavior
