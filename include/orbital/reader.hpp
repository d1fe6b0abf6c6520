#pragma once

#include <string_view>
#include <vector>

#include "orbital/value.hpp"

namespace orbital {

// JSON text reader. ';' starts a comment that runs to end of line outside strings.
value read_json(std::string_view source);
std::vector<value> read_all_json(std::string_view source);

}  // namespace orbital
