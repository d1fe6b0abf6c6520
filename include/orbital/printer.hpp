#pragma once

#include <string>

#include "orbital/value.hpp"

namespace orbital {

// Display form: JSON-like, but keeps undefined, NaN and Infinity visible.
std::string print_value(const value& v);
// Strict JSON. Undefined map members are omitted; other undefined and non-finite values become null.
std::string write_json(const value& v);

}  // namespace orbital
