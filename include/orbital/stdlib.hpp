#pragma once

#include "orbital/extensions.hpp"

namespace orbital {

// Registers every std module under its "module/" prefix.
void install_std_modules(registrar& r);

void install_math_module(registrar& r);
void install_str_module(registrar& r);
void install_array_module(registrar& r);
void install_object_module(registrar& r);
void install_time_module(registrar& r);
void install_format_module(registrar& r);
void install_validate_module(registrar& r);
void install_async_module(registrar& r);

}  // namespace orbital
