#include "orbital/stdlib.hpp"

namespace orbital {

void install_std_modules(registrar& r) {
    install_math_module(r);
    install_str_module(r);
    install_array_module(r);
    install_object_module(r);
    install_time_module(r);
    install_format_module(r);
    install_validate_module(r);
    install_async_module(r);
}

}  // namespace orbital
