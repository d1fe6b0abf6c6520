#pragma once

#include <string>

#include "orbital/error.hpp"

namespace behavior {

class behavior_compile_error : public orbital::orbital_error {
public:
    explicit behavior_compile_error(const std::string& message) : orbital::orbital_error(message) {}
};

// Instance-level failures: bad configuration, unknown handles.
class behavior_error : public orbital::orbital_error {
public:
    explicit behavior_error(const std::string& message) : orbital::orbital_error(message) {}
};

}  // namespace behavior
