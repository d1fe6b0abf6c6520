#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace orbital {

class orbital_error : public std::runtime_error {
public:
    explicit orbital_error(const std::string& message) : std::runtime_error(message) {}
};

class parse_error : public orbital_error {
public:
    parse_error(const std::string& message, bool incomplete)
        : orbital_error(message), incomplete_(incomplete) {}

    [[nodiscard]] bool incomplete() const noexcept { return incomplete_; }

private:
    bool incomplete_;
};

class eval_error : public orbital_error {
public:
    explicit eval_error(const std::string& message) : orbital_error(message) {}
};

class type_error : public eval_error {
public:
    explicit type_error(const std::string& message) : eval_error(message) {}
};

class unknown_operator_error : public eval_error {
public:
    explicit unknown_operator_error(const std::string& op)
        : eval_error("unknown operator: " + op), op_(op) {}

    [[nodiscard]] const std::string& op() const noexcept { return op_; }

private:
    std::string op_;
};

// Positions are 1-based argument indexes.
class arity_error : public eval_error {
public:
    arity_error(const std::string& op, std::size_t position)
        : eval_error(op + ": missing argument " + std::to_string(position)), op_(op), position_(position) {}

    [[nodiscard]] const std::string& op() const noexcept { return op_; }
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::string op_;
    std::size_t position_;
};

class timeout_error : public orbital_error {
public:
    explicit timeout_error(const std::string& message) : orbital_error(message) {}
};

}  // namespace orbital
