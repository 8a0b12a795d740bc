#pragma once

#include "PL/AST.hpp"
#include <stdexcept>
#include <string>

namespace pl {

// Thrown for semantic failures, e.g. a rule that cannot be made safe
struct PolicyException final : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Non-fatal validation finding, reported in lists
struct PolicyError {
    std::string message;
    SourceLocation loc{};
};

} // namespace pl
