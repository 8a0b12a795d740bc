#pragma once

#include "PL/AST.hpp"
#include <string>
#include <string_view>
#include <stdexcept>
#include <vector>

namespace pl {

struct ParseError final : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Parse a sequence of rules and facts (full file content)
std::vector<Formula> parseProgram(std::string_view source);

// Convenience: parse a file from disk
std::vector<Formula> parseFile(const std::string& path);

// Parse exactly one rule or fact; bare atoms stay atoms
Formula parseFormula(std::string_view source);

// Parse exactly one statement and wrap it as a rule
Rule parseRule(std::string_view source);

// Parse exactly one atom
Atom parseAtom(std::string_view source);

} // namespace pl
