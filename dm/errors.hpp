// dm/errors.hpp
#pragma once
#include <stdexcept>
#include <string>

// Source line matches none of the assembler line shapes.
struct SyntaxError : std::runtime_error {
    explicit SyntaxError(const std::string& m) : std::runtime_error(m) {}
};
// Symbolic operand names a label that was never defined.
struct UnresolvedLabelError : std::runtime_error {
    explicit UnresolvedLabelError(const std::string& m) : std::runtime_error(m) {}
};
struct DuplicateLabelError : std::runtime_error {
    explicit DuplicateLabelError(const std::string& m) : std::runtime_error(m) {}
};
// Unknown opcode, predicate or register name.
struct LookupError : std::runtime_error {
    explicit LookupError(const std::string& m) : std::runtime_error(m) {}
};
// Word whose opcode bits have no defined meaning. Fatal to a run.
struct DecodeError : std::runtime_error {
    explicit DecodeError(const std::string& m) : std::runtime_error(m) {}
};
