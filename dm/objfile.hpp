// dm/objfile.hpp
#pragma once
#include <cstdint>
#include <iosfwd>
#include <vector>

class Memory;

// Object code: one signed decimal word per line. Blank lines and lines
// starting with '#' are ignored on read.
void write_object(std::ostream& out, const std::vector<int32_t>& words);

// Throws std::runtime_error naming the offending line.
std::vector<int32_t> read_object(std::istream& in);

// Returns the address one past the last word written.
int32_t load_program(Memory& mem, const std::vector<int32_t>& words, int32_t base = 0);
