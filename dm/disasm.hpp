#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>

class Memory;

// Instruction text for a word, or "DATA <value>" if it does not decode.
std::string disasm(uint32_t word);

// n words from addr: address, value, disassembly. Console ports are shown
// as "<console>" and not read. Throws std::out_of_range past the end.
void dump_words(std::ostream& os, const Memory& mem, int32_t addr, int n);
