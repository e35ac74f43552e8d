// dm/alu.hpp
#pragma once
#include <cstdint>
#include "instr.hpp"

struct AluResult {
    int32_t  value = 0;
    CondFlag flags = CondFlag::Z;
};

// Arithmetic wraps at 32 bits. HALT, LOAD and STORE compute a + b (the
// effective address); the CPU decides what the result means.
// Division by zero gives 0 with V set; it never throws.
AluResult alu_execute(OpCode op, int32_t a, int32_t b);
