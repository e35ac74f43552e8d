// dm/instr.hpp
#pragma once
#include <cstdint>
#include <string>

// Operation codes, numbered exactly as they appear in the opcode field.
// Slot 4 is unused and decodes as an error.
enum class OpCode : uint8_t {
    HALT  = 0,
    LOAD  = 1,
    STORE = 2,
    ADD   = 3,
    SUB   = 5,
    MUL   = 6,
    DIV   = 7,
};

// The condition field of an instruction and the CPU condition register share
// this format, so an instruction is enabled iff (cpu & instr) != NEVER.
enum class CondFlag : uint8_t {
    NEVER  = 0,
    M      = 1,   // minus
    Z      = 2,   // zero
    P      = 4,   // positive
    V      = 8,   // overflow (division by zero)
    ALWAYS = 15,
};

inline CondFlag operator|(CondFlag a, CondFlag b){ return (CondFlag)((uint8_t)a | (uint8_t)b); }
inline CondFlag operator&(CondFlag a, CondFlag b){ return (CondFlag)((uint8_t)a & (uint8_t)b); }
inline CondFlag& operator|=(CondFlag& a, CondFlag b){ a = a | b; return a; }
inline bool any(CondFlag c){ return c != CondFlag::NEVER; }

constexpr int NUM_REGS = 16;
constexpr int REG_ZERO = 0;
constexpr int REG_PC   = 15;

struct Instruction {
    OpCode   op     = OpCode::HALT;
    CondFlag cond   = CondFlag::ALWAYS;
    uint8_t  target = 0;
    uint8_t  src1   = 0;
    uint8_t  src2   = 0;
    int32_t  offset = 0;

    bool operator==(const Instruction& o) const {
        return op == o.op && cond == o.cond && target == o.target
            && src1 == o.src1 && src2 == o.src2 && offset == o.offset;
    }
    bool operator!=(const Instruction& o) const { return !(*this == o); }

    // Assembly-like text, e.g. "ADD/Z   r1,r2,r3[-14]". No "/COND" for ALWAYS.
    std::string to_string() const;
};

// Throws DecodeError on an undefined opcode or a set reserved bit.
Instruction decode(uint32_t word);
uint32_t    encode(const Instruction& instr);

bool        op_defined(uint32_t code);
const char* op_name(OpCode op);
std::string cond_name(CondFlag cond);

// Name lookups. All throw LookupError on a miss; names are case-insensitive.
OpCode   op_from_name(const std::string& name);
CondFlag cond_from_name(const std::string& name);   // ALWAYS, NEVER or letters of N/M,Z,P,V
uint8_t  reg_from_name(const std::string& name);    // r0..r15, zero, pc

// Builds an instruction from symbolic fields, as produced by the assembler.
Instruction instruction_from_fields(const std::string& op, const std::string& pred,
                                    const std::string& target, const std::string& src1,
                                    const std::string& src2, int32_t offset);
