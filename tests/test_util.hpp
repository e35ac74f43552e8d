// tests/test_util.hpp
#pragma once
#include <cstdint>
#include <iostream>
#include "dm/instr.hpp"
#include "dm/mem.hpp"
#include "dm/cpu.hpp"

inline Instruction mk(OpCode op, CondFlag cond, int t, int s1, int s2, int32_t off){
    Instruction i;
    i.op = op; i.cond = cond;
    i.target = (uint8_t)t; i.src1 = (uint8_t)s1; i.src2 = (uint8_t)s2;
    i.offset = off;
    return i;
}
inline void put_instr(Memory& m, int32_t a, const Instruction& i){ m.put(a, (int32_t)encode(i)); }

struct TestCtx{
    int passed=0, failed=0;
    void ok(bool cond, const char* msg){
        if(cond){ ++passed; } else { ++failed; std::cout << "[FAIL] " << msg << "\n"; }
    }
    int summary(){
        std::cout << "[tests] passed=" << passed << " failed=" << failed << "\n";
        return failed ? 1 : 0;
    }
};
