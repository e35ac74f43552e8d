#include "alu.hpp"
#include <limits>

static inline CondFlag sign_flag(int32_t v){
    if (v < 0)  return CondFlag::M;
    if (v == 0) return CondFlag::Z;
    return CondFlag::P;
}

// two's complement wrap of a 64-bit intermediate
static inline int32_t wrap32(int64_t v){
    return (int32_t)(uint32_t)(uint64_t)v;
}

AluResult alu_execute(OpCode op, int32_t a, int32_t b)
{
    AluResult r;
    bool overflow = false;

    switch (op) {
    case OpCode::SUB:
        r.value = wrap32((int64_t)a - b);
        break;
    case OpCode::MUL:
        r.value = wrap32((int64_t)a * b);
        break;
    case OpCode::DIV:
        if (b == 0) {
            r.value = 0; overflow = true;
        } else if (a == std::numeric_limits<int32_t>::min() && b == -1) {
            r.value = a; overflow = true;     // quotient not representable
        } else {
            r.value = a / b;                  // truncates toward zero
        }
        break;
    case OpCode::ADD:
    case OpCode::HALT:
    case OpCode::LOAD:
    case OpCode::STORE:
        r.value = wrap32((int64_t)a + b);
        break;
    }

    r.flags = sign_flag(r.value);
    if (overflow) r.flags |= CondFlag::V;
    return r;
}
