#include "test_util.hpp"
#include "dm/alu.hpp"
#include <limits>

int main(){
    TestCtx t;
    const int32_t MIN = std::numeric_limits<int32_t>::min();
    const int32_t MAX = std::numeric_limits<int32_t>::max();

    AluResult r = alu_execute(OpCode::SUB, 5, 5);
    t.ok(r.value == 0 && r.flags == CondFlag::Z, "5-5 is zero, Z only");

    r = alu_execute(OpCode::SUB, 3, 5);
    t.ok(r.value == -2 && r.flags == CondFlag::M, "3-5 is negative");

    r = alu_execute(OpCode::ADD, 2, 3);
    t.ok(r.value == 5 && r.flags == CondFlag::P, "2+3 positive");

    r = alu_execute(OpCode::MUL, -3, 4);
    t.ok(r.value == -12 && r.flags == CondFlag::M, "-3*4");

    r = alu_execute(OpCode::DIV, 7, 2);
    t.ok(r.value == 3 && r.flags == CondFlag::P, "7/2 = 3");
    r = alu_execute(OpCode::DIV, -7, 2);
    t.ok(r.value == -3 && r.flags == CondFlag::M, "-7/2 truncates toward zero");

    r = alu_execute(OpCode::DIV, 7, 0);
    t.ok(r.value == 0, "divide by zero gives 0");
    t.ok(r.flags == (CondFlag::Z | CondFlag::V), "divide by zero sets V");

    r = alu_execute(OpCode::DIV, MIN, -1);
    t.ok(r.value == MIN && r.flags == (CondFlag::M | CondFlag::V), "MIN/-1 overflows");

    r = alu_execute(OpCode::ADD, MAX, 1);
    t.ok(r.value == MIN && r.flags == CondFlag::M, "add wraps at 32 bits");

    // memory ops compute the effective address
    r = alu_execute(OpCode::LOAD, 10, 5);
    t.ok(r.value == 15 && r.flags == CondFlag::P, "LOAD adds");
    r = alu_execute(OpCode::STORE, 10, -10);
    t.ok(r.value == 0 && r.flags == CondFlag::Z, "STORE adds");
    r = alu_execute(OpCode::HALT, 0, 0);
    t.ok(r.value == 0 && r.flags == CondFlag::Z, "HALT adds");

    return t.summary();
}
