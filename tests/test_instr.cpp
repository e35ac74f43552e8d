#include "test_util.hpp"
#include "dm/disasm.hpp"
#include "dm/errors.hpp"

template <typename E, typename F>
static bool throws(F f){
    try { f(); } catch (const E&) { return true; }
    return false;
}

int main(){
    TestCtx t;

    Instruction add = mk(OpCode::ADD, CondFlag::ALWAYS, 1, 2, 3, -14);
    t.ok(encode(add) == 0x0FC48FF2u, "ADD r1,r2,r3[-14] bit pattern");
    t.ok(decode(0x0FC48FF2u) == add, "decode known word");

    const Instruction samples[] = {
        mk(OpCode::HALT,  CondFlag::ALWAYS, 0, 0, 0, 0),
        mk(OpCode::LOAD,  CondFlag::Z | CondFlag::P, 7, 0, 15, 511),
        mk(OpCode::STORE, CondFlag::M, 15, 14, 13, -512),
        mk(OpCode::DIV,   CondFlag::V, 4, 5, 6, 1),
        mk(OpCode::MUL,   CondFlag::NEVER, 9, 10, 11, -1),
    };
    bool rt = true;
    for (auto& i : samples) {
        if (decode(encode(i)) != i) rt = false;
        if (encode(i) & 0x80000000u) rt = false;
    }
    t.ok(rt, "decode(encode(i)) == i and bit 31 clear");

    // undefined opcodes and the reserved bit
    t.ok(throws<DecodeError>([]{ decode(4u << 26); }), "opcode 4 is undefined");
    t.ok(throws<DecodeError>([]{ decode(31u << 26); }), "opcode 31 is undefined");
    t.ok(throws<DecodeError>([&]{ decode(encode(add) | 0x80000000u); }), "reserved bit rejected");

    // text
    t.ok(samples[0].to_string() == "HALT      r0,r0,r0[0]", "HALT text omits ALWAYS");
    t.ok(mk(OpCode::ADD, CondFlag::Z, 1, 2, 3, -14).to_string() == "ADD/Z    r1,r2,r3[-14]", "ADD/Z text");
    t.ok(cond_name(CondFlag::M | CondFlag::P) == "MP", "cond name letters");
    t.ok(cond_name(CondFlag::NEVER) == "NEVER", "cond name NEVER");

    // name tables
    t.ok(op_from_name("add") == OpCode::ADD, "opcode names are case-insensitive");
    t.ok(throws<LookupError>([]{ op_from_name("SHL"); }), "SHL is not an opcode");
    t.ok(cond_from_name("NZP") == (CondFlag::M | CondFlag::Z | CondFlag::P), "N maps to M");
    t.ok(cond_from_name("always") == CondFlag::ALWAYS, "ALWAYS by name");
    t.ok(throws<LookupError>([]{ cond_from_name("Q"); }), "bad predicate letter");
    t.ok(reg_from_name("pc") == 15 && reg_from_name("zero") == 0 && reg_from_name("R7") == 7, "register aliases");
    t.ok(throws<LookupError>([]{ reg_from_name("r16"); }), "r16 does not exist");

    t.ok(instruction_from_fields("SUB", "Z", "r1", "zero", "pc", 7)
         == mk(OpCode::SUB, CondFlag::Z, 1, 0, 15, 7), "instruction from symbolic fields");
    t.ok(instruction_from_fields("HALT", "", "r0", "r0", "r0", 0).cond == CondFlag::ALWAYS,
         "missing predicate means ALWAYS");

    // disassembler
    t.ok(disasm(encode(samples[0])) == "HALT      r0,r0,r0[0]", "disasm instruction");
    t.ok(disasm(0xFFFFFFFFu) == "DATA -1", "disasm falls back to DATA");

    return t.summary();
}
