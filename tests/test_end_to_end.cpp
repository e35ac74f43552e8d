#include "test_util.hpp"
#include "dm/asm.hpp"
#include "dm/objfile.hpp"
#include <sstream>
#include <string>

int main(){
    TestCtx t;
    std::ostringstream log;
    AsmOptions ao; ao.log = &log;
    CpuOptions co; co.log = &log;

    // a lone HALT stops after one step
    {
        AsmResult r = Assembler(ao).assemble({"HALT ALWAYS r0,r0,r0[0]"});
        t.ok(r.ok() && r.words.size() == 1, "one word");

        Memory ram(64);
        load_program(ram, r.words);
        CPU cpu(ram, co);
        int calls = 1;
        while (cpu.step()) ++calls;
        t.ok(calls == 1 && cpu.halted(), "halts on the first step");
        bool untouched = true;
        for (int i = 0; i < REG_PC; ++i) if (cpu.reg(i) != 0) untouched = false;
        t.ok(untouched, "general registers untouched");
    }

    // sum 5..1 with a loop, a variable and the console port
    {
        const std::string src =
            "# sum the integers count..1\n"
            "        LOAD  r1,count        # r1 = count\n"
            "        ADD   r2,r0,r0[0]     # sum\n"
            "loop:   ADD   r2,r2,r1[0]\n"
            "        SUB   r1,r1,r0[1]\n"
            "        JUMP/P loop\n"
            "        STORE r2,result\n"
            "        STORE r2,r0,r0[511]   ; print\n"
            "        HALT  r0,r0,r0\n"
            "count:  DATA 5\n"
            "result: DATA\n";

        Assembler as(ao);
        AsmResult res = as.resolve(split_lines(src));
        t.ok(res.ok(), "program resolves");
        t.ok(res.lines[5] == "ADD/P r15,r0,r15[-2]", "loop jump resolved pc-relative");

        AsmResult r = as.assemble(split_lines(src));
        t.ok(r.ok() && r.words.size() == 10, "ten words");

        std::ostringstream objtext;
        write_object(objtext, r.words);
        std::istringstream objin(objtext.str());

        Memory ram(1024);
        std::istringstream in;
        std::ostringstream out;
        ram.attach_console(in, out);
        load_program(ram, read_object(objin));

        CPU cpu(ram, co);
        t.ok(cpu.run(0), "program halts");
        t.ok(ram.get(9) == 15, "result stored");
        t.ok(cpu.reg(1) == 0 && cpu.condition() == CondFlag::Z, "counter ran out");
        t.ok(out.str().find("15") != std::string::npos, "sum printed on the console");
    }

    // division by zero is tested with the V predicate, not a crash
    {
        AsmResult r = Assembler(ao).assemble({
            "      DIV r1,r0,r0[0]",
            "      JUMP/V bad",
            "      ADD r2,r0,r0[1]",
            "      HALT r0,r0,r0",
            "bad:  ADD r2,r0,r0[-1]",
            "      HALT r0,r0,r0",
        });
        t.ok(r.ok(), "div program assembles");
        Memory ram(64);
        load_program(ram, r.words);
        CPU cpu(ram, co);
        cpu.run(0);
        t.ok(cpu.reg(2) == -1, "overflow branch taken");
    }

    return t.summary();
}
