#include <memory>
#include <string>
#include "cpu.hpp"
#include "alu.hpp"
#include "mem.hpp"

CPU::CPU(Memory& mem, CpuOptions opts)
: mem_(mem), opts_(opts)
{
    regs_[REG_ZERO] = std::make_unique<ZeroRegister>();
    for (int i = 1; i < NUM_REGS; ++i) regs_[i] = std::make_unique<Register>();
}

bool CPU::step()
{
    if (halted_) return false;

    const int32_t  pc   = regs_[REG_PC]->get();
    const uint32_t word = (uint32_t)mem_.get(pc);
    const Instruction in = decode(word);
    ++steps;

    StepEvent ev{pc, word, in};
    for (auto& l : listeners_) l(ev);

    if (opts_.verbose && opts_.log)
        *opts_.log << "[cpu] " << pc << ": " << in.to_string() << "\n";

    if (!any(condition_ & in.cond)) {
        regs_[REG_PC]->put(pc + 1);
        return true;
    }

    const int32_t left  = regs_[in.src1]->get();
    const int32_t right = (int32_t)((uint32_t)regs_[in.src2]->get() + (uint32_t)in.offset);
    // a write to r15 below replaces this increment
    regs_[REG_PC]->put(pc + 1);

    AluResult r = alu_execute(in.op, left, right);
    condition_ = r.flags;
    ++instret;

    switch (in.op) {
    case OpCode::HALT:
        halted_ = true;
        break;
    case OpCode::LOAD:
        regs_[in.target]->put(mem_.get(r.value));
        break;
    case OpCode::STORE:
        mem_.put(r.value, regs_[in.target]->get());
        break;
    default:
        regs_[in.target]->put(r.value);
        break;
    }
    return !halted_;
}

bool CPU::pause_default()
{
    if (!opts_.pause_in) return false;
    if (opts_.log)
        *opts_.log << "[cpu] paused at pc=" << pc() << " (Enter to continue)" << std::endl;
    std::string line;
    return (bool)std::getline(*opts_.pause_in, line);
}

bool CPU::run(int32_t start, bool single_step)
{
    regs_[REG_PC]->put(start);
    halted_ = false;
    uint64_t n = 0;

    while (!halted_) {
        if (opts_.max_steps && n >= opts_.max_steps) {
            if (opts_.log) *opts_.log << "[cpu] step limit " << opts_.max_steps << " reached\n";
            return false;
        }
        step();
        ++n;
        if (single_step && !halted_) {
            bool go = pause_ ? pause_(*this) : pause_default();
            if (!go) return false;
        }
    }
    if (opts_.verbose && opts_.log)
        *opts_.log << "[cpu] halted after " << steps << " steps, instret=" << instret << "\n";
    return true;
}
