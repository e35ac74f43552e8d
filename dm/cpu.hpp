// dm/cpu.hpp
#pragma once
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "instr.hpp"
#include "options.hpp"
#include "reg.hpp"

class Memory;

// Published before each instruction's predicate is checked.
struct StepEvent {
    int32_t     pc;
    uint32_t    word;
    Instruction instr;
};

class CPU {
public:
    using Listener     = std::function<void(const StepEvent&)>;
    // Called after each step in single-step mode; return false to stop the run.
    using PauseHandler = std::function<bool(const CPU&)>;

    explicit CPU(Memory& mem, CpuOptions opts = CpuOptions());

    // Execute one instruction; returns false if halted.
    // DecodeError and memory faults propagate to the caller.
    bool step();

    // Set the PC to start and step until HALT. Returns false if the run was
    // stopped early (pause handler declined, step limit reached).
    bool run(int32_t start, bool single_step = false);

    void subscribe(Listener l){ listeners_.push_back(std::move(l)); }
    void set_pause_handler(PauseHandler h){ pause_ = std::move(h); }

    int32_t reg(int i) const      { return regs_.at(i)->get(); }
    void    set_reg(int i, int32_t v){ regs_.at(i)->put(v); }
    int32_t pc() const            { return regs_[REG_PC]->get(); }

    CondFlag condition() const { return condition_; }
    bool     halted() const    { return halted_; }

    // accounting
    uint64_t steps   = 0;   // fetched
    uint64_t instret = 0;   // predicate true

private:
    bool pause_default();

    Memory&    mem_;
    CpuOptions opts_;
    std::array<std::unique_ptr<Register>, NUM_REGS> regs_;
    CondFlag   condition_ = CondFlag::ALWAYS;
    bool       halted_    = false;

    std::vector<Listener> listeners_;
    PauseHandler          pause_;
};
