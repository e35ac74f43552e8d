// dm/options.hpp
#pragma once
#include <cstdint>
#include <iostream>

// Per-run settings handed to the assembler. No global state.
struct AsmOptions {
    int           error_limit = 5;          // abandon once errors exceed this
    std::ostream* log         = &std::cerr; // "[asm] ..." messages
    bool          verbose     = false;
};

struct CpuOptions {
    std::ostream* log       = &std::cerr;   // "[cpu] ..." messages
    bool          verbose   = false;        // log every step
    uint64_t      max_steps = 0;            // 0 = no limit
    std::istream* pause_in  = &std::cin;    // default single-step continue signal
};
