// dm/main.cpp -- dmrun: load object code and run it on the Duck Machine
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "cpu.hpp"
#include "disasm.hpp"
#include "errors.hpp"
#include "mem.hpp"
#include "objfile.hpp"
#include "trace.hpp"

static void usage(){
    std::cerr <<
    "usage: dmrun <object> [options]\n"
    "  --step           single-step debugger\n"
    "  --trace FILE     write the step trace as ndjson\n"
    "  --max-steps N    stop after N steps\n"
    "  --mem N          memory size in words (default 1024)\n"
    "  -v               log every step\n";
}

// ------------------ single-step debugger ------------------
static void dump_regs(const CPU& c){
    std::cout << "   pc=" << c.pc() << " cond=" << cond_name(c.condition()) << "\n  ";
    for (int i = 1; i < NUM_REGS - 1; ++i) {
        std::cout << " r" << i << "=" << c.reg(i);
        if (i == 7) std::cout << "\n  ";
    }
    std::cout << "\n";
}
// Returns a pause handler driven by commands on stdin.
static CPU::PauseHandler make_repl(Memory& ram){
    auto help = []{
        std::cout <<
        "commands:\n"
        "  <Enter> | s       step one instruction\n"
        "  c                 continue without pausing\n"
        "  r                 show registers\n"
        "  m <addr> <n>      dump n words from addr\n"
        "  d [k]             disasm k ahead from current pc (default 4)\n"
        "  q                 quit\n"
        "  h                 help\n";
    };
    help();

    auto running = std::make_shared<bool>(false);
    return [&ram, help, running](const CPU& cpu) -> bool {
        if (*running) return true;
        std::string line;
        while (true) {
            std::cout << "(dbg) pc=" << cpu.pc() << " > " << std::flush;
            if (!std::getline(std::cin, line)) return false;
            std::istringstream iss(line);
            std::string cmd; iss >> cmd;

            if (cmd.empty() || cmd == "s") {
                return true;
            } else if (cmd == "c") {
                *running = true;
                return true;
            } else if (cmd == "r") {
                dump_regs(cpu);
            } else if (cmd == "m") {
                int32_t a = 0; int n = 1;
                if (!(iss >> a)) { std::cout << "usage: m <addr> <n>\n"; continue; }
                iss >> n;
                try { dump_words(std::cout, ram, a, n); }
                catch (const std::exception& e) { std::cout << "mem error: " << e.what() << "\n"; }
            } else if (cmd == "d") {
                int k = 4; iss >> k;
                try { dump_words(std::cout, ram, cpu.pc(), k); }
                catch (const std::exception& e) { std::cout << "mem error: " << e.what() << "\n"; }
            } else if (cmd == "q") {
                return false;
            } else if (cmd == "h" || cmd == "?") {
                help();
            } else {
                std::cout << "unknown. type 'h' for help.\n";
            }
        }
    };
}

// ------------------ main ------------------
int main(int argc, char** argv)
{
    CpuOptions opts;
    bool single_step = false;
    std::string obj_path, trace_path;
    std::size_t mem_words = 1024;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--step") single_step = true;
        else if (a == "--trace" && i + 1 < argc) trace_path = argv[++i];
        else if (a == "--max-steps" && i + 1 < argc) opts.max_steps = std::strtoull(argv[++i], nullptr, 10);
        else if (a == "--mem" && i + 1 < argc) mem_words = std::strtoul(argv[++i], nullptr, 10);
        else if (a == "-v") opts.verbose = true;
        else if (a == "-h" || a == "--help") { usage(); return 0; }
        else if (obj_path.empty() && (a.empty() || a[0] != '-')) obj_path = a;
        else { usage(); return 2; }
    }
    if (obj_path.empty()) { usage(); return 2; }

    Memory ram(mem_words);
    ram.attach_console(std::cin, std::cout);
    CPU cpu(ram, opts);

    TraceLog trace;
    trace.enable(!trace_path.empty());
    trace.attach(cpu);
    if (single_step) cpu.set_pause_handler(make_repl(ram));

    int rc = 0;
    try {
        std::ifstream in(obj_path);
        if (!in) { std::cerr << "[run] cannot open " << obj_path << "\n"; return 1; }
        int32_t end = load_program(ram, read_object(in));
        if (opts.verbose) std::cerr << "[run] loaded " << end << " words from " << obj_path << "\n";

        if (!cpu.run(0, single_step)) rc = 1;
    } catch (const DecodeError& e) {
        std::cerr << "[cpu] decode error at pc=" << cpu.pc() << ": " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        std::cerr << "[cpu] fault at pc=" << cpu.pc() << ": " << e.what() << "\n";
        rc = 1;
    }

    if (opts.verbose)
        std::cerr << "[run] steps=" << cpu.steps << " instret=" << cpu.instret << "\n";
    if (!trace_path.empty() && !trace.write_ndjson(trace_path)) {
        std::cerr << "[run] cannot write trace " << trace_path << "\n";
        rc = 1;
    }
    return rc;
}
