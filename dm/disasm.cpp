#include "disasm.hpp"
#include "instr.hpp"
#include "errors.hpp"
#include "mem.hpp"
#include <iomanip>
#include <ostream>
#include <sstream>

std::string disasm(uint32_t word){
    try {
        return decode(word).to_string();
    } catch (const DecodeError&) {
        std::ostringstream ss;
        ss << "DATA " << (int32_t)word;
        return ss.str();
    }
}

void dump_words(std::ostream& os, const Memory& mem, int32_t addr, int n){
    for(int i=0;i<n;i++){
        int32_t a = addr + i;
        // reading a console port would consume input
        if (mem.has_console() && (a == Memory::CONSOLE_IN || a == Memory::CONSOLE_OUT)) {
            os << "  " << std::setw(5) << a << ": <console>\n";
            continue;
        }
        int32_t w = mem.get(a);
        os << "  " << std::setw(5) << a << ": " << std::setw(11) << w
           << "  " << disasm((uint32_t)w) << "\n";
    }
}
