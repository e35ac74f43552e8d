// dm/asm_main.cpp -- dmasm: Duck Machine assembler
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "asm.hpp"
#include "objfile.hpp"

static void usage(){
    std::cerr <<
    "usage: dmasm [source] [output] [options]\n"
    "  source            assembly file (default: stdin)\n"
    "  output            object file (default: stdout)\n"
    "  --resolve-only    write resolved assembly text instead of object code\n"
    "  --max-errors N    abandon after more than N errors (default 5)\n"
    "  -v                verbose\n";
}

int main(int argc, char** argv)
{
    AsmOptions opts;
    bool resolve_only = false;
    std::vector<std::string> pos;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--resolve-only") {
            resolve_only = true;
        } else if (a == "--max-errors" && i + 1 < argc) {
            opts.error_limit = std::atoi(argv[++i]);
        } else if (a == "-v") {
            opts.verbose = true;
        } else if (a == "-h" || a == "--help") {
            usage(); return 0;
        } else if (!a.empty() && a[0] == '-' && a != "-") {
            usage(); return 2;
        } else {
            pos.push_back(a);
        }
    }
    if (pos.size() > 2) { usage(); return 2; }

    std::vector<std::string> lines;
    if (pos.empty() || pos[0] == "-") {
        lines = read_lines(std::cin);
    } else {
        std::ifstream in(pos[0]);
        if (!in) { std::cerr << "[asm] cannot open " << pos[0] << "\n"; return 1; }
        lines = read_lines(in);
    }

    Assembler as(opts);
    AsmResult r = resolve_only ? as.resolve(lines) : as.assemble(lines);
    if (r.aborted) return 1;

    std::ofstream file;
    std::ostream* out = &std::cout;
    if (pos.size() == 2 && pos[1] != "-") {
        file.open(pos[1]);
        if (!file) { std::cerr << "[asm] cannot write " << pos[1] << "\n"; return 1; }
        out = &file;
    }

    if (resolve_only) {
        for (auto& L : r.lines) *out << L << "\n";
    } else if (r.ok()) {
        write_object(*out, r.words);
    }
    out->flush();
    return r.ok() ? 0 : 1;
}
