#include "objfile.hpp"
#include "mem.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

void write_object(std::ostream& out, const std::vector<int32_t>& words){
    for (int32_t w : words) out << w << "\n";
}

std::vector<int32_t> read_object(std::istream& in){
    std::vector<int32_t> words;
    std::string L;
    int lnum = 0;
    while (std::getline(in, L)) {
        ++lnum;
        size_t a = 0, b = L.size();
        while (a < b && std::isspace((unsigned char)L[a])) ++a;
        while (b > a && std::isspace((unsigned char)L[b-1])) --b;
        if (a == b || L[a] == '#') continue;

        std::string t = L.substr(a, b - a);
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(t.c_str(), &end, 10);
        if (errno != 0 || *end != '\0' || v < INT32_MIN || v > (long long)UINT32_MAX)
            throw std::runtime_error("object line " + std::to_string(lnum) + ": bad word '" + t + "'");
        words.push_back((int32_t)(uint32_t)v);
    }
    return words;
}

int32_t load_program(Memory& mem, const std::vector<int32_t>& words, int32_t base){
    int32_t a = base;
    for (int32_t w : words) mem.put(a++, w);
    return a;
}
