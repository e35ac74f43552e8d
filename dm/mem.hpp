// dm/mem.hpp
#pragma once
#include <cstdint>
#include <vector>
#include <stdexcept>
#include <string>
#include <iostream>

// Word-addressed memory. Addresses outside [0, size) throw std::out_of_range.
// Once a console is attached, two addresses are mapped to it instead of RAM.
class Memory {
public:
    static constexpr int32_t CONSOLE_IN  = 510;   // read: next integer from input
    static constexpr int32_t CONSOLE_OUT = 511;   // write: print integer to output

    explicit Memory(std::size_t words = 1024)
    : words_(words, 0) {}

    int32_t get(int32_t addr) const {
        check(addr, "get");
        if (is_mmio(addr)) return mmio_read(addr);
        return words_[(std::size_t)addr];
    }

    void put(int32_t addr, int32_t value) {
        check(addr, "put");
        if (is_mmio(addr)) { mmio_write(addr, value); return; }
        words_[(std::size_t)addr] = value;
    }

    std::size_t size() const { return words_.size(); }

    // ------- memory-mapped console -------
    void attach_console(std::istream& in, std::ostream& out){ in_ = &in; out_ = &out; }
    void detach_console(){ in_ = nullptr; out_ = nullptr; }
    bool has_console() const { return out_ != nullptr; }

private:
    void check(int32_t addr, const char* what) const {
        if (addr < 0 || (std::size_t)addr >= words_.size())
            throw std::out_of_range(std::string(what) + " OOB: address " + std::to_string(addr));
    }

    bool is_mmio(int32_t addr) const {
        return has_console() && (addr == CONSOLE_IN || addr == CONSOLE_OUT);
    }
    int32_t mmio_read(int32_t addr) const {
        if (addr != CONSOLE_IN) return 0;
        *out_ << "Quack!: " << std::flush;
        int32_t v = 0;
        if (!(*in_ >> v)) throw std::runtime_error("console input: expected an integer");
        return v;
    }
    void mmio_write(int32_t addr, int32_t v) const {
        if (addr == CONSOLE_OUT) *out_ << "Quack!: " << v << std::endl;
    }

private:
    std::vector<int32_t> words_;
    std::istream* in_  = nullptr;
    std::ostream* out_ = nullptr;
};
