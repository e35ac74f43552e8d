#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <cstdio>

#include "cpu.hpp"

struct TraceRec {
    uint64_t step;
    int32_t  pc;
    uint32_t word;
    uint32_t opcode;
    uint32_t cond;
};

// Bounded step history; keeps the most recent max_keep records.
class TraceLog {
public:
    explicit TraceLog(size_t capacity = 200000){ set_capacity(capacity); }

    void enable(bool on){ enabled = on; }
    bool is_enabled() const { return enabled; }

    // Record every step the cpu takes from now on. The log must outlive the cpu.
    void attach(CPU& cpu){
        cpu.subscribe([this](const StepEvent& e){ push(e); });
    }

    void push(const StepEvent& e){
        if(!enabled) return;
        TraceRec r{seen++, e.pc, e.word, (uint32_t)e.instr.op, (uint32_t)e.instr.cond};
        if (records.size() < max_keep) {
            records.push_back(r);
        } else {
            records[idx % max_keep] = r;
            idx++;
        }
    }

    // Oldest first.
    std::vector<TraceRec> snapshot() const {
        if (idx == 0) return records;
        std::vector<TraceRec> out;
        out.reserve(max_keep);
        size_t base = idx % max_keep;
        for(size_t k=0;k<max_keep;k++) out.push_back(records[(base + k) % max_keep]);
        return out;
    }

    bool write_ndjson(const std::string& path) const {
        FILE* f = std::fopen(path.c_str(), "wb");
        if(!f) return false;
        for (auto& r : snapshot()) {
            std::fprintf(f,
              "{\"step\":%llu,\"pc\":%d,\"word\":%u,\"opcode\":%u,\"cond\":%u}\n",
              (unsigned long long)r.step, r.pc, r.word, r.opcode, r.cond);
        }
        std::fclose(f);
        return true;
    }

    void set_capacity(size_t n){
        max_keep = n ? n : 1;
        records.clear();
        records.reserve(max_keep);
        idx = 0;
    }

    size_t size() const { return records.size(); }

private:
    bool enabled = true;
    size_t max_keep = 0;
    size_t idx = 0;
    uint64_t seen = 0;
    std::vector<TraceRec> records;
};
