#include "instr.hpp"
#include "bitfield.hpp"
#include "errors.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <unordered_map>

static std::string upper(const std::string& s){
    std::string r = s;
    for (auto& c : r) c = (char)std::toupper((unsigned char)c);
    return r;
}

bool op_defined(uint32_t code){
    switch (code) {
    case 0: case 1: case 2: case 3: case 5: case 6: case 7:
        return true;
    default:
        return false;
    }
}

const char* op_name(OpCode op){
    switch (op) {
    case OpCode::HALT:  return "HALT";
    case OpCode::LOAD:  return "LOAD";
    case OpCode::STORE: return "STORE";
    case OpCode::ADD:   return "ADD";
    case OpCode::SUB:   return "SUB";
    case OpCode::MUL:   return "MUL";
    case OpCode::DIV:   return "DIV";
    }
    return "?";
}

std::string cond_name(CondFlag cond){
    if (cond == CondFlag::ALWAYS) return "ALWAYS";
    if (cond == CondFlag::NEVER)  return "NEVER";
    std::string s;
    if (any(cond & CondFlag::M)) s += 'M';
    if (any(cond & CondFlag::Z)) s += 'Z';
    if (any(cond & CondFlag::P)) s += 'P';
    if (any(cond & CondFlag::V)) s += 'V';
    return s;
}

OpCode op_from_name(const std::string& name){
    static const std::unordered_map<std::string, OpCode> ops = {
        {"HALT", OpCode::HALT}, {"LOAD", OpCode::LOAD}, {"STORE", OpCode::STORE},
        {"ADD",  OpCode::ADD},  {"SUB",  OpCode::SUB},  {"MUL",   OpCode::MUL},
        {"DIV",  OpCode::DIV},
    };
    auto it = ops.find(upper(name));
    if (it == ops.end()) throw LookupError("unknown opcode: " + name);
    return it->second;
}

CondFlag cond_from_name(const std::string& name){
    std::string n = upper(name);
    if (n == "ALWAYS") return CondFlag::ALWAYS;
    if (n == "NEVER")  return CondFlag::NEVER;
    static const std::unordered_map<char, CondFlag> bits = {
        {'N', CondFlag::M}, {'M', CondFlag::M}, {'Z', CondFlag::Z},
        {'P', CondFlag::P}, {'V', CondFlag::V},
    };
    if (n.empty()) throw LookupError("empty predicate");
    CondFlag c = CondFlag::NEVER;
    for (char ch : n) {
        auto it = bits.find(ch);
        if (it == bits.end()) throw LookupError("unknown predicate: " + name);
        c |= it->second;
    }
    return c;
}

uint8_t reg_from_name(const std::string& name){
    static const std::unordered_map<std::string, uint8_t> regs = [] {
        std::unordered_map<std::string, uint8_t> m;
        for (int i = 0; i < NUM_REGS; ++i) m["r" + std::to_string(i)] = (uint8_t)i;
        m["zero"] = REG_ZERO;
        m["pc"]   = REG_PC;
        return m;
    }();
    std::string n = name;
    for (auto& c : n) c = (char)std::tolower((unsigned char)c);
    auto it = regs.find(n);
    if (it == regs.end()) throw LookupError("bad register: " + name);
    return it->second;
}

Instruction decode(uint32_t word){
    if (ReservedField::extract(word) != 0) {
        std::ostringstream os;
        os << "reserved bit set in word 0x" << std::hex << word;
        throw DecodeError(os.str());
    }
    uint32_t op = OpField::extract(word);
    if (!op_defined(op)) {
        std::ostringstream os;
        os << "undefined opcode " << op << " in word 0x" << std::hex << word;
        throw DecodeError(os.str());
    }
    Instruction i;
    i.op     = (OpCode)op;
    i.cond   = (CondFlag)CondField::extract(word);
    i.target = (uint8_t)TargetField::extract(word);
    i.src1   = (uint8_t)Src1Field::extract(word);
    i.src2   = (uint8_t)Src2Field::extract(word);
    i.offset = OffsetField::extract_signed(word);
    return i;
}

uint32_t encode(const Instruction& i){
    uint32_t w = 0;
    w = OpField::insert((uint32_t)i.op, w);
    w = CondField::insert((uint32_t)i.cond, w);
    w = TargetField::insert(i.target, w);
    w = Src1Field::insert(i.src1, w);
    w = Src2Field::insert(i.src2, w);
    w = OffsetField::insert((uint32_t)i.offset, w);
    return w;
}

std::string Instruction::to_string() const {
    std::string cc = (cond == CondFlag::ALWAYS) ? "" : "/" + cond_name(cond);
    std::ostringstream ss;
    ss << op_name(op) << std::left << std::setw(4) << cc << "  "
       << 'r' << (int)target << ",r" << (int)src1 << ",r" << (int)src2
       << '[' << offset << ']';
    return ss.str();
}

Instruction instruction_from_fields(const std::string& op, const std::string& pred,
                                    const std::string& target, const std::string& src1,
                                    const std::string& src2, int32_t offset){
    Instruction i;
    i.op     = op_from_name(op);
    i.cond   = pred.empty() ? CondFlag::ALWAYS : cond_from_name(pred);
    i.target = reg_from_name(target);
    i.src1   = reg_from_name(src1);
    i.src2   = reg_from_name(src2);
    i.offset = offset;
    return i;
}
