// dm/asm.cpp
#include "asm.hpp"
#include "bitfield.hpp"
#include "errors.hpp"
#include "mem.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <istream>
#include <sstream>
#include <stdexcept>

namespace {

std::string upper(std::string s){
    for (auto& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

bool to_int64(const std::string& s, int base, int64_t& out){
    if (s.empty() || s.size() > 20) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, base);
    if (errno != 0 || *end != '\0') return false;
    out = (int64_t)v;
    return true;
}

// ---- tiny scanner over one source line ----
struct Cursor {
    const std::string& s;
    size_t i;

    bool eof() const { return i >= s.size(); }
    char peek() const { return eof() ? '\0' : s[i]; }
    bool eat(char c){ if (peek() == c) { ++i; return true; } return false; }

    bool skip_ws(){
        size_t b = i;
        while (!eof() && std::isspace((unsigned char)s[i])) ++i;
        return i > b;
    }
    // [A-Za-z]+
    std::string word(){
        size_t b = i;
        while (!eof() && std::isalpha((unsigned char)s[i])) ++i;
        return s.substr(b, i - b);
    }
    // [A-Za-z][A-Za-z0-9_]*
    std::string ident(){
        if (!std::isalpha((unsigned char)peek())) return "";
        size_t b = i;
        while (!eof() && (std::isalnum((unsigned char)s[i]) || s[i] == '_')) ++i;
        return s.substr(b, i - b);
    }
    // -?[0-9]+
    std::string integer(){
        size_t b = i;
        if (peek() == '-') ++i;
        size_t d = i;
        while (!eof() && std::isdigit((unsigned char)s[i])) ++i;
        if (i == d) { i = b; return ""; }
        return s.substr(b, i - b);
    }
    // [0-9A-Fa-f]+
    std::string hex(){
        size_t b = i;
        while (!eof() && std::isxdigit((unsigned char)s[i])) ++i;
        return s.substr(b, i - b);
    }
};

// Optional comment, then end of line.
bool tail(Cursor& c, std::string& comment){
    c.skip_ws();
    if (c.peek() == '#' || c.peek() == ';') {
        comment = c.s.substr(c.i);
        while (!comment.empty() && std::isspace((unsigned char)comment.back())) comment.pop_back();
        c.i = c.s.size();
        return true;
    }
    return c.eof();
}

bool is_pred_word(const std::string& w){
    std::string u = upper(w);
    if (u == "ALWAYS" || u == "NEVER") return true;
    for (char ch : u)
        if (ch != 'N' && ch != 'M' && ch != 'Z' && ch != 'P' && ch != 'V') return false;
    return !u.empty();
}

// After the opcode: "/PRED" or " PRED " or nothing, then the whitespace
// that separates the operands.
bool predicate(Cursor& c, std::string& pred){
    if (c.eat('/')) {
        pred = c.word();
        if (pred.empty()) return false;
    }
    if (!c.skip_ws()) return false;
    if (pred.empty()) {
        size_t save = c.i;
        std::string w = c.word();
        if (is_pred_word(w) && c.skip_ws() && std::isalnum((unsigned char)c.peek()))
            pred = w;
        else
            c.i = save;
    }
    return true;
}

bool register_list(Cursor& c, std::string& t, std::string& s1, std::string& s2){
    t = c.ident();
    if (t.empty()) return false;
    c.skip_ws(); if (!c.eat(',')) return false; c.skip_ws();
    s1 = c.ident();
    if (s1.empty()) return false;
    c.skip_ws(); if (!c.eat(',')) return false; c.skip_ws();
    s2 = c.ident();
    return !s2.empty();
}

bool try_full(const std::string& s, size_t start, AsmLine& out){
    Cursor c{s, start};
    c.skip_ws();
    std::string op = c.word();
    if (op.empty()) return false;
    std::string pred;
    if (!predicate(c, pred)) return false;

    std::string t, s1, s2, off;
    if (!register_list(c, t, s1, s2)) return false;
    if (c.eat('[')) {
        c.skip_ws();
        off = c.integer();
        if (off.empty()) return false;
        c.skip_ws();
        if (!c.eat(']')) return false;
    }
    if (!tail(c, out.comment)) return false;

    int64_t v = 0;
    if (!off.empty() && (!to_int64(off, 10, v) || v < OFFSET_MIN || v > OFFSET_MAX)) {
        std::ostringstream m;
        m << "offset " << off << " out of range [" << OFFSET_MIN << ", " << OFFSET_MAX << "]";
        throw SyntaxError(m.str());
    }
    FullLine f;
    f.instr = instruction_from_fields(op, pred, t, s1, s2, (int32_t)v);
    out.body = f;
    return true;
}

bool try_data(const std::string& s, size_t start, AsmLine& out){
    Cursor c{s, start};
    c.skip_ws();
    if (upper(c.word()) != "DATA") return false;
    if (std::isalnum((unsigned char)c.peek()) || c.peek() == '_') return false;
    c.skip_ws();

    DataLine d;
    if (c.peek() == '0' && c.i + 1 < s.size() && (s[c.i+1] == 'x' || s[c.i+1] == 'X')) {
        c.i += 2;
        std::string h = c.hex();
        if (h.empty()) return false;
        if (!tail(c, out.comment)) return false;
        int64_t v = 0;
        if (h.size() > 8 || !to_int64(h, 16, v))
            throw SyntaxError("DATA value 0x" + h + " does not fit in a word");
        d.value = (int32_t)(uint32_t)v;
    } else if (std::isdigit((unsigned char)c.peek()) || c.peek() == '-') {
        std::string n = c.integer();
        if (n.empty()) return false;
        if (!tail(c, out.comment)) return false;
        int64_t v = 0;
        if (!to_int64(n, 10, v) || v < INT32_MIN || v > (int64_t)UINT32_MAX)
            throw SyntaxError("DATA value " + n + " does not fit in a word");
        d.value = (int32_t)(uint32_t)v;
    } else if (!tail(c, out.comment)) {
        return false;
    }
    out.body = d;
    return true;
}

bool try_symbolic(const std::string& s, size_t start, AsmLine& out){
    Cursor c{s, start};
    c.skip_ws();
    std::string op = upper(c.word());
    if (op != "LOAD" && op != "STORE" && op != "JUMP") return false;
    std::string pred;
    if (!predicate(c, pred)) return false;

    std::string target;
    size_t save = c.i;
    std::string t = c.ident();
    c.skip_ws();
    if (!t.empty() && c.eat(',')) { target = t; c.skip_ws(); }
    else c.i = save;

    std::string sym = c.ident();
    if (sym.empty()) return false;
    if (!tail(c, out.comment)) return false;

    SymbolicLine y;
    y.op     = op;
    y.cond   = pred.empty() ? CondFlag::ALWAYS : cond_from_name(pred);
    y.symbol = sym;
    if (!target.empty()) { y.has_target = true; y.target = reg_from_name(target); }
    out.body = y;
    return true;
}

bool try_comment(const std::string& s, size_t start, AsmLine& out){
    Cursor c{s, start};
    if (!tail(c, out.comment)) return false;
    out.body = CommentLine{};
    return true;
}

// Predicate text as the assembler spells it (N for negative).
std::string pred_text(CondFlag cond){
    if (cond == CondFlag::ALWAYS) return "";
    if (cond == CondFlag::NEVER)  return "/NEVER";
    std::string s = "/";
    if (any(cond & CondFlag::M)) s += 'N';
    if (any(cond & CondFlag::Z)) s += 'Z';
    if (any(cond & CondFlag::P)) s += 'P';
    if (any(cond & CondFlag::V)) s += 'V';
    return s;
}

} // namespace

// The "label:" prefix of a line, or "" if it has none. Sets start to the
// position just past the colon.
static std::string leading_label(const std::string& text, size_t& start)
{
    Cursor c{text, 0};
    c.skip_ws();
    std::string id = c.ident();
    start = 0;
    if (id.empty() || !c.eat(':')) return "";
    start = c.i;
    return id;
}

AsmLine parse_line(const std::string& text)
{
    AsmLine line;
    size_t start = 0;
    line.label = leading_label(text, start);

    if (try_full(text, start, line))     return line;
    if (try_data(text, start, line))     return line;
    if (try_symbolic(text, start, line)) return line;
    if (try_comment(text, start, line))  return line;
    throw SyntaxError("syntax error: " + text);
}

std::string format_full(const Instruction& in, const std::string& label, const std::string& comment)
{
    std::ostringstream ss;
    if (!label.empty()) ss << label << ": ";
    ss << op_name(in.op) << pred_text(in.cond) << ' '
       << 'r' << (int)in.target << ",r" << (int)in.src1 << ",r" << (int)in.src2
       << '[' << in.offset << ']';
    if (!comment.empty()) ss << ' ' << comment;
    return ss.str();
}

// ---------------- error budget ----------------

// Shared by all passes of one run.
class Assembler::Budget {
public:
    Budget(const AsmOptions& opts, AsmResult* out) : opts_(opts), out_(out) {}

    // Returns false once the limit is exceeded.
    bool report(int line, const std::string& msg){
        errors.push_back(AsmError{line, msg});
        if (opts_.log) *opts_.log << "[asm] line " << line << ": " << msg << "\n";
        if ((int)errors.size() > opts_.error_limit) {
            if (!aborted && opts_.log) *opts_.log << "[asm] too many errors; abandoning\n";
            aborted = true;
        }
        return !aborted;
    }

    void finish(){
        if (!out_) return;
        out_->errors  = errors;
        out_->aborted = aborted;
    }

    std::vector<AsmError> errors;
    bool aborted = false;

private:
    const AsmOptions& opts_;
    AsmResult* out_;
};

// ---------------- passes ----------------

Assembler::Assembler(AsmOptions opts) : opts_(opts) {}

SymbolTable Assembler::build_table(const std::vector<std::string>& lines)
{
    SymbolTable table;
    Budget b(opts_, nullptr);
    build_table(lines, table, b);
    return table;
}

void Assembler::build_table(const std::vector<std::string>& lines, SymbolTable& table, Budget& b)
{
    int32_t addr = 0;
    for (size_t n = 0; n < lines.size(); ++n) {
        // A line that fails to parse is reported in pass 2. It still defines
        // its label and takes one word, so later addresses stay put.
        std::string label;
        bool occupies = true;
        try {
            AsmLine L = parse_line(lines[n]);
            label    = L.label;
            occupies = L.kind() != LineKind::COMMENT;
        } catch (const std::exception&) {
            size_t start = 0;
            label = leading_label(lines[n], start);
        }
        if (!label.empty()) {
            auto it = table.find(label);
            if (it == table.end()) {
                table.emplace(label, addr);
            } else {
                std::ostringstream m;
                m << "duplicate label '" << label << "' (first defined at address " << it->second << ")";
                if (!b.report((int)n + 1, m.str())) return;
            }
        }
        if (occupies) ++addr;
    }
    if (opts_.verbose && opts_.log)
        *opts_.log << "[asm] pass 1: " << table.size() << " labels, " << addr << " words\n";
}

void Assembler::transform(const std::vector<std::string>& lines, const SymbolTable& table,
                          AsmResult& out, Budget& b)
{
    int32_t addr = 0;
    for (size_t n = 0; n < lines.size(); ++n) {
        const int lnum = (int)n + 1;
        bool occupies = true;     // same rule as pass 1
        try {
            AsmLine L = parse_line(lines[n]);
            occupies = L.kind() != LineKind::COMMENT;
            if (L.kind() != LineKind::SYMBOLIC) {
                out.lines.push_back(lines[n]);
                if (L.kind() != LineKind::COMMENT) ++addr;
                continue;
            }

            const SymbolicLine& y = std::get<SymbolicLine>(L.body);
            auto it = table.find(y.symbol);
            if (it == table.end())
                throw UnresolvedLabelError("unresolved label '" + y.symbol + "'");

            const int32_t disp = it->second - addr;
            if (disp < OFFSET_MIN || disp > OFFSET_MAX) {
                std::ostringstream m;
                m << "label '" << y.symbol << "' is " << disp << " words away; out of range ["
                  << OFFSET_MIN << ", " << OFFSET_MAX << "]";
                throw std::out_of_range(m.str());
            }

            Instruction in;
            in.cond   = y.cond;
            in.src1   = REG_ZERO;
            in.src2   = REG_PC;
            in.offset = disp;
            if (y.op == "JUMP") {
                if (y.has_target) throw SyntaxError("JUMP takes no register operand");
                in.op     = OpCode::ADD;
                in.target = REG_PC;
            } else {
                in.op     = op_from_name(y.op);
                in.target = y.has_target ? y.target : (uint8_t)REG_ZERO;
            }
            out.lines.push_back(format_full(in, L.label, L.comment));
            ++addr;
        } catch (const std::exception& e) {
            if (occupies) ++addr;
            if (!b.report(lnum, e.what())) return;
        }
    }
}

void Assembler::encode(const std::vector<std::string>& resolved, AsmResult& out, Budget& b)
{
    for (size_t n = 0; n < resolved.size(); ++n) {
        try {
            AsmLine L = parse_line(resolved[n]);
            switch (L.kind()) {
            case LineKind::FULL:
                out.words.push_back((int32_t)::encode(std::get<FullLine>(L.body).instr));
                break;
            case LineKind::DATA:
                out.words.push_back(std::get<DataLine>(L.body).value);
                break;
            case LineKind::SYMBOLIC:
                throw UnresolvedLabelError("symbolic operand '" + std::get<SymbolicLine>(L.body).symbol
                                           + "' was not resolved");
            case LineKind::COMMENT:
                break;
            }
        } catch (const std::exception& e) {
            if (!b.report((int)n + 1, e.what())) return;
        }
    }
}

AsmResult Assembler::resolve(const std::vector<std::string>& lines)
{
    AsmResult out;
    Budget b(opts_, &out);
    SymbolTable table;
    build_table(lines, table, b);
    if (!b.aborted) transform(lines, table, out, b);
    b.finish();
    return out;
}

AsmResult Assembler::encode(const std::vector<std::string>& resolved)
{
    AsmResult out;
    Budget b(opts_, &out);
    out.lines = resolved;
    encode(resolved, out, b);
    b.finish();
    return out;
}

AsmResult Assembler::assemble(const std::vector<std::string>& lines)
{
    AsmResult out;
    Budget b(opts_, &out);
    SymbolTable table;
    build_table(lines, table, b);
    if (!b.aborted) transform(lines, table, out, b);
    // resolved lines map 1:1 onto source lines only when nothing was dropped
    if (b.errors.empty()) encode(out.lines, out, b);
    b.finish();
    if (opts_.verbose && opts_.log && out.ok())
        *opts_.log << "[asm] " << out.words.size() << " words\n";
    return out;
}

// ---------------- helpers ----------------

std::vector<std::string> read_lines(std::istream& in)
{
    std::vector<std::string> lines;
    std::string L;
    while (std::getline(in, L)) {
        if (!L.empty() && L.back() == '\r') L.pop_back();
        lines.push_back(L);
    }
    return lines;
}

std::vector<std::string> split_lines(const std::string& src)
{
    std::istringstream is(src);
    return read_lines(is);
}

int assemble_to_memory(const std::string& src, Memory& mem, int32_t base, AsmOptions opts)
{
    AsmResult r = Assembler(opts).assemble(split_lines(src));
    if (!r.ok()) {
        std::ostringstream m;
        m << "assembly failed: line " << r.errors.front().line << ": " << r.errors.front().message;
        throw std::runtime_error(m.str());
    }
    for (size_t i = 0; i < r.words.size(); ++i)
        mem.put(base + (int32_t)i, r.words[i]);
    return (int)r.words.size();
}
