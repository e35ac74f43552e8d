// dm/asm.hpp
#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "instr.hpp"
#include "options.hpp"

class Memory;

// ---- source line model ----
//
//   [label:] OPCODE[/PRED] target,src1,src2[offset] [#comment]     FULL
//   [label:] DATA [value] [#comment]                               DATA
//   [label:] LOAD|STORE|JUMP[/PRED] [target,] symbol [#comment]    SYMBOLIC
//   [label:] [#comment]                                            COMMENT
//
// PRED is ALWAYS, NEVER or letters from N (or M), Z, P, V. It may also be
// written as a separate word after the opcode ("HALT ALWAYS r0,r0,r0[0]").
// Comments start with '#' or ';'.

enum class LineKind { COMMENT, FULL, DATA, SYMBOLIC };

struct CommentLine {};

struct FullLine {
    Instruction instr;
};

struct DataLine {
    int32_t value = 0;
};

struct SymbolicLine {
    std::string op;            // LOAD, STORE or JUMP
    CondFlag    cond = CondFlag::ALWAYS;
    bool        has_target = false;
    uint8_t     target = 0;
    std::string symbol;
};

struct AsmLine {
    std::string label;         // empty if none
    std::string comment;       // with its leading '#' or ';'
    std::variant<CommentLine, FullLine, DataLine, SymbolicLine> body;

    LineKind kind() const { return (LineKind)body.index(); }
};

// Shapes are tried in the order FULL, DATA, SYMBOLIC, COMMENT.
// Throws SyntaxError if none matches, LookupError for a bad name inside a
// matching line.
AsmLine parse_line(const std::string& text);

// FULL-grammar text for an instruction, with optional label and comment.
std::string format_full(const Instruction& instr, const std::string& label = "",
                        const std::string& comment = "");

using SymbolTable = std::unordered_map<std::string, int32_t>;

struct AsmError {
    int         line;          // 1-based source line
    std::string message;
};

struct AsmResult {
    std::vector<std::string> lines;   // resolved text
    std::vector<int32_t>     words;   // object code, filled by encode/assemble
    std::vector<AsmError>    errors;
    bool                     aborted = false;

    bool ok() const { return errors.empty(); }
};

// Two-pass assembler. Symbolic operands are resolved PC-relative:
//   LOAD/P r1,x   ->  LOAD/P r1,r0,r15[x - here]
//   JUMP/Z loop   ->  ADD/Z  r15,r0,r15[loop - here]
// Errors are reported per line to options.log and counted; once the count
// exceeds options.error_limit the run is abandoned.
class Assembler {
public:
    explicit Assembler(AsmOptions opts = AsmOptions());

    // Pass 1: label -> address of the line that defines it.
    SymbolTable build_table(const std::vector<std::string>& lines);

    // Pass 1 + pass 2: every line rewritten into FULL/DATA/COMMENT text.
    AsmResult resolve(const std::vector<std::string>& lines);

    // Resolved text -> object words. SYMBOLIC lines are an error here.
    AsmResult encode(const std::vector<std::string>& resolved);

    // resolve, then encode if resolution was clean.
    AsmResult assemble(const std::vector<std::string>& lines);

private:
    class Budget;

    void build_table(const std::vector<std::string>& lines, SymbolTable& table, Budget& b);
    void transform(const std::vector<std::string>& lines, const SymbolTable& table,
                   AsmResult& out, Budget& b);
    void encode(const std::vector<std::string>& resolved, AsmResult& out, Budget& b);

    AsmOptions opts_;
};

// ---- helpers ----
std::vector<std::string> split_lines(const std::string& src);
std::vector<std::string> read_lines(std::istream& in);

// Assemble `src` into memory at `base`. Returns the number of words emitted;
// throws std::runtime_error carrying the first error if assembly failed.
int assemble_to_memory(const std::string& src, Memory& mem, int32_t base,
                       AsmOptions opts = AsmOptions());
