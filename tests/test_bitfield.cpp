#include "test_util.hpp"
#include "dm/bitfield.hpp"

int main(){
    TestCtx t;

    // signed offset field
    t.ok(OffsetField::insert((uint32_t)-1, 0) == 0x3FFu, "offset -1 packs to ten ones");
    t.ok(OffsetField::extract_signed(0x3FFu) == -1, "offset sign-extends");
    t.ok(OffsetField::extract_signed(0x1FFu) == 511, "largest positive offset");
    t.ok(OffsetField::extract_signed(0x200u) == -512, "smallest negative offset");
    t.ok(OFFSET_MIN == -512 && OFFSET_MAX == 511, "offset range is 10 bits");

    // out of range values are truncated, not rejected
    t.ok(OffsetField::extract_signed(OffsetField::insert(512, 0)) == -512, "512 wraps to -512");
    t.ok(OffsetField::extract_signed(OffsetField::insert(1023, 0)) == -1, "1023 wraps to -1");
    t.ok(OffsetField::extract(OffsetField::insert(1024, 0)) == 0, "1024 truncates to 0");

    // insert leaves other bits alone
    t.ok(Src1Field::insert(0, 0xFFFFFFFFu) == 0xFFFC3FFFu, "insert clears only its own bits");
    t.ok(CondField::insert(0xA, 0x80000001u) == (0x80000001u | (0xAu << 22)), "insert keeps outside bits");

    // extract(insert(v, w0)) == v mod 2^w whatever w0 held
    const uint32_t priors[] = {0u, 0xFFFFFFFFu, 0x12345678u, 0x03C00000u};
    bool all = true;
    for (uint32_t w0 : priors)
        for (uint32_t v = 0; v < 40; ++v)
            if (CondField::extract(CondField::insert(v, w0)) != (v & 0xFu)) all = false;
    t.ok(all, "cond field extract(insert(v)) == v mod 16");

    // one-bit field
    t.ok(ReservedField::extract(0x80000000u) == 1, "reserved bit extract");
    t.ok(ReservedField::extract_signed(0x80000000u) == -1, "one-bit signed field");

    // layout covers bits 0..31 exactly once
    const uint32_t masks[] = {
        ReservedField::mask << ReservedField::lo, OpField::mask << OpField::lo,
        CondField::mask << CondField::lo,         TargetField::mask << TargetField::lo,
        Src1Field::mask << Src1Field::lo,         Src2Field::mask << Src2Field::lo,
        OffsetField::mask << OffsetField::lo,
    };
    uint32_t seen = 0; bool overlap = false;
    for (uint32_t m : masks) { if (seen & m) overlap = true; seen |= m; }
    t.ok(!overlap, "fields do not overlap");
    t.ok(seen == 0xFFFFFFFFu, "fields cover the word");

    return t.summary();
}
