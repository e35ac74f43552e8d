// dm/bitfield.hpp
#pragma once
#include <cstdint>

// A fixed bit range [LO, HI] of a 32-bit word (bit 0 = least significant).
// Values too wide for the field are truncated on insert.
template <int LO, int HI>
struct BitField {
    static_assert(0 <= LO && LO <= HI && HI < 32, "bad bit range");

    static constexpr int      lo    = LO;
    static constexpr int      width = HI - LO + 1;
    static constexpr uint32_t mask  = (width == 32) ? 0xFFFFFFFFu : ((1u << width) - 1u);

    static constexpr uint32_t extract(uint32_t word){
        return (word >> LO) & mask;
    }
    static constexpr int32_t extract_signed(uint32_t word){
        uint32_t m = 1u << (width - 1);
        return (int32_t)((extract(word) ^ m) - m);
    }
    static constexpr uint32_t insert(uint32_t value, uint32_t word){
        return (word & ~(mask << LO)) | ((value & mask) << LO);
    }
};

// Duck Machine instruction word layout, high to low.
using ReservedField = BitField<31, 31>;
using OpField       = BitField<26, 30>;
using CondField     = BitField<22, 25>;
using TargetField   = BitField<18, 21>;
using Src1Field     = BitField<14, 17>;
using Src2Field     = BitField<10, 13>;
using OffsetField   = BitField<0, 9>;

constexpr int32_t OFFSET_MIN = -(1 << (OffsetField::width - 1));
constexpr int32_t OFFSET_MAX =  (1 << (OffsetField::width - 1)) - 1;
