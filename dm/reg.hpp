// dm/reg.hpp
#pragma once
#include <cstdint>

class Register {
public:
    virtual ~Register() = default;
    virtual int32_t get() const   { return value_; }
    virtual void    put(int32_t v){ value_ = v; }
protected:
    int32_t value_ = 0;
};

// r0: reads as zero, writes are dropped.
class ZeroRegister : public Register {
public:
    int32_t get() const override { return 0; }
    void    put(int32_t) override {}
};
