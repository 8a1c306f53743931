#include <bit>

#include "i8080_alu.hpp"

bool i8080_parity(unsigned word)
{
    return (std::popcount(word) & 1) == 0;
}

void i8080_set_zsp(i8080& cpu, i8080_word_t res)
{
    cpu.z = (res == 0);
    cpu.s = (res & 0x80) != 0;
    cpu.p = i8080_parity(res);
}

void i8080_set_zsp16(i8080& cpu, i8080_dword_t res)
{
    cpu.z = (res == 0);
    cpu.s = (res & 0x8000) != 0;
    cpu.p = i8080_parity(res);
}

i8080_word_t i8080_add(i8080& cpu, i8080_word_t lhs, i8080_word_t rhs, bool carry)
{
    unsigned sum = unsigned(lhs) + rhs + carry;
    i8080_word_t res = i8080_word_t(sum);

    i8080_set_zsp(cpu, res);
    cpu.cy = sum > 0xFF;
    cpu.ac = ((lhs & 0xF) + (rhs & 0xF) + carry) > 0xF;
    return res;
}

// The 8080 subtracts by adding the two's complement,
// AC is the carry out of bit 3 of that addition.
i8080_word_t i8080_sub(i8080& cpu, i8080_word_t lhs, i8080_word_t rhs, bool borrow)
{
    i8080_word_t res = i8080_word_t(lhs - rhs - borrow);

    i8080_set_zsp(cpu, res);
    cpu.cy = unsigned(lhs) < unsigned(rhs) + borrow;
    cpu.ac = ((lhs & 0xF) + (~rhs & 0xF) + !borrow) > 0xF;
    return res;
}

i8080_word_t i8080_and(i8080& cpu, i8080_word_t lhs, i8080_word_t rhs)
{
    i8080_word_t res = lhs & rhs;
    i8080_set_zsp(cpu, res);
    cpu.cy = false;
    cpu.ac = ((lhs | rhs) & 0x08) != 0;
    return res;
}

i8080_word_t i8080_xor(i8080& cpu, i8080_word_t lhs, i8080_word_t rhs)
{
    i8080_word_t res = lhs ^ rhs;
    i8080_set_zsp(cpu, res);
    cpu.cy = false;
    cpu.ac = false;
    return res;
}

i8080_word_t i8080_or(i8080& cpu, i8080_word_t lhs, i8080_word_t rhs)
{
    i8080_word_t res = lhs | rhs;
    i8080_set_zsp(cpu, res);
    cpu.cy = false;
    cpu.ac = false;
    return res;
}

i8080_word_t i8080_inr(i8080& cpu, i8080_word_t word)
{
    i8080_word_t res = i8080_word_t(word + 1);
    i8080_set_zsp(cpu, res);
    cpu.ac = (res & 0xF) == 0;
    return res;
}

i8080_word_t i8080_dcr(i8080& cpu, i8080_word_t word)
{
    i8080_word_t res;
    if (cpu.quirks & I8080_QUIRK_DCR_MOD255) {
        // 0 - 1 gives 0xFE
        res = i8080_word_t((int(word) - 1 + 255) % 255);
    } else {
        res = i8080_word_t(word - 1);
    }
    i8080_set_zsp(cpu, res);
    cpu.ac = (res & 0xF) != 0xF;
    return res;
}

void i8080_dad(i8080& cpu, i8080_dword_t rhs)
{
    unsigned sum = unsigned(i8080_pair(cpu.h, cpu.l)) + rhs;
    cpu.h = i8080_hi(i8080_dword_t(sum));
    cpu.l = i8080_lo(i8080_dword_t(sum));
    cpu.cy = sum > 0xFFFF;
}

void i8080_rlc(i8080& cpu)
{
    cpu.cy = (cpu.a & 0x80) != 0;
    cpu.a = i8080_word_t((cpu.a << 1) | cpu.cy);
}

void i8080_rrc(i8080& cpu)
{
    cpu.cy = (cpu.a & 0x01) != 0;
    cpu.a = i8080_word_t((cpu.a >> 1) | (cpu.cy << 7));
}

void i8080_ral(i8080& cpu)
{
    bool cy = cpu.cy;
    cpu.cy = (cpu.a & 0x80) != 0;
    cpu.a = i8080_word_t((cpu.a << 1) | cy);
}

void i8080_rar(i8080& cpu)
{
    bool cy = cpu.cy;
    cpu.cy = (cpu.a & 0x01) != 0;
    cpu.a = i8080_word_t((cpu.a >> 1) | (cy << 7));
}

void i8080_daa(i8080& cpu)
{
    i8080_word_t corr = 0;
    bool cy = cpu.cy;

    i8080_word_t lsb = cpu.a & 0x0F;
    i8080_word_t msb = cpu.a >> 4;

    if (cpu.ac || lsb > 9) {
        corr |= 0x06;
    }
    if (cpu.cy || msb > 9 || (msb >= 9 && lsb > 9)) {
        corr |= 0x60;
        cy = true;
    }
    cpu.a = i8080_add(cpu, cpu.a, corr, false);
    cpu.cy = cy;
}
