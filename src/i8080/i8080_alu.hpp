//
// Arithmetic/logic operations of the 8080.
// Each returns the truncated result and updates the flags in cpu.
//

#ifndef I8080_ALU_HPP
#define I8080_ALU_HPP

#include "i8080.hpp"

// True if an even number of bits are set.
bool i8080_parity(unsigned word);

// Set Z, S, P from an 8-bit result.
void i8080_set_zsp(i8080& cpu, i8080_word_t res);
// Set Z, S, P from a 16-bit result (S is bit 15).
void i8080_set_zsp16(i8080& cpu, i8080_dword_t res);

// ADD/ADC/ADI/ACI
i8080_word_t i8080_add(i8080& cpu, i8080_word_t lhs, i8080_word_t rhs, bool carry);
// SUB/SBB/SUI/SBI, and CMP/CPI discarding the result
i8080_word_t i8080_sub(i8080& cpu, i8080_word_t lhs, i8080_word_t rhs, bool borrow);

i8080_word_t i8080_and(i8080& cpu, i8080_word_t lhs, i8080_word_t rhs);
i8080_word_t i8080_xor(i8080& cpu, i8080_word_t lhs, i8080_word_t rhs);
i8080_word_t i8080_or(i8080& cpu, i8080_word_t lhs, i8080_word_t rhs);

// Does not affect CY.
i8080_word_t i8080_inr(i8080& cpu, i8080_word_t word);
i8080_word_t i8080_dcr(i8080& cpu, i8080_word_t word);

// HL += rhs, only affects CY.
void i8080_dad(i8080& cpu, i8080_dword_t rhs);

// Rotate the accumulator
void i8080_rlc(i8080& cpu);
void i8080_rrc(i8080& cpu);
void i8080_ral(i8080& cpu);
void i8080_rar(i8080& cpu);

// Decimal adjust the accumulator
void i8080_daa(i8080& cpu);

#endif /* I8080_ALU_HPP */
