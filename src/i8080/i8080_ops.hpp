//
// Opcode dispatch table, internal to the CPU.
//

#ifndef I8080_OPS_HPP
#define I8080_OPS_HPP

#include <cstdint>
#include <string>

#include "i8080.hpp"

struct i8080_ctx
{
    i8080& cpu;
    i8080_io& io;
    i8080_word_t opcode;
    bool intr; // executing an interrupt vector, PC was not fetched from
};

// Returns true if the instruction wrote PC.
// Otherwise the instruction has advanced PC past its
// operands, and step() advances past the opcode.
using i8080_exec_fn = bool(*)(i8080_ctx& ctx);

struct i8080_opinfo
{
    i8080_exec_fn exec; // null if the opcode is undefined
    std::uint8_t len;    // bytes, incl. opcode
    std::uint8_t cycles; // branch not taken, for conditionals
    std::string mnemonic; // operand appended by disassembler
};

const i8080_opinfo& i8080_get_opinfo(i8080_word_t opcode);

#endif /* I8080_OPS_HPP */
