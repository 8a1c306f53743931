//
// Emulator for the Intel 8080 microprocessor.
//
// All documented instructions are supported. The undocumented
// opcode aliases are not, and stop execution with I8080_EUNDEF.
//
// Example usage:
//
// struct my_io : i8080_io { ... };
//
// int run_8080(const uint8_t* rom, size_t rom_size)
// {
//     i8080 cpu;
//     my_io io;
//     cpu.load(rom, rom_size, 8192);
//
//     int err;
//     while ((err = cpu.step(io)) == I8080_OK) {
//         // some code
//         // call cpu.interrupt() here
//     }
//     return err;
// }
//

#ifndef I8080_HPP
#define I8080_HPP

#include <cstdint>
#include <cstddef>
#include <memory>

using i8080_word_t = std::uint8_t;
using i8080_addr_t = std::uint16_t;
using i8080_dword_t = std::uint16_t; // reg pairs (eg. BC/DE/HL)

enum i8080_status : int
{
    I8080_OK = 0,
    I8080_EUNDEF = -1, // opcode has no mapping
    I8080_EFAULT = -2, // memory access out of bounds
    I8080_EINTR = -3   // interrupt vector is not a 1-byte instruction
};

// Deviations from the hardware, see i8080_ops.cpp
enum i8080_quirk : unsigned
{
    I8080_QUIRK_NONE = 0,
    // DCR truncates modulo 255 instead of 256.
    I8080_QUIRK_DCR_MOD255 = 1 << 0,
    // INX/DCX recompute Z/S/P from the 16-bit result.
    I8080_QUIRK_PAIR_FLAGS = 1 << 1,

    I8080_QUIRKS_DEFAULT = I8080_QUIRK_PAIR_FLAGS
};

// Register operand, in opcode encoding order.
enum i8080_reg : std::uint8_t
{
    REG_B, REG_C, REG_D, REG_E, REG_H, REG_L,
    REG_M, // memory cell at HL
    REG_A
};

enum i8080_rpair : std::uint8_t
{
    RP_BC, RP_DE, RP_HL, RP_SP,
    RP_PSW
};

// Port-addressed device bus, used by IN/OUT.
struct i8080_io
{
    virtual ~i8080_io() = default;

    virtual i8080_word_t in(i8080_word_t port) = 0;
    virtual void out(i8080_word_t port, i8080_word_t word) = 0;
};

struct i8080
{
    // Working registers
    i8080_word_t a, b, c, d, e, h, l;

    i8080_addr_t sp; // Stack pointer
    i8080_addr_t pc; // Program counter

    // Flags
    bool s;  // Sign
    bool z;  // Zero
    bool cy; // Carry
    bool ac; // Aux carry
    bool p;  // Parity

    bool halt;   // In HALT state?
    bool int_en; // Interrupts enabled (INTE pin)
    bool int_ff; // Interrupt latch

    i8080_word_t int_rq; // Interrupt request (opcode)

    // Clock cycles elapsed since last reset
    std::uint64_t cycles;

    unsigned quirks;

    // Set on failure
    i8080_addr_t err_pc;
    i8080_word_t err_opcode;
    i8080_addr_t err_addr;
    bool fault;

    // Program image followed by RAM
    std::unique_ptr<i8080_word_t[]> mem;
    std::size_t memsize;

    i8080();

    // Copy program to address 0 and append ramsize bytes of
    // zeroed RAM. Resets the chip.
    void load(const i8080_word_t* prog, std::size_t progsize, std::size_t ramsize);

    // Reset chip. Eq. to low on RESET pin, but also
    // clears registers, flags and the cycle counter.
    void reset();

    // Run one instruction.
    // Returns I8080_OK, or a negative i8080_status.
    int step(i8080_io& io);

    // Send an interrupt request.
    // If interrupts are enabled, the next call to step()
    // executes opcode instead of fetching from memory.
    void interrupt(i8080_word_t opcode);

    // Bounds-checked memory access.
    // On failure sets err_addr and fault.
    i8080_word_t read(i8080_addr_t addr);
    void write(i8080_addr_t addr, i8080_word_t word);
};

// ---------- state derivation ------------

constexpr i8080_dword_t i8080_pair(i8080_word_t hi, i8080_word_t lo) {
    return i8080_dword_t((hi << 8) | lo);
}
constexpr i8080_word_t i8080_hi(i8080_dword_t word) {
    return i8080_word_t(word >> 8);
}
constexpr i8080_word_t i8080_lo(i8080_dword_t word) {
    return i8080_word_t(word & 0xFF);
}

// Flags byte layout used by PUSH/POP PSW
#define I8080_FLAG_Z  0x01
#define I8080_FLAG_S  0x02
#define I8080_FLAG_P  0x04
#define I8080_FLAG_CY 0x08
#define I8080_FLAG_AC 0x10

i8080_word_t i8080_pack_flags(const i8080& cpu);
void i8080_unpack_flags(i8080& cpu, i8080_word_t word);

// REG_M reads/writes memory at HL.
i8080_word_t i8080_get_reg(i8080& cpu, i8080_reg reg);
void i8080_set_reg(i8080& cpu, i8080_reg reg, i8080_word_t word);

i8080_dword_t i8080_get_rpair(const i8080& cpu, i8080_rpair rp);
void i8080_set_rpair(i8080& cpu, i8080_rpair rp, i8080_dword_t word);

const char* i8080_reg_name(i8080_reg reg);
const char* i8080_rpair_name(i8080_rpair rp);

// ---------- disassembly -----------------

// Disassemble the instruction at addr into buf.
// Returns the instruction length in bytes.
int i8080_disassemble(const i8080& cpu, i8080_addr_t addr, char* buf, std::size_t bufsize);

// Mnemonic without operands, eg. "RST 1" or "LXI B,".
// Undefined opcodes give "DB".
const char* i8080_opcode_name(i8080_word_t opcode);

#endif /* I8080_HPP */
