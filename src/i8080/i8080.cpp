#include <cstring>

#include "i8080.hpp"
#include "i8080_ops.hpp"

i8080::i8080() :
    quirks(I8080_QUIRKS_DEFAULT),
    memsize(0)
{
    reset();
}

void i8080::load(const i8080_word_t* prog, std::size_t progsize, std::size_t ramsize)
{
    memsize = progsize + ramsize;
    mem = std::make_unique<i8080_word_t[]>(memsize); // zeroed
    if (progsize != 0) {
        std::memcpy(mem.get(), prog, progsize);
    }
    reset();
}

void i8080::reset()
{
    a = b = c = d = e = h = l = 0;
    sp = 0;
    pc = 0;

    s = z = cy = ac = p = false;

    halt = false;
    int_en = false;
    int_ff = false;
    int_rq = 0;

    cycles = 0;

    err_pc = 0;
    err_opcode = 0;
    err_addr = 0;
    fault = false;
}

i8080_word_t i8080::read(i8080_addr_t addr)
{
    if (addr >= memsize) [[unlikely]] {
        err_addr = addr;
        fault = true;
        return 0;
    }
    return mem[addr];
}

void i8080::write(i8080_addr_t addr, i8080_word_t word)
{
    if (addr >= memsize) [[unlikely]] {
        err_addr = addr;
        fault = true;
        return;
    }
    mem[addr] = word;
}

void i8080::interrupt(i8080_word_t opcode)
{
    int_rq = opcode;
    int_ff = true;
}

int i8080::step(i8080_io& io)
{
    fault = false;

    i8080_word_t opcode;
    bool intr = int_ff && int_en;
    if (intr) {
        // acknowledge
        opcode = int_rq;
        int_ff = false;
        int_en = false;
        halt = false;
    }
    else if (halt) {
        cycles += 4;
        return I8080_OK;
    }
    else {
        opcode = read(pc);
        if (fault) {
            err_pc = pc;
            err_opcode = 0;
            return I8080_EFAULT;
        }
    }

    const i8080_opinfo& info = i8080_get_opinfo(opcode);
    if (!info.exec) {
        err_pc = pc;
        err_opcode = opcode;
        return I8080_EUNDEF;
    }
    if (intr && info.len != 1) {
        err_pc = pc;
        err_opcode = opcode;
        return I8080_EINTR;
    }

    i8080_addr_t start_pc = pc;
    i8080_ctx ctx{ *this, io, opcode, intr };

    bool jumped = info.exec(ctx);
    cycles += info.cycles;

    if (fault) {
        err_pc = start_pc;
        err_opcode = opcode;
        return I8080_EFAULT;
    }
    if (!jumped && !intr) {
        pc += 1;
    }
    return I8080_OK;
}

i8080_word_t i8080_pack_flags(const i8080& cpu)
{
    return i8080_word_t(
        (cpu.z  ? I8080_FLAG_Z  : 0) |
        (cpu.s  ? I8080_FLAG_S  : 0) |
        (cpu.p  ? I8080_FLAG_P  : 0) |
        (cpu.cy ? I8080_FLAG_CY : 0) |
        (cpu.ac ? I8080_FLAG_AC : 0));
}

void i8080_unpack_flags(i8080& cpu, i8080_word_t word)
{
    cpu.z  = (word & I8080_FLAG_Z) != 0;
    cpu.s  = (word & I8080_FLAG_S) != 0;
    cpu.p  = (word & I8080_FLAG_P) != 0;
    cpu.cy = (word & I8080_FLAG_CY) != 0;
    cpu.ac = (word & I8080_FLAG_AC) != 0;
}

i8080_word_t i8080_get_reg(i8080& cpu, i8080_reg reg)
{
    switch (reg)
    {
    case REG_B: return cpu.b;
    case REG_C: return cpu.c;
    case REG_D: return cpu.d;
    case REG_E: return cpu.e;
    case REG_H: return cpu.h;
    case REG_L: return cpu.l;
    case REG_M: return cpu.read(i8080_pair(cpu.h, cpu.l));
    case REG_A: return cpu.a;
    }
    return 0;
}

void i8080_set_reg(i8080& cpu, i8080_reg reg, i8080_word_t word)
{
    switch (reg)
    {
    case REG_B: cpu.b = word; break;
    case REG_C: cpu.c = word; break;
    case REG_D: cpu.d = word; break;
    case REG_E: cpu.e = word; break;
    case REG_H: cpu.h = word; break;
    case REG_L: cpu.l = word; break;
    case REG_M: cpu.write(i8080_pair(cpu.h, cpu.l), word); break;
    case REG_A: cpu.a = word; break;
    }
}

i8080_dword_t i8080_get_rpair(const i8080& cpu, i8080_rpair rp)
{
    switch (rp)
    {
    case RP_BC:  return i8080_pair(cpu.b, cpu.c);
    case RP_DE:  return i8080_pair(cpu.d, cpu.e);
    case RP_HL:  return i8080_pair(cpu.h, cpu.l);
    case RP_SP:  return cpu.sp;
    case RP_PSW: return i8080_pair(cpu.a, i8080_pack_flags(cpu));
    }
    return 0;
}

void i8080_set_rpair(i8080& cpu, i8080_rpair rp, i8080_dword_t word)
{
    i8080_word_t hi = i8080_hi(word);
    i8080_word_t lo = i8080_lo(word);
    switch (rp)
    {
    case RP_BC:  cpu.b = hi; cpu.c = lo; break;
    case RP_DE:  cpu.d = hi; cpu.e = lo; break;
    case RP_HL:  cpu.h = hi; cpu.l = lo; break;
    case RP_SP:  cpu.sp = word; break;
    case RP_PSW: cpu.a = hi; i8080_unpack_flags(cpu, lo); break;
    }
}

const char* i8080_reg_name(i8080_reg reg)
{
    static const char* NAMES[] = { "B", "C", "D", "E", "H", "L", "M", "A" };
    return NAMES[reg & 0x7];
}

const char* i8080_rpair_name(i8080_rpair rp)
{
    switch (rp)
    {
    case RP_BC:  return "BC";
    case RP_DE:  return "DE";
    case RP_HL:  return "HL";
    case RP_SP:  return "SP";
    case RP_PSW: return "PSW";
    }
    return "?";
}
