#include <cstdio>

#include "i8080.hpp"
#include "i8080_ops.hpp"

static bool peek(const i8080& cpu, unsigned addr, i8080_word_t& out)
{
    if (addr > 0xFFFF || addr >= cpu.memsize) {
        return false;
    }
    out = cpu.mem[addr];
    return true;
}

int i8080_disassemble(const i8080& cpu, i8080_addr_t addr, char* buf, std::size_t bufsize)
{
    i8080_word_t opcode;
    if (!peek(cpu, addr, opcode)) {
        std::snprintf(buf, bufsize, "??");
        return 1;
    }

    const i8080_opinfo& info = i8080_get_opinfo(opcode);
    if (!info.exec) {
        std::snprintf(buf, bufsize, "DB %02Xh", unsigned(opcode));
        return 1;
    }

    char operand[8] = "";
    i8080_word_t lo, hi;
    switch (info.len)
    {
    case 2:
        if (peek(cpu, addr + 1u, lo)) {
            std::snprintf(operand, sizeof(operand), "%02Xh", unsigned(lo));
        } else {
            std::snprintf(operand, sizeof(operand), "??");
        }
        break;
    case 3:
        if (peek(cpu, addr + 1u, lo) && peek(cpu, addr + 2u, hi)) {
            std::snprintf(operand, sizeof(operand), "%04Xh", unsigned(i8080_pair(hi, lo)));
        } else {
            std::snprintf(operand, sizeof(operand), "??");
        }
        break;
    }

    std::snprintf(buf, bufsize, "%s%s", info.mnemonic.c_str(), operand);
    return info.len;
}

const char* i8080_opcode_name(i8080_word_t opcode)
{
    const i8080_opinfo& info = i8080_get_opinfo(opcode);
    return info.exec ? info.mnemonic.c_str() : "DB";
}
