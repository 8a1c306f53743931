//
// Instruction handlers and the opcode table.
//
// Opcode bit fields:
//   ddd/sss  register, see i8080_reg    (bits 5-3 / 2-0)
//   rp       register pair BC/DE/HL/SP  (bits 5-4), SP is PSW for PUSH/POP
//   ccc      condition NZ/Z/NC/C/PO/PE/P/M (bits 5-3)
//   nnn      RST vector (bits 5-3)
//
// Timings from the Intel 8080 Microcomputer Systems User's Manual.
//

#include <array>
#include <utility>

#include "i8080_ops.hpp"
#include "i8080_alu.hpp"

static i8080_reg dst_reg(i8080_word_t opcode) {
    return i8080_reg((opcode >> 3) & 0x7);
}
static i8080_reg src_reg(i8080_word_t opcode) {
    return i8080_reg(opcode & 0x7);
}
static i8080_rpair rpair_sp(i8080_word_t opcode) {
    return i8080_rpair((opcode >> 4) & 0x3);
}
static i8080_rpair rpair_psw(i8080_word_t opcode) {
    i8080_rpair rp = rpair_sp(opcode);
    return rp == RP_SP ? RP_PSW : rp;
}

static bool condition(const i8080& cpu, i8080_word_t opcode)
{
    switch ((opcode >> 3) & 0x7)
    {
    case 0: return !cpu.z;  // NZ
    case 1: return cpu.z;   // Z
    case 2: return !cpu.cy; // NC
    case 3: return cpu.cy;  // C
    case 4: return !cpu.p;  // PO
    case 5: return cpu.p;   // PE
    case 6: return !cpu.s;  // P
    default: return cpu.s;  // M
    }
}

// Operand fetch. Advances PC past the operand.
static i8080_word_t imm8(i8080& cpu)
{
    i8080_word_t word = cpu.read(i8080_addr_t(cpu.pc + 1));
    cpu.pc += 1;
    return word;
}

static i8080_dword_t imm16(i8080& cpu)
{
    i8080_word_t lo = cpu.read(i8080_addr_t(cpu.pc + 1));
    i8080_word_t hi = cpu.read(i8080_addr_t(cpu.pc + 2));
    cpu.pc += 2;
    return i8080_pair(hi, lo);
}

static void push(i8080& cpu, i8080_dword_t word)
{
    cpu.write(i8080_addr_t(cpu.sp - 1), i8080_hi(word));
    cpu.write(i8080_addr_t(cpu.sp - 2), i8080_lo(word));
    cpu.sp -= 2;
}

static i8080_dword_t pop(i8080& cpu)
{
    i8080_word_t lo = cpu.read(cpu.sp);
    i8080_word_t hi = cpu.read(i8080_addr_t(cpu.sp + 1));
    cpu.sp += 2;
    return i8080_pair(hi, lo);
}

// Address of the next instruction, for CALL/RST
static i8080_addr_t return_addr(const i8080_ctx& x) {
    return x.intr ? x.cpu.pc : i8080_addr_t(x.cpu.pc + 1);
}

// ---------- data transfer ---------------

static bool op_nop(i8080_ctx&) { return false; }

static bool op_mov(i8080_ctx& x)
{
    i8080_word_t word = i8080_get_reg(x.cpu, src_reg(x.opcode));
    i8080_set_reg(x.cpu, dst_reg(x.opcode), word);
    return false;
}

static bool op_mvi(i8080_ctx& x)
{
    i8080_word_t word = imm8(x.cpu);
    i8080_set_reg(x.cpu, dst_reg(x.opcode), word);
    return false;
}

static bool op_lxi(i8080_ctx& x)
{
    i8080_dword_t word = imm16(x.cpu);
    i8080_set_rpair(x.cpu, rpair_sp(x.opcode), word);
    return false;
}

static bool op_lda(i8080_ctx& x)
{
    x.cpu.a = x.cpu.read(imm16(x.cpu));
    return false;
}

static bool op_sta(i8080_ctx& x)
{
    x.cpu.write(imm16(x.cpu), x.cpu.a);
    return false;
}

static bool op_lhld(i8080_ctx& x)
{
    i8080_addr_t addr = imm16(x.cpu);
    x.cpu.l = x.cpu.read(addr);
    x.cpu.h = x.cpu.read(i8080_addr_t(addr + 1));
    return false;
}

static bool op_shld(i8080_ctx& x)
{
    i8080_addr_t addr = imm16(x.cpu);
    x.cpu.write(addr, x.cpu.l);
    x.cpu.write(i8080_addr_t(addr + 1), x.cpu.h);
    return false;
}

// BC or DE only
static bool op_ldax(i8080_ctx& x)
{
    x.cpu.a = x.cpu.read(i8080_get_rpair(x.cpu, rpair_sp(x.opcode)));
    return false;
}

static bool op_stax(i8080_ctx& x)
{
    x.cpu.write(i8080_get_rpair(x.cpu, rpair_sp(x.opcode)), x.cpu.a);
    return false;
}

static bool op_xchg(i8080_ctx& x)
{
    std::swap(x.cpu.h, x.cpu.d);
    std::swap(x.cpu.l, x.cpu.e);
    return false;
}

// ---------- arithmetic/logic ------------

static void alu(i8080& cpu, int family, i8080_word_t rhs)
{
    switch (family)
    {
    case 0: cpu.a = i8080_add(cpu, cpu.a, rhs, false);  break; // ADD
    case 1: cpu.a = i8080_add(cpu, cpu.a, rhs, cpu.cy); break; // ADC
    case 2: cpu.a = i8080_sub(cpu, cpu.a, rhs, false);  break; // SUB
    case 3: cpu.a = i8080_sub(cpu, cpu.a, rhs, cpu.cy); break; // SBB
    case 4: cpu.a = i8080_and(cpu, cpu.a, rhs);         break; // ANA
    case 5: cpu.a = i8080_xor(cpu, cpu.a, rhs);         break; // XRA
    case 6: cpu.a = i8080_or(cpu, cpu.a, rhs);          break; // ORA
    case 7: i8080_sub(cpu, cpu.a, rhs, false);          break; // CMP
    }
}

static bool op_alu(i8080_ctx& x)
{
    i8080_word_t rhs = i8080_get_reg(x.cpu, src_reg(x.opcode));
    alu(x.cpu, (x.opcode >> 3) & 0x7, rhs);
    return false;
}

static bool op_alu_imm(i8080_ctx& x)
{
    i8080_word_t rhs = imm8(x.cpu);
    alu(x.cpu, (x.opcode >> 3) & 0x7, rhs);
    return false;
}

static bool op_inr(i8080_ctx& x)
{
    i8080_reg reg = dst_reg(x.opcode);
    i8080_set_reg(x.cpu, reg, i8080_inr(x.cpu, i8080_get_reg(x.cpu, reg)));
    return false;
}

static bool op_dcr(i8080_ctx& x)
{
    i8080_reg reg = dst_reg(x.opcode);
    i8080_set_reg(x.cpu, reg, i8080_dcr(x.cpu, i8080_get_reg(x.cpu, reg)));
    return false;
}

static bool op_inx(i8080_ctx& x)
{
    i8080_rpair rp = rpair_sp(x.opcode);
    i8080_dword_t word = i8080_dword_t(i8080_get_rpair(x.cpu, rp) + 1);
    i8080_set_rpair(x.cpu, rp, word);
    if (x.cpu.quirks & I8080_QUIRK_PAIR_FLAGS) {
        i8080_set_zsp16(x.cpu, word);
    }
    return false;
}

static bool op_dcx(i8080_ctx& x)
{
    i8080_rpair rp = rpair_sp(x.opcode);
    i8080_dword_t word = i8080_dword_t(i8080_get_rpair(x.cpu, rp) - 1);
    i8080_set_rpair(x.cpu, rp, word);
    if (x.cpu.quirks & I8080_QUIRK_PAIR_FLAGS) {
        i8080_set_zsp16(x.cpu, word);
    }
    return false;
}

static bool op_dad(i8080_ctx& x)
{
    i8080_dad(x.cpu, i8080_get_rpair(x.cpu, rpair_sp(x.opcode)));
    return false;
}

static bool op_rlc(i8080_ctx& x) { i8080_rlc(x.cpu); return false; }
static bool op_rrc(i8080_ctx& x) { i8080_rrc(x.cpu); return false; }
static bool op_ral(i8080_ctx& x) { i8080_ral(x.cpu); return false; }
static bool op_rar(i8080_ctx& x) { i8080_rar(x.cpu); return false; }
static bool op_daa(i8080_ctx& x) { i8080_daa(x.cpu); return false; }

static bool op_cma(i8080_ctx& x) { x.cpu.a = ~x.cpu.a; return false; }
static bool op_stc(i8080_ctx& x) { x.cpu.cy = true; return false; }
static bool op_cmc(i8080_ctx& x) { x.cpu.cy = !x.cpu.cy; return false; }

// ---------- branch ----------------------

static bool op_jmp(i8080_ctx& x)
{
    x.cpu.pc = imm16(x.cpu);
    return true;
}

static bool op_jcc(i8080_ctx& x)
{
    i8080_addr_t addr = imm16(x.cpu);
    if (condition(x.cpu, x.opcode)) {
        x.cpu.pc = addr;
        return true;
    }
    return false;
}

static bool op_call(i8080_ctx& x)
{
    i8080_addr_t addr = imm16(x.cpu);
    push(x.cpu, return_addr(x));
    x.cpu.pc = addr;
    return true;
}

static bool op_ccc(i8080_ctx& x)
{
    i8080_addr_t addr = imm16(x.cpu);
    if (condition(x.cpu, x.opcode)) {
        push(x.cpu, return_addr(x));
        x.cpu.pc = addr;
        x.cpu.cycles += 6;
        return true;
    }
    return false;
}

static bool op_ret(i8080_ctx& x)
{
    x.cpu.pc = pop(x.cpu);
    return true;
}

static bool op_rcc(i8080_ctx& x)
{
    if (condition(x.cpu, x.opcode)) {
        x.cpu.pc = pop(x.cpu);
        x.cpu.cycles += 6;
        return true;
    }
    return false;
}

static bool op_rst(i8080_ctx& x)
{
    push(x.cpu, return_addr(x));
    x.cpu.pc = x.opcode & 0x38;
    x.cpu.int_en = false;
    return true;
}

static bool op_pchl(i8080_ctx& x)
{
    x.cpu.pc = i8080_pair(x.cpu.h, x.cpu.l);
    return true;
}

// ---------- stack -----------------------

static bool op_push(i8080_ctx& x)
{
    push(x.cpu, i8080_get_rpair(x.cpu, rpair_psw(x.opcode)));
    return false;
}

static bool op_pop(i8080_ctx& x)
{
    i8080_dword_t word = pop(x.cpu);
    i8080_set_rpair(x.cpu, rpair_psw(x.opcode), word);
    return false;
}

static bool op_xthl(i8080_ctx& x)
{
    i8080& cpu = x.cpu;
    i8080_word_t lo = cpu.read(cpu.sp);
    i8080_word_t hi = cpu.read(i8080_addr_t(cpu.sp + 1));
    cpu.write(cpu.sp, cpu.l);
    cpu.write(i8080_addr_t(cpu.sp + 1), cpu.h);
    cpu.l = lo;
    cpu.h = hi;
    return false;
}

static bool op_sphl(i8080_ctx& x)
{
    x.cpu.sp = i8080_pair(x.cpu.h, x.cpu.l);
    return false;
}

// ---------- I/O and machine control -----

static bool op_in(i8080_ctx& x)
{
    i8080_word_t port = imm8(x.cpu);
    x.cpu.a = x.io.in(port);
    return false;
}

static bool op_out(i8080_ctx& x)
{
    i8080_word_t port = imm8(x.cpu);
    x.io.out(port, x.cpu.a);
    return false;
}

static bool op_ei(i8080_ctx& x) { x.cpu.int_en = true; return false; }
static bool op_di(i8080_ctx& x) { x.cpu.int_en = false; return false; }
static bool op_hlt(i8080_ctx& x) { x.cpu.halt = true; return false; }

// ---------- table -----------------------

using optable_t = std::array<i8080_opinfo, 256>;

static const char* const RP_SP_NAMES[] = { "B", "D", "H", "SP" };
static const char* const RP_PSW_NAMES[] = { "B", "D", "H", "PSW" };
static const char* const COND_NAMES[] = { "NZ", "Z", "NC", "C", "PO", "PE", "P", "M" };

static const char* const ALU_NAMES[] = { "ADD", "ADC", "SUB", "SBB", "ANA", "XRA", "ORA", "CMP" };
static const char* const ALU_IMM_NAMES[] = { "ADI", "ACI", "SUI", "SBI", "ANI", "XRI", "ORI", "CPI" };

static optable_t make_optable()
{
    optable_t t{};

    auto def = [&t](int opcode, i8080_exec_fn exec, int len, int cycles, std::string mnemonic) {
        t[opcode] = { exec, std::uint8_t(len), std::uint8_t(cycles), std::move(mnemonic) };
    };
    auto reg = [](int r) { return std::string(i8080_reg_name(i8080_reg(r))); };

    def(0x00, op_nop, 1, 4, "NOP");

    for (int rp = 0; rp < 4; ++rp)
    {
        std::string name = RP_SP_NAMES[rp];
        def(0x01 | (rp << 4), op_lxi, 3, 10, "LXI " + name + ",");
        def(0x03 | (rp << 4), op_inx, 1, 5, "INX " + name);
        def(0x09 | (rp << 4), op_dad, 1, 10, "DAD " + name);
        def(0x0B | (rp << 4), op_dcx, 1, 5, "DCX " + name);

        def(0xC1 | (rp << 4), op_pop, 1, 10, std::string("POP ") + RP_PSW_NAMES[rp]);
        def(0xC5 | (rp << 4), op_push, 1, 11, std::string("PUSH ") + RP_PSW_NAMES[rp]);
    }

    def(0x02, op_stax, 1, 7, "STAX B");
    def(0x12, op_stax, 1, 7, "STAX D");
    def(0x0A, op_ldax, 1, 7, "LDAX B");
    def(0x1A, op_ldax, 1, 7, "LDAX D");
    def(0x22, op_shld, 3, 16, "SHLD ");
    def(0x2A, op_lhld, 3, 16, "LHLD ");
    def(0x32, op_sta, 3, 13, "STA ");
    def(0x3A, op_lda, 3, 13, "LDA ");

    for (int r = 0; r < 8; ++r)
    {
        bool m = (r == REG_M);
        def(0x04 | (r << 3), op_inr, 1, m ? 10 : 5, "INR " + reg(r));
        def(0x05 | (r << 3), op_dcr, 1, m ? 10 : 5, "DCR " + reg(r));
        def(0x06 | (r << 3), op_mvi, 2, m ? 10 : 7, "MVI " + reg(r) + ",");
    }

    def(0x07, op_rlc, 1, 4, "RLC");
    def(0x0F, op_rrc, 1, 4, "RRC");
    def(0x17, op_ral, 1, 4, "RAL");
    def(0x1F, op_rar, 1, 4, "RAR");
    def(0x27, op_daa, 1, 4, "DAA");
    def(0x2F, op_cma, 1, 4, "CMA");
    def(0x37, op_stc, 1, 4, "STC");
    def(0x3F, op_cmc, 1, 4, "CMC");

    for (int d = 0; d < 8; ++d) {
        for (int s = 0; s < 8; ++s)
        {
            bool m = (d == REG_M || s == REG_M);
            def(0x40 | (d << 3) | s, op_mov, 1, m ? 7 : 5, "MOV " + reg(d) + "," + reg(s));
        }
    }
    // in place of MOV M,M
    def(0x76, op_hlt, 1, 7, "HLT");

    for (int f = 0; f < 8; ++f)
    {
        for (int s = 0; s < 8; ++s) {
            def(0x80 | (f << 3) | s, op_alu, 1, s == REG_M ? 7 : 4,
                std::string(ALU_NAMES[f]) + " " + reg(s));
        }
        def(0xC6 | (f << 3), op_alu_imm, 2, 7, std::string(ALU_IMM_NAMES[f]) + " ");
    }

    for (int cc = 0; cc < 8; ++cc)
    {
        std::string name = COND_NAMES[cc];
        def(0xC0 | (cc << 3), op_rcc, 1, 5, "R" + name);
        def(0xC2 | (cc << 3), op_jcc, 3, 10, "J" + name + " ");
        def(0xC4 | (cc << 3), op_ccc, 3, 11, "C" + name + " ");
        def(0xC7 | (cc << 3), op_rst, 1, 11, "RST " + std::to_string(cc));
    }

    def(0xC3, op_jmp, 3, 10, "JMP ");
    def(0xC9, op_ret, 1, 10, "RET");
    def(0xCD, op_call, 3, 17, "CALL ");
    def(0xD3, op_out, 2, 10, "OUT ");
    def(0xDB, op_in, 2, 10, "IN ");
    def(0xE3, op_xthl, 1, 18, "XTHL");
    def(0xE9, op_pchl, 1, 5, "PCHL");
    def(0xEB, op_xchg, 1, 4, "XCHG");
    def(0xF3, op_di, 1, 4, "DI");
    def(0xF9, op_sphl, 1, 5, "SPHL");
    def(0xFB, op_ei, 1, 4, "EI");

    return t;
}

const i8080_opinfo& i8080_get_opinfo(i8080_word_t opcode)
{
    static const optable_t OPTABLE = make_optable();
    return OPTABLE[opcode];
}
