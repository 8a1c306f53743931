//
// The Space Invaders board: 8080, RAM, I/O bus and video interrupts.
//

#include <vector>

#include "machine.hpp"

iobus::iobus() :
    in_port0(0x0e), // debug port
    dip_port2(0)
{}

i8080_word_t iobus::in(i8080_word_t port)
{
    switch (port)
    {
    case 0: return in_port0;
    case 1: return ctrl.p1;
    case 2: return ctrl.p2 | dip_port2;
    case 3: return shiftreg.read();

    default:
        logWARNING("IO read from unmapped port %d", int(port));
        return 0;
    }
}

void iobus::out(i8080_word_t port, i8080_word_t word)
{
    switch (port)
    {
    case 2: shiftreg.set_offset(word); break;
    case 4: shiftreg.shift(word); break;

    case 3: sound.write_port3(word); break;
    case 5: sound.write_port5(word); break;

        // Watchdog port. Resets machine if unresponsive,
        // not required for an emulator
    case 6: break;

    default:
        logWARNING("IO write to unmapped port %d", int(port));
        break;
    }
}

void iobus::set_switch(int index, bool value)
{
    switch (index)
    {
    case 3: set_bit(&dip_port2, 0, value); break;
    case 4: set_bit(&in_port0, 0, value); break;
    case 5: set_bit(&dip_port2, 1, value); break;
    case 6: set_bit(&dip_port2, 3, value); break;
    case 7: set_bit(&dip_port2, 7, value); break;
    default: break;
    }
}

bool iobus::get_switch(int index) const
{
    switch (index)
    {
    case 3: return get_bit(dip_port2, 0);
    case 4: return get_bit(in_port0, 0);
    case 5: return get_bit(dip_port2, 1);
    case 6: return get_bit(dip_port2, 3);
    case 7: return get_bit(dip_port2, 7);
    default: return false;
    }
}

machine::machine() :
    debug(DEBUG_NONE),
    ninstrs(0),
    total_cycles(0)
{}

void machine::load(const i8080_word_t* prog, std::size_t size)
{
    cpu.load(prog, size, RAM_SIZE);
    ninstrs = 0;
    total_cycles = 0;
}

int machine::load_rom(const fs::path& path)
{
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        logERROR("Could not open file %s: %s", path.string().c_str(), ec.message().c_str());
        return -1;
    }
    if (size == 0 || size > MAX_ROM_SIZE) {
        logERROR("File %s has invalid size %ju, expected 1 to %d bytes",
            path.string().c_str(), size, MAX_ROM_SIZE);
        return -1;
    }

    file_ptr file = SAFE_FOPEN(path.c_str(), "rb");
    if (!file) {
        logERROR("Could not open file %s", path.string().c_str());
        return -1;
    }
    std::vector<i8080_word_t> buf(size);
    if (std::fread(buf.data(), 1, buf.size(), file.get()) != buf.size()) {
        logERROR("Could not read %ju bytes from file %s", size, path.string().c_str());
        return -1;
    }

    load(buf.data(), buf.size());
    logMESSAGE("Loaded ROM %s (%ju bytes)", path.string().c_str(), size);
    return 0;
}

void machine::trace(i8080_addr_t pc, bool intr, const char* instr)
{
    if (intr) {
        std::printf("%04X  INT %-12s", unsigned(pc), instr);
    } else {
        std::printf("%04X  %-16s", unsigned(pc), instr);
    }

    if (debug >= DEBUG_REGS) {
        std::printf(" A=%02X", unsigned(cpu.a));
        for (i8080_rpair rp : { RP_BC, RP_DE, RP_HL, RP_SP }) {
            std::printf(" %s=%04X", i8080_rpair_name(rp), unsigned(i8080_get_rpair(cpu, rp)));
        }
        std::printf(" %c%c%c%c%c",
            cpu.z ? 'Z' : '-', cpu.s ? 'S' : '-', cpu.p ? 'P' : '-',
            cpu.cy ? 'C' : '-', cpu.ac ? 'A' : '-');
    }
    if (debug >= DEBUG_INSTRS) {
        std::printf(" #%llu", (unsigned long long)ninstrs);
    }
    if (debug >= DEBUG_CYCLES) {
        std::printf(" cyc=%llu/%llu",
            (unsigned long long)cpu.cycles, (unsigned long long)total_cycles);
    }
    std::printf("\n");
}

void machine::report_error(int err) const
{
    switch (err)
    {
    case I8080_EUNDEF:
        logERROR("Undefined opcode %02Xh at %04Xh", unsigned(cpu.err_opcode), unsigned(cpu.err_pc));
        break;
    case I8080_EFAULT:
        logERROR("Memory access out of bounds at %04Xh (instruction at %04Xh, memory size %zu)",
            unsigned(cpu.err_addr), unsigned(cpu.err_pc), cpu.memsize);
        break;
    case I8080_EINTR:
        logERROR("Interrupt vector %02Xh is not a 1-byte instruction", unsigned(cpu.err_opcode));
        break;
    default:
        logERROR("CPU error %d", err);
        break;
    }
}

int machine::step()
{
    char instr[32] = "";
    i8080_addr_t pc = cpu.pc;
    bool intr = cpu.int_ff && cpu.int_en;

    if (debug >= DEBUG_TRACE)
    {
        if (intr) {
            std::snprintf(instr, sizeof(instr), "%s", i8080_opcode_name(cpu.int_rq));
        } else {
            i8080_disassemble(cpu, pc, instr, sizeof(instr));
        }
    }

    uint64_t cycles_before = cpu.cycles;

    int err = cpu.step(bus);
    if (err) {
        report_error(err);
        return err;
    }
    ninstrs++;
    total_cycles += cpu.cycles - cycles_before;

    if (debug >= DEBUG_TRACE) {
        trace(pc, intr, instr);
    }

    if (display.poll(cpu.cycles)) {
        cpu.interrupt(display.vector);
    }
    return 0;
}

int machine::emulate_frame()
{
    uint64_t frame = display.nframes;
    while (display.nframes == frame) {
        int err = step();
        if (err) { return err; }
    }
    return 0;
}
