
#ifndef MACHINE_HPP
#define MACHINE_HPP

#include <cstdint>
#include <cstddef>

#include "i8080/i8080.hpp"
#include "devices.hpp"
#include "utils.hpp"

// Work RAM + video RAM, appended to the program image
#define RAM_SIZE 8192
#define MAX_ROM_SIZE (65536 - RAM_SIZE)

#define VRAM_START_ADDR 0x2400
#define VRAM_SIZE (224 * 32)

enum debug_level
{
    DEBUG_NONE,
    DEBUG_TRACE,  // disassembly of every instruction
    DEBUG_REGS,   // + registers and flags
    DEBUG_INSTRS, // + instruction count
    DEBUG_CYCLES  // + cycle counts
};

struct iobus : i8080_io
{
    iobus();

    i8080_word_t in(i8080_word_t port) override;
    void out(i8080_word_t port, i8080_word_t word) override;

    // Cabinet DIP switches 3-7
    bool get_switch(int index) const;
    void set_switch(int index, bool value);

    shift_register shiftreg;
    controller ctrl;
    sound_latch sound;

    i8080_word_t in_port0;
    i8080_word_t dip_port2; // OR'ed with player 2 inputs
};

struct machine
{
    machine();

    // Copy program to address 0, followed by RAM.
    void load(const i8080_word_t* prog, std::size_t size);
    int load_rom(const fs::path& path);

    // Run one instruction (or accept a pending interrupt),
    // then poll the display timer.
    // Returns 0, or a negative i8080_status.
    int step();

    // Run until the end-of-frame interrupt is raised.
    int emulate_frame();

    i8080 cpu;
    iobus bus;
    display_timer display;

    int debug;
    uint64_t ninstrs;
    uint64_t total_cycles;

private:
    void trace(i8080_addr_t pc, bool intr, const char* instr);
    void report_error(int err) const;
};

#endif
