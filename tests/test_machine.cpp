#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <vector>

#include "machine.hpp"
#include "i8080/i8080_opcodes.hpp"

static void load(machine& m, std::vector<i8080_word_t> prog)
{
    m.load(prog.data(), prog.size());
}

TEST_CASE("I/O bus port map", "[machine][io]") {
    iobus bus;

    SECTION("Idle inputs") {
        REQUIRE(bus.in(0) == 0x0E);
        REQUIRE(bus.in(1) == controller::P1_IDLE);
        REQUIRE(bus.in(2) == 0x00);
    }

    SECTION("DIP switches") {
        bus.set_switch(4, true);
        REQUIRE(bus.in(0) == 0x0F);
        REQUIRE(bus.get_switch(4));

        bus.set_switch(3, true);
        bus.set_switch(5, true);
        bus.set_switch(6, true);
        bus.set_switch(7, true);
        REQUIRE(bus.in(2) == 0x8B);

        bus.ctrl.press(INPUT_P2_FIRE);
        REQUIRE(bus.in(2) == 0x9B);

        bus.set_switch(6, false);
        REQUIRE_FALSE(bus.get_switch(6));
        REQUIRE(bus.in(2) == 0x93);

        REQUIRE_FALSE(bus.get_switch(2));
    }

    SECTION("Player 1 inputs") {
        bus.ctrl.press(INPUT_CREDIT);
        REQUIRE(bus.in(1) == 0x09);
    }

    SECTION("Shift register ports") {
        bus.out(4, 0xFF);
        bus.out(2, 0x07);
        REQUIRE(bus.in(3) == 0x80);
    }

    SECTION("Sound ports") {
        bus.out(3, 0x01);
        bus.out(5, 0x10);
        REQUIRE(bus.sound.pins[0]);
        REQUIRE(bus.sound.pins[8]);
    }

    SECTION("Watchdog and unmapped ports") {
        bus.out(6, 0xFF);
        bus.out(7, 0xFF);
        REQUIRE(bus.in(7) == 0x00);
    }
}

TEST_CASE("Machine memory layout", "[machine]") {
    machine m;
    load(m, { 0x00, 0x00, 0x00, 0x00 });

    REQUIRE(m.cpu.memsize == 4 + RAM_SIZE);
    REQUIRE(m.ninstrs == 0);
    REQUIRE(m.total_cycles == 0);
}

TEST_CASE("Program drives the shift register", "[machine][io]") {
    machine m;
    load(m, {
        0x3E, 0xFF, // MVI A,FFh
        0xD3, 0x04, // OUT 4
        0x3E, 0x07, // MVI A,07h
        0xD3, 0x02, // OUT 2
        0xDB, 0x03, // IN 3
    });

    for (int i = 0; i < 5; ++i) {
        REQUIRE(m.step() == 0);
    }
    REQUIRE(m.cpu.a == 0x80);
    REQUIRE(m.ninstrs == 5);
    REQUIRE(m.total_cycles == 7 + 10 + 7 + 10 + 10);
}

TEST_CASE("Machine reports CPU errors", "[machine][error]") {
    machine m;
    load(m, { 0x00, 0x08 });

    REQUIRE(m.step() == 0);
    REQUIRE(m.step() == I8080_EUNDEF);
    REQUIRE(m.cpu.err_pc == 0x0001);
    REQUIRE(m.ninstrs == 1);
}

TEST_CASE("Frame emulation raises both video interrupts", "[machine][display]") {
    std::vector<i8080_word_t> prog(0x12, 0x00);
    const i8080_word_t main_loop[] = {
        0x31, 0x00, 0x20, // LXI SP,2000h
        0xFB,             // EI
        0xC3, 0x04, 0x00  // JMP 0004h
    };
    std::copy(std::begin(main_loop), std::end(main_loop), prog.begin());
    prog[0x08] = 0xFB; prog[0x09] = 0xC9; // EI; RET
    prog[0x10] = 0xFB; prog[0x11] = 0xC9;

    machine m;
    load(m, prog);

    REQUIRE(m.emulate_frame() == 0);
    REQUIRE(m.display.nframes == 1);
    REQUIRE(m.display.nraised == 2);
    REQUIRE(m.display.vector == i8080_RST_2);
    REQUIRE(m.cpu.int_ff);
    REQUIRE(m.total_cycles >= 2 * m.display.threshold);
    REQUIRE(m.cpu.cycles == 0);

    REQUIRE(m.emulate_frame() == 0);
    REQUIRE(m.display.nframes == 2);
    REQUIRE(m.display.nraised == 4);
    REQUIRE(m.cpu.sp == 0x2000);
}

TEST_CASE("Tracing does not change execution", "[machine][debug]") {
    machine m;
    load(m, { 0x3E, 0x05, 0x06, 0x03, 0x80 });
    m.debug = DEBUG_CYCLES;

    for (int i = 0; i < 3; ++i) {
        REQUIRE(m.step() == 0);
    }
    REQUIRE(m.cpu.a == 8);
    REQUIRE(m.ninstrs == 3);
}

TEST_CASE("Loading a ROM file", "[machine][rom]") {
    fs::path dir = fs::temp_directory_path();
    machine m;

    SECTION("Valid file") {
        fs::path path = dir / "si8080_test_rom.bin";
        {
            std::ofstream out(path, std::ios::binary);
            const char bytes[] = { '\x3E', '\x42', '\x76' };
            out.write(bytes, sizeof(bytes));
        }
        REQUIRE(m.load_rom(path) == 0);
        REQUIRE(m.cpu.memsize == 3 + RAM_SIZE);
        REQUIRE(m.cpu.mem[1] == 0x42);
        fs::remove(path);
    }

    SECTION("Missing file") {
        REQUIRE(m.load_rom(dir / "si8080_no_such_rom.bin") == -1);
    }

    SECTION("Empty file") {
        fs::path path = dir / "si8080_empty_rom.bin";
        { std::ofstream out(path, std::ios::binary); }
        REQUIRE(m.load_rom(path) == -1);
        fs::remove(path);
    }
}
