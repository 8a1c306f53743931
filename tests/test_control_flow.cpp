#include <catch2/catch_test_macros.hpp>

#include "i8080/i8080.hpp"
#include "i8080/i8080_opcodes.hpp"
#include "test_util.hpp"

TEST_CASE("Jumps", "[control][jump]") {
    i8080 cpu;
    test_io io;

    SECTION("JMP") {
        load_program(cpu, { 0xC3, 0x34, 0x12 });
        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 0x1234);
        REQUIRE(cpu.cycles == 10);
    }

    SECTION("Conditional jump not taken") {
        load_program(cpu, { 0xC2, 0x34, 0x12 }); // JNZ
        cpu.z = true;
        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 3);
        REQUIRE(cpu.cycles == 10);
    }

    SECTION("Conditional jump taken") {
        load_program(cpu, { 0xFA, 0x34, 0x12 }); // JM
        cpu.s = true;
        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 0x1234);
    }

    SECTION("Parity conditions") {
        load_program(cpu, { 0xEA, 0x10, 0x00, 0xE2, 0x20, 0x00 }); // JPE; JPO
        cpu.p = false;
        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 3);
        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 0x20);
    }

    SECTION("PCHL") {
        load_program(cpu, { 0xE9 });
        cpu.h = 0x01; cpu.l = 0x23;
        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 0x0123);
    }
}

TEST_CASE("CALL then RET resumes after the call", "[control][call]") {
    i8080 cpu;
    test_io io;
    load_program_at(cpu, 0x11, {
        { 0x00, { 0x31, 0x00, 0x01 } }, // LXI SP,0100h
        { 0x03, { 0xCD, 0x10, 0x00 } }, // CALL 0010h
        { 0x06, { 0x76 } },             // HLT
        { 0x10, { 0xC9 } },             // RET
    });

    REQUIRE(run_steps(cpu, io, 2) == I8080_OK);
    REQUIRE(cpu.pc == 0x0010);
    REQUIRE(cpu.sp == 0x00FE);
    REQUIRE(cpu.mem[0xFE] == 0x06);
    REQUIRE(cpu.mem[0xFF] == 0x00);

    REQUIRE(cpu.step(io) == I8080_OK);
    REQUIRE(cpu.pc == 0x0006);
    REQUIRE(cpu.sp == 0x0100);
    REQUIRE(cpu.cycles == 10 + 17 + 10);
}

TEST_CASE("Conditional CALL and RET timing", "[control][call]") {
    i8080 cpu;
    test_io io;
    load_program_at(cpu, 0x11, {
        { 0x00, { 0x31, 0x00, 0x01 } }, // LXI SP,0100h
        { 0x03, { 0xCC, 0x10, 0x00 } }, // CZ 0010h
        { 0x10, { 0xC8 } },             // RZ
    });
    REQUIRE(cpu.step(io) == I8080_OK);

    SECTION("Not taken") {
        cpu.z = false;
        uint64_t before = cpu.cycles;
        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 0x0006);
        REQUIRE(cpu.sp == 0x0100);
        REQUIRE(cpu.cycles - before == 11);
    }

    SECTION("Taken") {
        cpu.z = true;
        uint64_t before = cpu.cycles;
        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 0x0010);
        REQUIRE(cpu.cycles - before == 17);

        before = cpu.cycles;
        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 0x0006);
        REQUIRE(cpu.cycles - before == 11);
    }
}

TEST_CASE("Stack operations", "[control][stack]") {
    i8080 cpu;
    test_io io;

    SECTION("PUSH then POP moves a pair") {
        load_program(cpu, { 0x31, 0x00, 0x01, 0xC5, 0xD1 }); // LXI SP; PUSH B; POP D
        cpu.b = 0xBE; cpu.c = 0xEF;
        REQUIRE(run_steps(cpu, io, 2) == I8080_OK);
        REQUIRE(cpu.sp == 0x00FE);
        REQUIRE(cpu.mem[0xFF] == 0xBE);
        REQUIRE(cpu.mem[0xFE] == 0xEF);

        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(i8080_get_rpair(cpu, RP_DE) == 0xBEEF);
        REQUIRE(cpu.sp == 0x0100);
        REQUIRE(cpu.cycles == 10 + 11 + 10);
    }

    SECTION("PUSH PSW then POP PSW restores the flags") {
        load_program(cpu, { 0x31, 0x00, 0x01, 0xF5, 0xAF, 0xF1 }); // PUSH PSW; XRA A; POP PSW
        cpu.a = 0x80;
        cpu.s = true;
        cpu.cy = true;
        cpu.ac = true;
        REQUIRE(run_steps(cpu, io, 3) == I8080_OK);
        REQUIRE(cpu.a == 0);
        REQUIRE(cpu.z);

        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.a == 0x80);
        REQUIRE(cpu.s);
        REQUIRE(cpu.cy);
        REQUIRE(cpu.ac);
        REQUIRE_FALSE(cpu.z);
        REQUIRE_FALSE(cpu.p);
    }

    SECTION("XTHL swaps HL with the top of the stack") {
        load_program(cpu, { 0x31, 0x80, 0x00, 0xE3 });
        cpu.mem[0x80] = 0x11;
        cpu.mem[0x81] = 0x22;
        cpu.h = 0xAA; cpu.l = 0xBB;
        REQUIRE(run_steps(cpu, io, 2) == I8080_OK);
        REQUIRE(i8080_get_rpair(cpu, RP_HL) == 0x2211);
        REQUIRE(cpu.mem[0x80] == 0xBB);
        REQUIRE(cpu.mem[0x81] == 0xAA);
        REQUIRE(cpu.sp == 0x0080);
    }

    SECTION("SPHL") {
        load_program(cpu, { 0xF9 });
        cpu.h = 0x20; cpu.l = 0x00;
        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.sp == 0x2000);
    }
}

TEST_CASE("Interrupts", "[control][interrupt]") {
    i8080 cpu;
    test_io io;
    load_program_at(cpu, 0x10, {
        { 0x00, { 0x31, 0x00, 0x01 } }, // LXI SP,0100h
        { 0x03, { 0xFB } },             // EI
        { 0x04, { 0x00, 0x00 } },
    });

    SECTION("Accepted RST pushes the current PC") {
        REQUIRE(run_steps(cpu, io, 2) == I8080_OK);
        cpu.interrupt(i8080_RST_1);

        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 0x0008);
        REQUIRE(cpu.sp == 0x00FE);
        REQUIRE(cpu.mem[0xFE] == 0x04);
        REQUIRE(cpu.mem[0xFF] == 0x00);
        REQUIRE_FALSE(cpu.int_en);
        REQUIRE_FALSE(cpu.int_ff);
        REQUIRE(cpu.cycles == 10 + 4 + 11);
    }

    SECTION("Request waits while interrupts are disabled") {
        REQUIRE(cpu.step(io) == I8080_OK);
        cpu.interrupt(i8080_RST_2);

        REQUIRE(cpu.step(io) == I8080_OK); // EI
        REQUIRE(cpu.pc == 0x0004);
        REQUIRE(cpu.int_ff);

        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE(cpu.pc == 0x0010);
    }

    SECTION("Interrupt ends HALT") {
        cpu.mem[0x04] = 0x76;
        REQUIRE(run_steps(cpu, io, 3) == I8080_OK);
        REQUIRE(cpu.halt);
        cpu.interrupt(i8080_RST_1);

        REQUIRE(cpu.step(io) == I8080_OK);
        REQUIRE_FALSE(cpu.halt);
        REQUIRE(cpu.pc == 0x0008);
        REQUIRE(cpu.mem[0xFE] == 0x05);
    }

    SECTION("Multi-byte vector is rejected") {
        REQUIRE(run_steps(cpu, io, 2) == I8080_OK);
        cpu.interrupt(i8080_JMP);
        REQUIRE(cpu.step(io) == I8080_EINTR);
        REQUIRE(cpu.err_opcode == i8080_JMP);
    }
}

TEST_CASE("RST instruction disables interrupts", "[control][interrupt]") {
    i8080 cpu;
    test_io io;
    load_program(cpu, { 0x31, 0x00, 0x01, 0xFB, 0xFF }); // LXI SP; EI; RST 7

    REQUIRE(run_steps(cpu, io, 3) == I8080_OK);
    REQUIRE(cpu.pc == 0x0038);
    REQUIRE_FALSE(cpu.int_en);
    REQUIRE(cpu.mem[0xFE] == 0x05);
    REQUIRE(cpu.mem[0xFF] == 0x00);
}
