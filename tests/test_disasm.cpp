#include <catch2/catch_test_macros.hpp>

#include <string>

#include "i8080/i8080.hpp"
#include "test_util.hpp"

static std::string disasm(const i8080& cpu, i8080_addr_t addr, int* len = nullptr)
{
    char buf[32];
    int n = i8080_disassemble(cpu, addr, buf, sizeof(buf));
    if (len) { *len = n; }
    return buf;
}

TEST_CASE("Disassembly of each operand form", "[disasm]") {
    i8080 cpu;
    load_program(cpu, {
        0x3E, 0x05,       // 0: MVI A,05h
        0xC3, 0x34, 0x12, // 2: JMP 1234h
        0x80,             // 5: ADD B
        0x21, 0x00, 0x24, // 6: LXI H,2400h
        0x08,             // 9: undefined
        0xCF,             // A: RST 1
        0xF5,             // B: PUSH PSW
        0x7E,             // C: MOV A,M
        0xDB, 0x01,       // D: IN 01h
    });

    int len = 0;
    REQUIRE(disasm(cpu, 0x0, &len) == "MVI A,05h");
    REQUIRE(len == 2);
    REQUIRE(disasm(cpu, 0x2, &len) == "JMP 1234h");
    REQUIRE(len == 3);
    REQUIRE(disasm(cpu, 0x5, &len) == "ADD B");
    REQUIRE(len == 1);
    REQUIRE(disasm(cpu, 0x6) == "LXI H,2400h");
    REQUIRE(disasm(cpu, 0x9, &len) == "DB 08h");
    REQUIRE(len == 1);
    REQUIRE(disasm(cpu, 0xA) == "RST 1");
    REQUIRE(disasm(cpu, 0xB) == "PUSH PSW");
    REQUIRE(disasm(cpu, 0xC) == "MOV A,M");
    REQUIRE(disasm(cpu, 0xD) == "IN 01h");
}

TEST_CASE("Disassembly past the end of memory", "[disasm]") {
    i8080 cpu;
    load_program(cpu, { 0x00, 0xCD, 0x00 }, 0);

    int len = 0;
    REQUIRE(disasm(cpu, 0x1, &len) == "CALL ??");
    REQUIRE(len == 3);
    REQUIRE(disasm(cpu, 0x3, &len) == "??");
    REQUIRE(len == 1);
}

TEST_CASE("Opcode names", "[disasm]") {
    REQUIRE(std::string(i8080_opcode_name(0xCF)) == "RST 1");
    REQUIRE(std::string(i8080_opcode_name(0xD7)) == "RST 2");
    REQUIRE(std::string(i8080_opcode_name(0x76)) == "HLT");
    REQUIRE(std::string(i8080_opcode_name(0x08)) == "DB");
}
