#include <catch2/catch_test_macros.hpp>

#include <utility>
#include <vector>

#include "devices.hpp"
#include "i8080/i8080_opcodes.hpp"

TEST_CASE("Shift register", "[devices][shift]") {
    shift_register sr;

    SECTION("Full byte at offset 0") {
        sr.set_offset(0x07);
        sr.shift(0xFF);
        REQUIRE(sr.read() == 0x80);
    }

    SECTION("Reads the 16-bit window shifted left by the offset") {
        sr.shift(0xAB);
        sr.shift(0xCD);
        const unsigned value = 0xCDAB;
        for (unsigned n = 0; n < 8; ++n) {
            sr.set_offset(i8080_word_t(n));
            REQUIRE(sr.read() == (((value << n) >> 8) & 0xFF));
        }
    }

    SECTION("Only the low 3 bits of the offset are used") {
        sr.shift(0x00);
        sr.shift(0x81);
        sr.set_offset(0xF9);
        i8080_word_t hi = sr.read();
        sr.set_offset(0x01);
        REQUIRE(sr.read() == hi);
    }

    SECTION("Oldest byte falls out after two shifts") {
        sr.shift(0xFF);
        sr.shift(0x00);
        sr.shift(0x00);
        sr.set_offset(0x07);
        REQUIRE(sr.read() == 0x00);
    }
}

TEST_CASE("Controller", "[devices][input]") {
    controller ctrl;
    REQUIRE(ctrl.p1 == controller::P1_IDLE);
    REQUIRE(ctrl.p2 == controller::P2_IDLE);

    SECTION("Player 1 and cabinet buttons") {
        ctrl.press(INPUT_CREDIT);
        REQUIRE(ctrl.p1 == 0x09);
        ctrl.press(INPUT_2P_START);
        ctrl.press(INPUT_1P_START);
        REQUIRE(ctrl.p1 == 0x0F);
        ctrl.press(INPUT_P1_FIRE);
        ctrl.press(INPUT_P1_LEFT);
        ctrl.press(INPUT_P1_RIGHT);
        REQUIRE(ctrl.p1 == 0x7F);
        REQUIRE(ctrl.p2 == 0x00);
    }

    SECTION("Player 2 buttons") {
        ctrl.press(INPUT_P2_FIRE);
        REQUIRE(ctrl.p2 == 0x10);
        ctrl.press(INPUT_P2_LEFT);
        ctrl.press(INPUT_P2_RIGHT);
        REQUIRE(ctrl.p2 == 0x70);
        REQUIRE(ctrl.p1 == controller::P1_IDLE);
    }

    SECTION("Reset releases everything") {
        ctrl.press(INPUT_P1_FIRE);
        ctrl.press(INPUT_P2_FIRE);
        ctrl.reset();
        REQUIRE(ctrl.p1 == controller::P1_IDLE);
        REQUIRE(ctrl.p2 == controller::P2_IDLE);
    }
}

TEST_CASE("Display timer", "[devices][display]") {
    display_timer display;
    REQUIRE(display.threshold == 16666);

    uint64_t cycles = 16665;
    REQUIRE_FALSE(display.poll(cycles));
    REQUIRE(cycles == 16665);

    SECTION("Raises once per crossing, alternating vectors") {
        cycles = 16666;
        REQUIRE(display.poll(cycles));
        REQUIRE(display.vector == i8080_RST_1);
        REQUIRE(cycles == 0);
        REQUIRE_FALSE(display.poll(cycles));
        REQUIRE(display.nframes == 0);

        cycles = 20000;
        REQUIRE(display.poll(cycles));
        REQUIRE(display.vector == i8080_RST_2);
        REQUIRE(display.nframes == 1);
        REQUIRE(display.nraised == 2);

        cycles = 16666;
        REQUIRE(display.poll(cycles));
        REQUIRE(display.vector == i8080_RST_1);
    }

    SECTION("Threshold from clock and refresh rate") {
        display_timer fast(1000, 10);
        REQUIRE(fast.threshold == 50);
    }
}

TEST_CASE("Sound latch reports pin changes", "[devices][sound]") {
    sound_latch sound;
    std::vector<std::pair<int, bool>> events;
    sound.on_change = [&events](int idx, bool on) { events.emplace_back(idx, on); };

    SECTION("Port 3 drives sounds 0-3 and 9") {
        sound.write_port3(0x11);
        REQUIRE(events.size() == 2);
        REQUIRE(events[0] == std::make_pair(0, true));
        REQUIRE(events[1] == std::make_pair(9, true));
        REQUIRE(sound.pins[0]);
        REQUIRE(sound.pins[9]);
    }

    SECTION("Port 5 drives sounds 4-8") {
        sound.write_port5(0x1F);
        REQUIRE(events.size() == 5);
        REQUIRE(events.front() == std::make_pair(4, true));
        REQUIRE(events.back() == std::make_pair(8, true));
    }

    SECTION("Unchanged pins are not reported") {
        sound.write_port3(0x02);
        sound.write_port3(0x02);
        REQUIRE(events.size() == 1);

        sound.write_port3(0x00);
        REQUIRE(events.size() == 2);
        REQUIRE(events[1] == std::make_pair(1, false));
    }

    SECTION("Works without a listener") {
        sound.on_change = nullptr;
        sound.write_port5(0x01);
        REQUIRE(sound.pins[4]);
    }
}
