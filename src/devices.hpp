//
// Devices on the Space Invaders I/O bus.
// See https://computerarcheology.com/Arcade/SpaceInvaders/Hardware.html
//

#ifndef DEVICES_HPP
#define DEVICES_HPP

#include <bitset>
#include <cstdint>
#include <functional>

#include "i8080/i8080.hpp"

#define CPU_CLOCK_HZ 2000000
#define REFRESH_HZ 60

#define NUM_SOUNDS 10

enum input : uint8_t
{
    INPUT_P1_LEFT,
    INPUT_P1_RIGHT,
    INPUT_P1_FIRE,

    INPUT_P2_LEFT,
    INPUT_P2_RIGHT,
    INPUT_P2_FIRE,

    INPUT_1P_START,
    INPUT_2P_START,
    INPUT_CREDIT,

    NUM_INPUTS
};

// External shift register (MB14241).
// reg holds the hardware register shifted right by one,
// so the read offset is applied from the LSB.
struct shift_register
{
    shift_register() :
        reg(0), offset(0)
    {}

    // OUT 4
    void shift(i8080_word_t word);
    // OUT 2, offset is stored inverted
    void set_offset(i8080_word_t word);
    // IN 3
    i8080_word_t read() const;

    i8080_dword_t reg;
    i8080_word_t offset;
};

// Player inputs on IN 1 (p1) and IN 2 (p2).
struct controller
{
    static constexpr i8080_word_t P1_IDLE = 0x08; // bit 3 is always set
    static constexpr i8080_word_t P2_IDLE = 0x00;

    controller() { reset(); }

    void reset();
    // Set the bit of inp until the next reset().
    void press(input inp);

    i8080_word_t p1;
    i8080_word_t p2;
};

// Raises the video interrupts. The CRT is refreshed at 60Hz,
// with RST 1 near the middle of the screen and RST 2 at the
// start of VBLANK.
struct display_timer
{
    display_timer(uint64_t clock_hz = CPU_CLOCK_HZ, unsigned refresh_hz = REFRESH_HZ);

    // If cycles has reached the threshold, raise the next
    // vector and reset cycles to 0.
    // Returns true if an interrupt was raised.
    bool poll(uint64_t& cycles);

    uint64_t threshold;  // cycles per half frame
    i8080_word_t vector; // last raised
    bool mid_frame;      // next vector is RST 1
    uint64_t nraised;
    uint64_t nframes;
};

// Sound pins on OUT 3 and OUT 5.
struct sound_latch
{
    // Called for every pin that changes state.
    using listener = std::function<void(int sound, bool on)>;

    void write_port3(i8080_word_t word);
    void write_port5(i8080_word_t word);

    std::bitset<NUM_SOUNDS> pins;
    listener on_change;

private:
    void set_pin(int idx, bool on);
};

#endif
