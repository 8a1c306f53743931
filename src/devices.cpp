#include "i8080/i8080_opcodes.hpp"
#include "devices.hpp"
#include "utils.hpp"

void shift_register::shift(i8080_word_t word)
{
    // new byte enters at the MSB
    reg = i8080_dword_t((reg >> 8) | (i8080_dword_t(word) << 7));
}

void shift_register::set_offset(i8080_word_t word)
{
    offset = (word ^ 0xFF) & 0x07;
}

i8080_word_t shift_register::read() const
{
    return i8080_word_t((reg >> offset) & 0xFF);
}

void controller::reset()
{
    p1 = P1_IDLE;
    p2 = P2_IDLE;
}

void controller::press(input inp)
{
    switch (inp)
    {
    case INPUT_CREDIT:   set_bit(&p1, 0, true); break;
    case INPUT_2P_START: set_bit(&p1, 1, true); break;
    case INPUT_1P_START: set_bit(&p1, 2, true); break;
    case INPUT_P1_FIRE:  set_bit(&p1, 4, true); break;
    case INPUT_P1_LEFT:  set_bit(&p1, 5, true); break;
    case INPUT_P1_RIGHT: set_bit(&p1, 6, true); break;
    case INPUT_P2_FIRE:  set_bit(&p2, 4, true); break;
    case INPUT_P2_LEFT:  set_bit(&p2, 5, true); break;
    case INPUT_P2_RIGHT: set_bit(&p2, 6, true); break;
    default: break;
    }
}

display_timer::display_timer(uint64_t clock_hz, unsigned refresh_hz) :
    // 16666 clk cycles at 2Mhz
    threshold(clock_hz / refresh_hz / 2),
    vector(0),
    mid_frame(true),
    nraised(0),
    nframes(0)
{}

bool display_timer::poll(uint64_t& cycles)
{
    if (cycles < threshold) {
        return false;
    }
    if (mid_frame) {
        vector = i8080_RST_1;
    } else {
        vector = i8080_RST_2;
        nframes++;
    }
    mid_frame = !mid_frame;
    nraised++;

    cycles = 0;
    return true;
}

void sound_latch::set_pin(int idx, bool on)
{
    if (pins[idx] == on) {
        return;
    }
    pins[idx] = on;
    if (on_change) {
        on_change(idx, on);
    }
}

void sound_latch::write_port3(i8080_word_t word)
{
    for (int i = 0; i < 4; ++i) {
        set_pin(i, get_bit(word, i));
    }
    set_pin(9, get_bit(word, 4));
}

void sound_latch::write_port5(i8080_word_t word)
{
    for (int i = 0; i < 5; ++i) {
        set_pin(i + 4, get_bit(word, i));
    }
}
