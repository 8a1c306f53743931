#include "render.hpp"
#include "machine.hpp"

int render_vram(const i8080& cpu, framebuffer& fb)
{
    if (cpu.memsize < VRAM_START_ADDR + VRAM_SIZE) {
        logERROR("Video RAM %04Xh-%04Xh is outside memory (%zu bytes)",
            VRAM_START_ADDR, VRAM_START_ADDR + VRAM_SIZE - 1, cpu.memsize);
        return -1;
    }

    uint VRAM_idx = 0;
    const i8080_word_t* VRAM_start = &cpu.mem[VRAM_START_ADDR];

    // The monitor is rotated: each byte is 8 vertical pixels,
    // LSB lowest, and each column is scanned from the bottom.
    // Unpack and rotate counter-clockwise.
    for (uint x = 0; x < RES_NATIVE_X; ++x)
    {
        for (uint y = 0; y < RES_NATIVE_Y; y += 8)
        {
            i8080_word_t word = VRAM_start[VRAM_idx++];

            for (int bit = 0; bit < 8; ++bit) {
                uint idx = RES_NATIVE_X * (RES_NATIVE_Y - y - bit - 1) + x;
                fb.pixels[idx] = get_bit(word, bit);
            }
        }
    }
    return 0;
}
