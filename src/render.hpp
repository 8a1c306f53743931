
#ifndef RENDER_HPP
#define RENDER_HPP

#include <array>
#include <cstdint>

#include "i8080/i8080.hpp"

#define RES_NATIVE_X 224
#define RES_NATIVE_Y 256

// Monochrome screen as seen by the player, 1 = lit.
struct framebuffer
{
    uint8_t at(unsigned x, unsigned y) const {
        return pixels[y * RES_NATIVE_X + x];
    }

    std::array<uint8_t, RES_NATIVE_X * RES_NATIVE_Y> pixels;
};

// Unpack video RAM into fb.
// Returns -1 if memory does not cover video RAM.
int render_vram(const i8080& cpu, framebuffer& fb);

#endif
