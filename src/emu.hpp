
#ifndef EMU_HPP
#define EMU_HPP

#include <array>
#include <bitset>

#include <SDL.h>
#include <SDL_mixer.h>

#include "machine.hpp"
#include "render.hpp"
#include "utils.hpp"

#define VOLUME_DEFAULT 50

#define INI_FILENAME "si8080.ini"

struct pix_fmt
{
    uint32_t fmt;
    uint bypp;
    uint bpp;
    std::array<uint32_t, 4> colors;

    pix_fmt(uint32_t fmt, std::array<uint32_t, 4> pal) :
        fmt(fmt),
        bypp(SDL_BYTESPERPIXEL(fmt)),
        bpp(SDL_BITSPERPIXEL(fmt)),
        colors(pal)
    {}
};

// SDL window, sound and keyboard around the machine.
struct emu
{
    emu(const fs::path& rom_path, int debug);
    ~emu();

    emu(const emu&) = delete;
    emu& operator=(const emu&) = delete;

    bool ok() const { return m_ok; }

    // Start running.
    // Returns <0 on error, otherwise 0 when window is closed.
    int run();

private:
    emu();

    static void log_dbginfo();

    int init_texture(SDL_Renderer* renderer);
    int init_graphics();
    int init_audio(const fs::path& audio_dir);
    int load_prefs(const fs::path& ini_path);

    int resize_window();

    // Returns false when the window is closed.
    bool process_events();
    void update_inputs();

    void set_volume(int volume);
    void handle_sound(int idx, bool pin_on);

    void render_screen();

private:
    machine m;
    framebuffer m_fb;

    SDL_Window* m_window;
    SDL_Renderer* m_renderer;

    const pix_fmt* m_pixfmt;
    SDL_Point m_dispsize;
    SDL_Rect m_viewportrect;
    SDL_Texture* m_viewporttex;

    bool m_audio_ok;
    std::array<Mix_Chunk*, NUM_SOUNDS> m_sounds;
    int m_volume;

    std::bitset<SDL_NUM_SCANCODES> m_keypressed;
    std::array<SDL_Scancode, NUM_INPUTS> m_input2key;

    bool m_ok;
};

#endif
