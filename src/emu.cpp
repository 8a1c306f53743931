//
// SDL frontend: window, texture, audio, keyboard and frame pacing.
// The machine itself (CPU, I/O, interrupts) is in machine.cpp.
//

#include <algorithm>
#include <cmath>
#include <string_view>

#include "emu.hpp"

struct input_binding
{
    const char* ininame;
    SDL_Scancode dflt_key;
};

// Indexed by input
static const input_binding INPUT_BINDINGS[NUM_INPUTS] =
{
    { "InputP1Left",  SDL_SCANCODE_LEFT },
    { "InputP1Right", SDL_SCANCODE_RIGHT },
    { "InputP1Fire",  SDL_SCANCODE_SPACE },
    { "InputP2Left",  SDL_SCANCODE_A },
    { "InputP2Right", SDL_SCANCODE_D },
    { "InputP2Fire",  SDL_SCANCODE_W },
    { "Input1PStart", SDL_SCANCODE_1 },
    { "Input2PStart", SDL_SCANCODE_2 },
    { "InputCredit",  SDL_SCANCODE_RETURN },
};

static int get_disp_size(SDL_Window* window, SDL_Point& out_size)
{
    int disp_idx = SDL_GetWindowDisplayIndex(window);
    if (disp_idx < 0) {
        logERROR("SDL_GetWindowDisplayIndex(): %s", SDL_GetError());
        return -1;
    }
    SDL_Rect bounds;
    if (SDL_GetDisplayUsableBounds(disp_idx, &bounds) != 0) {
        logERROR("SDL_GetDisplayUsableBounds(): %s", SDL_GetError());
        return -1;
    }
    out_size = { .x = bounds.w, .y = bounds.h };
    return 0;
}

// Largest multiple of the native resolution that fits
static SDL_Point get_viewport_size(int maxX, int maxY)
{
    int max_factorX = maxX / RES_NATIVE_X;
    int max_factorY = maxY / RES_NATIVE_Y;
    int factor = std::max(1, std::min(max_factorX, max_factorY));
    return { .x = RES_NATIVE_X * factor, .y = RES_NATIVE_Y * factor };
}

int emu::resize_window()
{
    int e = get_disp_size(m_window, m_dispsize);
    if (e) { return e; }

    SDL_Point vp_size = get_viewport_size(m_dispsize.x, m_dispsize.y);
    m_viewportrect = { .x = 0, .y = 0, .w = vp_size.x, .h = vp_size.y };

    SDL_SetWindowSize(m_window, vp_size.x, vp_size.y);
    SDL_SetWindowPosition(m_window, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);

    logMESSAGE("Window size: x: %d, y: %d", vp_size.x, vp_size.y);
    return 0;
}

// like a palette, same order as PIXFMTS
enum colr_idx : uint8_t
{
    COLRIDX_BLACK,
    COLRIDX_GREEN,
    COLRIDX_RED,
    COLRIDX_WHITE,
};

static const std::array<pix_fmt, 3> PIXFMTS = {
                                     // black,      green,      red,        white
    pix_fmt(SDL_PIXELFORMAT_BGR565,   { 0x0000,     0x1FE3,     0x18FF,     0xFFFF,    }),
    pix_fmt(SDL_PIXELFORMAT_ARGB8888, { 0xFF000000, 0xFF1EFE1E, 0xFFFE1E1E, 0xFFFFFFFF }),
    pix_fmt(SDL_PIXELFORMAT_ABGR8888, { 0xFF000000, 0xFF1EFE1E, 0xFF1E1EFE, 0xFFFFFFFF }),
};

static const char* pixfmt_name(uint32_t fmt)
{
    std::string_view str(SDL_GetPixelFormatName(fmt));
    if (str.starts_with("SDL_PIXELFORMAT_")) {
        str.remove_prefix(sizeof("SDL_PIXELFORMAT_") - 1);
    }
    return str.data();
}

int emu::init_texture(SDL_Renderer* renderer)
{
    SDL_RendererInfo rendinfo;
    if (SDL_GetRendererInfo(renderer, &rendinfo) != 0) {
        logERROR("SDL_GetRendererInfo(): %s", SDL_GetError());
        return -1;
    }
    logMESSAGE("Render backend: %s", rendinfo.name);

    // first supported texture format
    for (auto& pixfmt : PIXFMTS) {
        for (uint32_t i = 0; i < rendinfo.num_texture_formats && !m_pixfmt; ++i)
        {
            if (rendinfo.texture_formats[i] == pixfmt.fmt) {
                logMESSAGE("Texture format: %s", pixfmt_name(pixfmt.fmt));
                m_pixfmt = &pixfmt;
            }
        }
    }
    if (!m_pixfmt)
    {
        std::string hasfmts;
        for (uint32_t i = 0; i < rendinfo.num_texture_formats; ++i) {
            if (!hasfmts.empty()) { hasfmts += ", "; }
            hasfmts += pixfmt_name(rendinfo.texture_formats[i]);
        }
        logERROR("Could not find a supported texture format.\n"
            "Available: %s", hasfmts.c_str());
        return -1;
    }

    m_viewporttex = SDL_CreateTexture(renderer, m_pixfmt->fmt,
        SDL_TEXTUREACCESS_STREAMING, RES_NATIVE_X, RES_NATIVE_Y);
    if (!m_viewporttex) {
        logERROR("SDL_CreateTexture(): %s", SDL_GetError());
        return -1;
    }
    return 0;
}

int emu::init_graphics()
{
    logMESSAGE("Initializing graphics");

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        logERROR("SDL_Init(): %s", SDL_GetError());
        return -1;
    }

    m_window = SDL_CreateWindow("Space Invaders", 0, 0, 0, 0, SDL_WINDOW_HIDDEN);
    if (!m_window) {
        logERROR("SDL_CreateWindow(): %s", SDL_GetError());
        return -1;
    }
    m_renderer = SDL_CreateRenderer(m_window, -1, 0);
    if (!m_renderer) {
        logERROR("SDL_CreateRenderer(): %s", SDL_GetError());
        return -1;
    }

    int e = init_texture(m_renderer);
    if (e) { return e; }

    return resize_window();
}

static const int MAX_MIX_VOLUMES[NUM_SOUNDS] =
{
    MIX_MAX_VOLUME / 3, // UFO fly
    MIX_MAX_VOLUME / 2, // Shoot
    MIX_MAX_VOLUME,
    MIX_MAX_VOLUME / 2, // Alien die
    MIX_MAX_VOLUME,
    MIX_MAX_VOLUME,
    MIX_MAX_VOLUME,
    MIX_MAX_VOLUME,
    MIX_MAX_VOLUME / 2, // UFO die
    MIX_MAX_VOLUME,
};

// Sounds are optional. The emulator runs silently
// if the audio device or the files are missing.
int emu::init_audio(const fs::path& audio_dir)
{
    logMESSAGE("Initializing audio");

    // chunksize is small to reduce latency
    if (Mix_OpenAudio(11025, AUDIO_U8, 1, 512) != 0) {
        logWARNING("Mix_OpenAudio(): %s", Mix_GetError());
        return 0;
    }
    if (Mix_AllocateChannels(NUM_SOUNDS) != NUM_SOUNDS) {
        logERROR("Mix_AllocateChannels(): %s", Mix_GetError());
        return -1;
    }
    m_audio_ok = true;

    static const char* AUDIO_FILENAMES[NUM_SOUNDS][2] =
    {
        {"0.wav", "ufo_highpitch.wav"},
        {"1.wav", "shoot.wav"},
        {"2.wav", "explosion.wav"},
        {"3.wav", "invaderkilled.wav"},
        {"4.wav", "fastinvader1.wav"},
        {"5.wav", "fastinvader2.wav"},
        {"6.wav", "fastinvader3.wav"},
        {"7.wav", "fastinvader4.wav"},
        {"8.wav", "ufo_lowpitch.wav"},
        {"9.wav", "extendedplay.wav"}
    };

    int num_loaded = 0;
    for (int i = 0; i < NUM_SOUNDS; ++i)
    {
        for (int j = 0; j < 2 && !m_sounds[i]; ++j) {
            fs::path path = audio_dir / AUDIO_FILENAMES[i][j];
            m_sounds[i] = Mix_LoadWAV(path.string().c_str());
        }
        if (m_sounds[i]) {
            num_loaded++;
        } else {
            logWARNING("Audio file %d (aka %s) is missing", i, AUDIO_FILENAMES[i][1]);
        }
    }
    logMESSAGE("Loaded %d/%d audio files", num_loaded, NUM_SOUNDS);

    set_volume(VOLUME_DEFAULT);

    m.bus.sound.on_change = [this](int idx, bool on) {
        handle_sound(idx, on);
    };
    return 0;
}

static bool snd_is_looping(int idx)
{
    return idx == 0 || idx == 9;
}

// looping: repeat sound while pin is on.
// non-looping: restart sound every positive edge (off->on)
void emu::handle_sound(int idx, bool pin_on)
{
    if (!m_sounds[idx]) {
        return;
    }
    if (pin_on) {
        int loops = snd_is_looping(idx) ? -1 : 0;
        Mix_PlayChannel(idx, m_sounds[idx], loops);
    }
    else if (snd_is_looping(idx)) {
        Mix_HaltChannel(idx);
    }
}

void emu::set_volume(int new_volume)
{
    if (!m_audio_ok || new_volume == m_volume) {
        return;
    }
    for (int i = 0; i < NUM_SOUNDS; ++i)
    {
        float scaled_vol = MAX_MIX_VOLUMES[i] * (float(new_volume) / 100);
        Mix_Volume(i, int(std::lroundf(scaled_vol)));
    }
    m_volume = new_volume;
}

// helpful for debugging
void emu::log_dbginfo()
{
    SDL_version version;
    SDL_GetVersion(&version);

    logMESSAGE("SDL2 version (header/DLL): %d.%d.%d/%d.%d.%d",
        SDL_MAJOR_VERSION, SDL_MINOR_VERSION, SDL_PATCHLEVEL,
        version.major, version.minor, version.patch);

    const SDL_version* mix_version = Mix_Linked_Version();

    logMESSAGE("SDL2_mixer version (header/DLL): %d.%d.%d/%d.%d.%d",
        SDL_MIXER_MAJOR_VERSION, SDL_MIXER_MINOR_VERSION, SDL_MIXER_PATCHLEVEL,
        mix_version->major, mix_version->minor, mix_version->patch);
}

// Settings from the ini file, which is optional.
int emu::load_prefs(const fs::path& ini_path)
{
    if (!fs::exists(ini_path)) {
        return 0;
    }
    inireader ini(ini_path);
    if (!ini.ok()) {
        return -1;
    }

    if (ini.has_key("Settings", "Volume")) {
        auto volume = ini.get_num<int>("Settings", "Volume");
        if (!volume || *volume < 0 || *volume > 100) {
            logERROR("%s: Invalid Volume", ini.path_cstr());
            return -1;
        }
        set_volume(*volume);
    }
    for (int i = 3; i < 8; ++i)
    {
        char sw_name[] = { 'D', 'I', 'P', char('0' + i), '\0' };
        if (!ini.has_key("Settings", sw_name)) {
            continue;
        }
        auto sw = ini.get_num<uint>("Settings", sw_name);
        if (!sw || *sw > 1u) {
            logERROR("%s: Invalid %s", ini.path_cstr(), sw_name);
            return -1;
        }
        m.bus.set_switch(i, bool(*sw));
    }
    for (int i = 0; i < NUM_INPUTS; ++i)
    {
        const char* ininame = INPUT_BINDINGS[i].ininame;
        auto keyname = ini.get_string("Settings", ininame);
        if (keyname)
        {
            SDL_Scancode key = SDL_GetScancodeFromName(keyname->c_str());
            if (key == SDL_SCANCODE_UNKNOWN) {
                logERROR("%s: Invalid %s", ini.path_cstr(), ininame);
                return -1;
            }
            m_input2key[i] = key;
        }
    }

    static const std::pair<const char*, unsigned> QUIRK_KEYS[] = {
        { "DcrModulo255", I8080_QUIRK_DCR_MOD255 },
        { "PairFlags",    I8080_QUIRK_PAIR_FLAGS },
    };
    for (auto& [name, quirk] : QUIRK_KEYS)
    {
        if (!ini.has_key("Cpu", name)) {
            continue;
        }
        auto value = ini.get_num<uint>("Cpu", name);
        if (!value || *value > 1u) {
            logERROR("%s: Invalid %s", ini.path_cstr(), name);
            return -1;
        }
        if (*value) {
            m.cpu.quirks |= quirk;
        } else {
            m.cpu.quirks &= ~quirk;
        }
    }

    logMESSAGE("Loaded settings from %s", ini.path_cstr());
    return 0;
}

emu::emu() :
    m_window(nullptr),
    m_renderer(nullptr),
    m_pixfmt(nullptr),
    m_dispsize({ .x = 0, .y = 0 }),
    m_viewportrect({ .x = 0, .y = 0, .w = 0, .h = 0 }),
    m_viewporttex(nullptr),
    m_audio_ok(false),
    m_volume(-1),
    m_ok(false)
{
    m_sounds.fill(nullptr);

    for (int i = 0; i < NUM_INPUTS; ++i) {
        m_input2key[i] = INPUT_BINDINGS[i].dflt_key;
    }
}

emu::emu(const fs::path& rom_path, int debug) :
    emu()
{
    log_dbginfo();

    if (m.load_rom(rom_path) != 0) {
        return;
    }
    m.debug = debug;

    if (init_graphics() != 0 ||
        init_audio(rom_path.parent_path()) != 0) {
        return;
    }

    char* prefdir = SDL_GetPrefPath("si8080", "v1");
    if (prefdir) {
        fs::path ini_path = fs::u8path(prefdir) / INI_FILENAME;
        SDL_free(prefdir);
        if (load_prefs(ini_path) != 0) {
            return;
        }
    } else {
        logWARNING("SDL_GetPrefPath(): %s", SDL_GetError());
    }

    m_ok = true;
}

emu::~emu()
{
    m.bus.sound.on_change = nullptr;

    for (Mix_Chunk* chunk : m_sounds) {
        Mix_FreeChunk(chunk);
    }
    if (m_audio_ok) {
        Mix_CloseAudio();
    }
    SDL_DestroyTexture(m_viewporttex);
    SDL_DestroyRenderer(m_renderer);
    SDL_DestroyWindow(m_window);
    SDL_Quit();
}

// Controller bits are held only while the key is down.
void emu::update_inputs()
{
    m.bus.ctrl.reset();
    for (int i = 0; i < NUM_INPUTS; ++i) {
        if (m_keypressed[m_input2key[i]]) {
            m.bus.ctrl.press(input(i));
        }
    }
}

// Pixel color after gel overlay
// https://tcrf.net/images/a/af/SpaceInvadersArcColorUseTV.png
static colr_idx pixel_color(uint x, uint y)
{
    uint yb = RES_NATIVE_Y - 1 - y; // from the bottom
    if ((yb <= 15 && x > 24 && x < 136) || (yb > 15 && yb < 71)) {
        return COLRIDX_GREEN;
    }
    else if (yb >= 192 && yb < 223) {
        return COLRIDX_RED;
    }
    else { return COLRIDX_WHITE; }
}

void emu::render_screen()
{
    if (render_vram(m.cpu, m_fb) != 0) {
        return;
    }

    void* pixels; int pitch;
    if (SDL_LockTexture(m_viewporttex, NULL, &pixels, &pitch) != 0) {
        logERROR("SDL_LockTexture(): %s", SDL_GetError());
        return;
    }
    const uint texpitch = pitch / m_pixfmt->bypp; // not always eq to original width!

    for (uint y = 0; y < RES_NATIVE_Y; ++y)
    {
        for (uint x = 0; x < RES_NATIVE_X; ++x)
        {
            colr_idx colridx = m_fb.at(x, y) ? pixel_color(x, y) : COLRIDX_BLACK;
            uint32_t color = m_pixfmt->colors[colridx];

            uint idx = texpitch * y + x;
            switch (m_pixfmt->bpp)
            {
            case 16: static_cast<uint16_t*>(pixels)[idx] = uint16_t(color); break;
            case 32: static_cast<uint32_t*>(pixels)[idx] = color;           break;
            }
        }
    }
    SDL_UnlockTexture(m_viewporttex);
    SDL_RenderCopy(m_renderer, m_viewporttex, NULL, &m_viewportrect);
}

// Wait until one 60 Hz frame has passed since tframe_start.
// SDL_Delay() oversleeps by up to a few ms, so it is only used
// while far from the deadline, the rest is a busy wait.
static void vsync(clk::time_point tframe_start)
{
    static constexpr tim::microseconds tframe_target(US_PER_S / REFRESH_HZ);
    static constexpr tim::microseconds spin_margin(2 * US_PER_MS);

    const clk::time_point deadline = tframe_start + tframe_target;

    for (auto tnow = clk::now(); tnow < deadline; tnow = clk::now())
    {
        auto trem = deadline - tnow;
        if (trem > spin_margin) {
            auto tsleep = tim::floor<tim::milliseconds>(trem - spin_margin);
            SDL_Delay(uint32_t(std::max<tim::milliseconds::rep>(1, tsleep.count())));
        }
    }
}

bool emu::process_events()
{
    SDL_Event event;
    while (SDL_PollEvent(&event))
    {
        switch (event.type)
        {
        case SDL_KEYDOWN:
        case SDL_KEYUP:
            m_keypressed[event.key.keysym.scancode] = (event.type == SDL_KEYDOWN);
            break;

        case SDL_QUIT:
            logMESSAGE("Quitting...");
            return false;
        }
    }
    return true;
}

int emu::run()
{
    logMESSAGE("Starting emulator...");

    SDL_ShowWindow(m_window);

    clk::time_point t_start = clk::now();

    while (process_events())
    {
        if (SDL_GetWindowFlags(m_window) & SDL_WINDOW_MINIMIZED) {
            SDL_Delay(20);
            continue;
        }
        update_inputs();

        // Emulate CPU for 1 frame.
        if (m.emulate_frame() != 0) {
            return -1;
        }
        render_screen();
        SDL_RenderPresent(m_renderer);

        // Vsync at 60 fps.
        vsync(t_start);
        t_start = clk::now();
    }

    if (m.debug >= DEBUG_INSTRS) {
        logMESSAGE("Executed %llu instructions, %llu cycles",
            (unsigned long long)m.ninstrs, (unsigned long long)m.total_cycles);
    }
    return 0;
}
