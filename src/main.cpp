#include <algorithm>
#include <cstdlib>
#include <exception>

#include <SDL_main.h>
#include <cxxopts.hpp>

#include "emu.hpp"

static int do_main(int argc, char* argv[])
{
    cxxopts::Options opts("si8080", "Intel 8080 arcade emulator (Space Invaders hardware).");
    opts.add_options()
        ("h,help", "Show this help message.")
        ("d,debug", "Debug output, repeat for more: trace, registers, "
            "instruction count, cycle count.")
        ("rom", "Path to the program image.", cxxopts::value<std::string>());

    opts.parse_positional({ "rom" });
    opts.positional_help("<rom>");

    auto args = opts.parse(argc, argv);

    if (args.count("help")) {
        std::printf("%s\n", opts.help().c_str());
        return 0;
    }
    if (!args.count("rom")) {
        logERROR("No program image given.\n%s", opts.help().c_str());
        return -1;
    }
    int debug = std::min(int(args.count("debug")), int(DEBUG_CYCLES));

    emu emu(args["rom"].as<std::string>(), debug);
    if (!emu.ok()) {
        return -1;
    }
    // Start!
    return emu.run();
}

int main(int argc, char* argv[])
{
    try {
        int err = log_init();
        if (err != 0) {
            return EXIT_FAILURE;
        }
        err = do_main(argc, argv);
        return err == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception& e) {
        logERROR("Exception: %s", e.what());
        return EXIT_FAILURE;
    }
}
