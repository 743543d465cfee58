/// @file    TreeShow.cpp
/// @brief   Runs the light show until Ctrl-C.
/// @example TreeShow.cpp
///
/// No hardware driver ships with TreeLights, so frames go to the in-memory
/// StubStrip. A hardware driver implements tl::StripDriver and replaces
/// `strip` below.

#include <signal.h>

#include <string>

#include "TreeLights.h"
#include "tl/io.h"

namespace {

tl::LightShow *gShow = nullptr;

void handle_interrupt(int sig) {
    (void)sig;
    if (gShow) {
        gShow->stop();
    }
}

} // namespace

int main(int argc, char **argv) {
    tl::ShowConfig config;
    std::string error;
    switch (tl::parseShowArgs(argc, argv, &config, &error)) {
    case tl::ARGS_OK:
        break;
    case tl::ARGS_HELP:
        tl::println(tl::showUsage());
        return 0;
    case tl::ARGS_ERROR:
        tl::println(tl::showUsage());
        tl::println(("TreeShow: error: " + error).c_str());
        return 2;
    }

    tl::println("Press Ctrl-C to quit.");

    tl::StubStrip strip;
    tl::Random rng(tl::entropySeed());
    tl::LightShow show(strip, rng, config);
    if (!show.begin()) {
        return 1;
    }

    gShow = &show;
    signal(SIGINT, handle_interrupt);
    signal(SIGTERM, handle_interrupt);

    show.run();

    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    gShow = nullptr;
    return 0;
}
