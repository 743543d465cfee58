#pragma once

#include <string>

#include "tl/config.h"

namespace tl {

enum ArgsResult {
    ARGS_OK = 0,
    ARGS_HELP,   ///< -h/--help was given
    ARGS_ERROR,  ///< unknown option or malformed value
};

/// Fill @p config from the command line:
///   -a/--action N   show only pattern N
///   -w/--wait N     seconds per scene
///   -c/--clear      clear the strip on exit
///   -f/--fps        print frames per second
///   -v              print scene names
///   -n/--leds N     number of pixels
/// Values may be given as "-w 5", "-w5" or "--wait=5". @p config is not
/// sanitized here.
ArgsResult parseShowArgs(int argc, const char *const *argv, ShowConfig *config,
                         std::string *error);

const char *showUsage();

} // namespace tl
