#include "tl/show_args.h"

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>

namespace tl {

namespace {

bool parseInt(const char *text, int *out) {
    if (!text || !*text) {
        return false;
    }
    char *end = nullptr;
    errno = 0;
    long value = strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    *out = int(value);
    return true;
}

// Matches "-s", "-sVALUE", "--long" and "--long=VALUE". On a match *inline
// points at the attached value or is null.
bool matches(const char *arg, const char *shortName, const char *longName,
             const char **inlineValue) {
    *inlineValue = nullptr;
    const size_t shortLen = strlen(shortName);
    if (strncmp(arg, shortName, shortLen) == 0) {
        if (arg[shortLen] == '\0') {
            return true;
        }
        *inlineValue = arg + shortLen;
        return true;
    }
    if (!longName) {
        return false;
    }
    const size_t longLen = strlen(longName);
    if (strncmp(arg, longName, longLen) == 0) {
        if (arg[longLen] == '\0') {
            return true;
        }
        if (arg[longLen] == '=') {
            *inlineValue = arg + longLen + 1;
            return true;
        }
    }
    return false;
}

} // namespace

const char *showUsage() {
    return "usage: TreeShow [-h] [-a ACTION] [-w WAIT] [-c] [-f] [-v] "
           "[-n LEDS]\n"
           "  -a, --action N  selected pattern (0-6)\n"
           "  -w, --wait N    seconds per scene (default 20)\n"
           "  -c, --clear     clear the display on exit\n"
           "  -f, --fps       display FPS\n"
           "  -v              verbose\n"
           "  -n, --leds N    number of pixels (default 100)";
}

ArgsResult parseShowArgs(int argc, const char *const *argv, ShowConfig *config,
                         std::string *error) {
    for (int i = 1; i < argc; ++i) {
        const char *arg = argv[i];
        const char *value = nullptr;
        int *intTarget = nullptr;
        int leds = 0;
        const char *option = arg;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            return ARGS_HELP;
        } else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--clear") == 0) {
            config->clearOnExit = true;
            continue;
        } else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--fps") == 0) {
            config->reportFps = true;
            continue;
        } else if (strcmp(arg, "-v") == 0) {
            config->verbose = true;
            continue;
        } else if (matches(arg, "-a", "--action", &value)) {
            intTarget = &config->fixedPattern;
        } else if (matches(arg, "-w", "--wait", &value)) {
            intTarget = &config->waitSeconds;
        } else if (matches(arg, "-n", "--leds", &value)) {
            intTarget = &leds;
        } else {
            *error = std::string("unrecognized argument: ") + arg;
            return ARGS_ERROR;
        }

        if (!value) {
            if (i + 1 >= argc) {
                *error = std::string(option) + ": expected one argument";
                return ARGS_ERROR;
            }
            value = argv[++i];
        }
        if (!parseInt(value, intTarget)) {
            *error = std::string(option) + ": invalid int value: '" + value +
                     "'";
            return ARGS_ERROR;
        }
        if (intTarget == &leds) {
            if (leds <= 0 || leds > 0xFFFF) {
                *error = std::string(option) + ": pixel count out of range";
                return ARGS_ERROR;
            }
            config->numLeds = u16(leds);
        }
    }
    return ARGS_OK;
}

} // namespace tl
