#pragma once

#include "tl/io.h"
#include "tl/strstream.h"

namespace tl {
// "build/src/tl/fx/scene.cpp" -> "src/tl/fx/scene.cpp"
// "blah/blah/blah.h" -> "blah.h"
inline const char *treelights_file_offset(const char *file) {
    const char *p = file;
    const char *last_slash = nullptr;

    while (*p) {
        if (p[0] == 's' && p[1] == 'r' && p[2] == 'c' && p[3] == '/') {
            return p;
        }
        if (*p == '/') {
            last_slash = p;
        }
        p++;
    }
    if (last_slash) {
        return last_slash + 1;
    }
    return file;
}
} // namespace tl

// Debug lines are compiled in for the test build, or on request with
// -DTREELIGHTS_FORCE_DBG.
#if defined(TREELIGHTS_TESTING) && !defined(TREELIGHTS_FORCE_DBG)
#define TREELIGHTS_FORCE_DBG 1
#endif

#ifndef TREELIGHTS_FORCE_DBG
#define _TREELIGHTS_DBG(X)                                                     \
    do {                                                                       \
        if (false) {                                                           \
            tl::println((tl::StrStream() << X).c_str());                       \
        }                                                                      \
    } while (0)
#else
#define _TREELIGHTS_DBG(X)                                                     \
    tl::println((tl::StrStream() << (tl::treelights_file_offset(__FILE__))     \
                                 << "(" << int(__LINE__) << "): " << X)        \
                    .c_str())
#endif

#define TL_DBG(X) _TREELIGHTS_DBG(X)
