#pragma once

#include "tl/io.h"
#include "tl/strstream.h"
#include "tl/dbg.h"

// Warnings are always emitted, release builds included.
#ifndef TL_WARN
#define TL_WARN(X)                                                             \
    tl::println((tl::StrStream() << "WARNING: "                                \
                                 << (tl::treelights_file_offset(__FILE__))     \
                                 << "(" << int(__LINE__) << "): " << X)        \
                    .c_str())
#endif
