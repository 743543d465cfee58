#pragma once

/// @file TreeLights.h
/// TreeLights: procedurally generated, cross-fading light shows for
/// addressable LED strips.

#define TREELIGHTS_VERSION 10000
#define TREELIGHTS_VERSION_MAJOR 1
#define TREELIGHTS_VERSION_MINOR 0
#define TREELIGHTS_VERSION_PATCH 0

#include "tl/color.h"
#include "tl/config.h"
#include "tl/frame_pacer.h"
#include "tl/fx/1d/fade.h"
#include "tl/fx/1d/moving_dots.h"
#include "tl/fx/1d/rainbow.h"
#include "tl/fx/1d/sparkling.h"
#include "tl/fx/pattern.h"
#include "tl/fx/pattern_factory.h"
#include "tl/fx/scene.h"
#include "tl/int.h"
#include "tl/palette.h"
#include "tl/random.h"
#include "tl/show.h"
#include "tl/show_args.h"
#include "tl/strip.h"
#include "tl/stub_strip.h"
#include "tl/warn.h"
