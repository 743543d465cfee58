#pragma once

#ifndef TL_PI
#define TL_PI 3.1415926535897932384626433832795
#endif

#ifndef TL_TWO_PI
#define TL_TWO_PI (2.0 * TL_PI)
#endif
