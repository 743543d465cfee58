#pragma once

#include "tl/int.h"

#ifdef TREELIGHTS_TESTING
#include <functional>
#endif

namespace tl {

/// Block the calling thread for @p ms milliseconds. This is the only place the
/// frame loop suspends.
void delay(tl::u32 ms);

#ifdef TREELIGHTS_TESTING

using delay_handler_t = std::function<void(tl::u32)>;

/// Replace the sleep with @p handler (fast tests advance a mock clock here).
void inject_delay_handler(const delay_handler_t &handler);
void clear_delay_handler();

#endif // TREELIGHTS_TESTING

} // namespace tl
