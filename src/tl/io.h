#pragma once

#ifdef TREELIGHTS_TESTING
#include <functional>
#endif

namespace tl {

// Low-level console output. Native builds write straight to stderr.

// Print a string without newline
void print(const char *str);

// Print a string with newline
void println(const char *str);

#ifdef TREELIGHTS_TESTING

using print_handler_t = std::function<void(const char *)>;
using println_handler_t = std::function<void(const char *)>;

// Inject function handlers for testing
void inject_print_handler(const print_handler_t &handler);
void inject_println_handler(const println_handler_t &handler);

// Clear all injected handlers (restores default behavior)
void clear_io_handlers();

#endif // TREELIGHTS_TESTING

} // namespace tl
