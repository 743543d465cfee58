#include "tl/io.h"

#include <stddef.h>
#include <unistd.h>

namespace tl {

namespace {

void print_native(const char *str, bool flush) {
    size_t len = 0;
    const char *p = str;
    while (*p++) {
        len++;
    }
    // Best effort: nothing useful can be done if stderr is gone.
    ssize_t written = ::write(2, str, len);
    (void)written;
    if (flush) {
        fsync(2);
    }
}

} // namespace

#ifdef TREELIGHTS_TESTING
// Lazy statics to avoid global constructors
static print_handler_t &get_print_handler() {
    static print_handler_t handler;
    return handler;
}

static println_handler_t &get_println_handler() {
    static println_handler_t handler;
    return handler;
}

void inject_print_handler(const print_handler_t &handler) {
    get_print_handler() = handler;
}

void inject_println_handler(const println_handler_t &handler) {
    get_println_handler() = handler;
}

void clear_io_handlers() {
    get_print_handler() = print_handler_t();
    get_println_handler() = println_handler_t();
}
#endif

void print(const char *str) {
    if (!str) {
        return;
    }
#ifdef TREELIGHTS_TESTING
    if (get_print_handler()) {
        get_print_handler()(str);
        return;
    }
#endif
    print_native(str, true);
}

void println(const char *str) {
    if (!str) {
        return;
    }
#ifdef TREELIGHTS_TESTING
    if (get_println_handler()) {
        get_println_handler()(str);
        return;
    }
#endif
    print_native(str, false);
    print_native("\n", true);
}

} // namespace tl
