#include "tl/delay.h"

#include <chrono>
#include <thread>

namespace tl {

#ifdef TREELIGHTS_TESTING
namespace {
delay_handler_t &get_delay_handler() {
    static delay_handler_t handler;
    return handler;
}
} // namespace

void inject_delay_handler(const delay_handler_t &handler) {
    get_delay_handler() = handler;
}

void clear_delay_handler() { get_delay_handler() = delay_handler_t(); }
#endif

void delay(tl::u32 ms) {
#ifdef TREELIGHTS_TESTING
    if (get_delay_handler()) {
        get_delay_handler()(ms);
        return;
    }
#endif
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace tl
