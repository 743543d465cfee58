#include "tl/time.h"

#include <chrono>

namespace tl {

///////////////////// TESTING SUPPORT //////////////////////////////////////

#ifdef TREELIGHTS_TESTING

namespace {
time_provider_t &get_time_provider() {
    static time_provider_t provider;
    return provider;
}
} // namespace

void inject_time_provider(const time_provider_t &provider) {
    get_time_provider() = provider;
}

void clear_time_provider() { get_time_provider() = time_provider_t(); }

MockTimeProvider::MockTimeProvider(tl::u32 initial_time)
    : mCurrentTime(initial_time) {}

void MockTimeProvider::advance(tl::u32 milliseconds) {
    mCurrentTime += milliseconds;
}

void MockTimeProvider::set_time(tl::u32 milliseconds) {
    mCurrentTime = milliseconds;
}

tl::u32 MockTimeProvider::current_time() const { return mCurrentTime; }

tl::u32 MockTimeProvider::operator()() const { return mCurrentTime; }

#endif // TREELIGHTS_TESTING

///////////////////// PLATFORM IMPLEMENTATION //////////////////////////////

namespace {

std::chrono::steady_clock::time_point start_time() {
    static const std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    return start;
}

tl::u32 get_platform_time() {
    const auto elapsed = std::chrono::steady_clock::now() - start_time();
    return static_cast<tl::u32>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
            .count());
}

} // namespace

tl::u32 time() {
#ifdef TREELIGHTS_TESTING
    if (get_time_provider()) {
        return get_time_provider()();
    }
#endif
    return get_platform_time();
}

} // namespace tl
