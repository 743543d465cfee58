#pragma once

/// @file time.h
/// @brief Millisecond clock for the animation loop.
///
/// @code
/// tl::u32 start = tl::time();
/// render_frame();
/// tl::u32 elapsed = tl::time() - start;
/// @endcode
///
/// Testing builds can replace the clock:
/// @code
/// tl::MockTimeProvider mock(1000);
/// tl::inject_time_provider([&mock]() { return mock(); });
/// CHECK(tl::time() == 1000);
/// mock.advance(40);
/// CHECK(tl::time() == 1040);
/// tl::clear_time_provider();
/// @endcode

#include "tl/int.h"

#ifdef TREELIGHTS_TESTING
#include <functional>
#endif

namespace tl {

/// Milliseconds since the first call into the clock.
/// @note Wraps around approximately every 49.7 days (2^32 milliseconds)
tl::u32 time();

#ifdef TREELIGHTS_TESTING

using time_provider_t = std::function<tl::u32()>;

/// Route tl::time() through @p provider until clear_time_provider().
void inject_time_provider(const time_provider_t &provider);

/// Restore the native clock.
void clear_time_provider();

/// Controllable time source for tests.
class MockTimeProvider {
  public:
    explicit MockTimeProvider(tl::u32 initial_time = 0);

    void advance(tl::u32 milliseconds);
    void set_time(tl::u32 milliseconds);
    tl::u32 current_time() const;

    /// Function call operator for use with inject_time_provider()
    tl::u32 operator()() const;

  private:
    tl::u32 mCurrentTime;
};

#endif // TREELIGHTS_TESTING

} // namespace tl
