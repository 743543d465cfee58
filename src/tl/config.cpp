#include "tl/config.h"

#include "tl/fx/pattern_factory.h"
#include "tl/warn.h"

namespace tl {

const int ShowConfig::kNoFixedPattern;
const int ShowConfig::kMaxWaitSeconds;

bool ShowConfig::sanitize() {
    bool clean = true;
    if (waitSeconds < 0) {
        TL_WARN("wait of " << waitSeconds << "s clamped to 0");
        waitSeconds = 0;
        clean = false;
    } else if (waitSeconds > kMaxWaitSeconds) {
        TL_WARN("wait of " << waitSeconds << "s clamped to "
                           << kMaxWaitSeconds << "s");
        waitSeconds = kMaxWaitSeconds;
        clean = false;
    }
    if (hasFixedPattern() && !isPatternIndex(fixedPattern)) {
        TL_WARN("pattern index " << fixedPattern
                                 << " out of range, picking scenes at random");
        fixedPattern = kNoFixedPattern;
        clean = false;
    }
    return clean;
}

} // namespace tl
