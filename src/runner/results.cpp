#include <yardstick/runner/results.h>

namespace yardstick::runner {

bool CaseResult::hasMetricError() const {
    if (!metrics)
        return false;
    for (const auto& [name, outcome] : *metrics) {
        if (!outcome.ok())
            return true;
    }
    return false;
}

} // namespace yardstick::runner
