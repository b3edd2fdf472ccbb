#include "gapfiller.h"
#include "keyframetypes.h"
#include <algorithm>

GapFillResult GapFiller::fill(const std::vector<double>& candidates,
                              double maxTimeGap,
                              double fillInterval,
                              double minTimeGap)
{
    GapFillResult result;
    result.timestamps.reserve(candidates.size());
    result.synthetic.reserve(candidates.size());

    const bool enabled = maxTimeGap > 0.0 && fillInterval > 0.0;
    const double endMargin = std::max(minTimeGap, TIMESTAMP_EPSILON);

    for (size_t i = 0; i < candidates.size(); ++i) {
        const double a = candidates[i];
        result.timestamps.push_back(a);
        result.synthetic.push_back(false);

        if (!enabled || i + 1 >= candidates.size()) {
            continue;
        }

        const double b = candidates[i + 1];
        if (b - a <= maxTimeGap) {
            continue;
        }

        // k-th fill point of segment (a, b)
        for (int k = 1;; ++k) {
            double point = a + k * fillInterval;
            if (b - point < endMargin) {
                break;
            }
            result.timestamps.push_back(point);
            result.synthetic.push_back(true);
            result.insertedCount++;
        }
    }

    return result;
}
