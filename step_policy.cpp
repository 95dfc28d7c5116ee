#include "step_policy.hpp"
#include "stego_errors.hpp"

#include <cmath>
#include <limits>

namespace dwtstego {

    static void validateTable(const std::vector<StepEntry>& table)
    {
        if (table.empty()) {
            throw ConfigurationError("step table is empty");
        }
        for (size_t i = 0; i < table.size(); ++i) {
            const StepEntry& e = table[i];
            if (!(e.step > 0.0) || !std::isfinite(e.step)) {
                throw ConfigurationError("step table entry " + std::to_string(i)
                                         + " has a non-positive step");
            }
            if (i == 0) continue;

            const StepEntry& prev = table[i - 1];
            if (e.threshold <= prev.threshold) {
                throw ConfigurationError("step table thresholds must strictly increase");
            }
            if (e.step < prev.step) {
                throw ConfigurationError("step table steps must not decrease");
            }
        }
    }

    AdaptiveStepPolicy::AdaptiveStepPolicy()
        : table_{
              {2000, 4.0},
              {5000, 6.0},
              {std::numeric_limits<uint32_t>::max(), 7.0},
          }
    {
    }

    AdaptiveStepPolicy::AdaptiveStepPolicy(std::vector<StepEntry> table)
        : table_(std::move(table))
    {
        validateTable(table_);
    }

    AdaptiveStepPolicy AdaptiveStepPolicy::protocolTable()
    {
        return AdaptiveStepPolicy();
    }

    double AdaptiveStepPolicy::stepFor(uint32_t payloadBytes) const
    {
        for (const StepEntry& e : table_) {
            if (payloadBytes <= e.threshold) {
                return e.step;
            }
        }
        return table_.back().step;
    }

}
