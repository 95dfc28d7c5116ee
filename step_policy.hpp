#ifndef STEP_POLICY_HPP
#define STEP_POLICY_HPP

#include <cstdint>
#include <utility>
#include <vector>

namespace dwtstego {

    struct StepEntry {
        uint32_t threshold;   // inclusive upper bound on payload bytes
        double step;
    };

    // Payload length -> quantization step. Small payloads get a fine step
    // (better PSNR), large ones a coarse step (fewer bit errors).
    // Lengths above the last threshold use the last step.
    class AdaptiveStepPolicy {
    public:
        // protocol table
        AdaptiveStepPolicy();

        // throws ConfigurationError unless thresholds strictly increase and
        // steps are positive, finite and non-decreasing
        explicit AdaptiveStepPolicy(std::vector<StepEntry> table);

        static AdaptiveStepPolicy protocolTable();

        double stepFor(uint32_t payloadBytes) const;

        const std::vector<StepEntry>& table() const { return table_; }

    private:
        std::vector<StepEntry> table_;
    };

}

#endif
