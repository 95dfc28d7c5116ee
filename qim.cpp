#include "qim.hpp"

#include <cmath>

namespace dwtstego {

    // 2^53: past this, consecutive levels are no longer distinct doubles
    static const double MAX_EXACT_LEVEL = 9007199254740992.0;

    // level is integral; fmod of its magnitude keeps negative levels in {0, 1}
    static inline uint8_t parity(double level)
    {
        return std::fmod(std::fabs(level), 2.0) != 0.0 ? 1 : 0;
    }

    double embedBit(double coeff, uint8_t bit, double step)
    {
        double level = std::round(coeff / step);
        if (!(std::fabs(level) < MAX_EXACT_LEVEL)) {
            // parity cannot be represented; leave the coefficient as it is
            return coeff;
        }
        if (parity(level) != (bit & 1u)) {
            level += 1.0;
        }
        return level * step;
    }

    uint8_t extractBit(double coeff, double step)
    {
        const double level = std::round(coeff / step);
        if (!(std::fabs(level) < MAX_EXACT_LEVEL)) {
            return 0;
        }
        return parity(level);
    }

}
