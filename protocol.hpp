#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include "step_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dwtstego {

    // Wire constants. Embedder and extractor must agree on every one of them.
    constexpr size_t   HEADER_BITS       = 32;
    constexpr double   HEADER_STEP       = 4.0;      // Q0, length header only
    constexpr int      BORDER_SKIP       = 16;       // rows and cols skipped per band
    constexpr int      DWT_LEVELS        = 2;
    constexpr uint32_t MAX_PAYLOAD_BYTES = 16u * 1024u * 1024u;

    // HH1, HL1, LH1, HH2, HL2, LH2
    std::vector<std::string> defaultBandOrder();

    struct StegoProtocol {
        std::vector<std::string> bandOrder;
        int rowSkip = BORDER_SKIP;
        int colSkip = BORDER_SKIP;
        double headerStep = HEADER_STEP;
        uint32_t maxPayloadBytes = MAX_PAYLOAD_BYTES;
        AdaptiveStepPolicy stepPolicy;

        static StegoProtocol defaults();

        // throws ConfigurationError
        void validate() const;
    };

}

#endif
