#ifndef CAPACITY_HPP
#define CAPACITY_HPP

#include "coefficient_selector.hpp"
#include "protocol.hpp"

#include <opencv2/core.hpp>

#include <cstddef>

namespace dwtstego {

    size_t capacityBits(const CoefficientSelector& selector);
    size_t capacityBytes(const CoefficientSelector& selector);

    // largest payload whose frame (header + bytes) still fits
    size_t maxPayloadBytes(const CoefficientSelector& selector);

    bool fits(const CoefficientSelector& selector, size_t payloadBytes);

    // geometry only; no pixels are transformed
    size_t maxPayloadBytes(cv::Size imageSize, const StegoProtocol& protocol,
                           int levels = DWT_LEVELS);

}

#endif
