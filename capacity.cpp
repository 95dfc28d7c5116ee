#include "capacity.hpp"
#include "wavelet.hpp"

namespace dwtstego {

    size_t capacityBits(const CoefficientSelector& selector)
    {
        return selector.count();
    }

    size_t capacityBytes(const CoefficientSelector& selector)
    {
        return selector.count() / 8;
    }

    size_t maxPayloadBytes(const CoefficientSelector& selector)
    {
        const size_t bits = capacityBits(selector);
        if (bits < HEADER_BITS) return 0;
        return (bits - HEADER_BITS) / 8;
    }

    bool fits(const CoefficientSelector& selector, size_t payloadBytes)
    {
        return payloadBytes <= maxPayloadBytes(selector);
    }

    size_t maxPayloadBytes(cv::Size imageSize, const StegoProtocol& protocol, int levels)
    {
        protocol.validate();
        BandSet shapes = HaarWavelet::layout(imageSize, levels);
        CoefficientSelector selector(shapes, protocol.bandOrder, protocol.rowSkip, protocol.colSkip);

        size_t bytes = maxPayloadBytes(selector);
        if (bytes > protocol.maxPayloadBytes) {
            bytes = protocol.maxPayloadBytes;
        }
        return bytes;
    }

}
