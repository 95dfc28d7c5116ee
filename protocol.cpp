#include "protocol.hpp"
#include "stego_errors.hpp"

#include <cmath>

namespace dwtstego {

    std::vector<std::string> defaultBandOrder()
    {
        return {"HH1", "HL1", "LH1", "HH2", "HL2", "LH2"};
    }

    StegoProtocol StegoProtocol::defaults()
    {
        StegoProtocol p;
        p.bandOrder = defaultBandOrder();
        p.stepPolicy = AdaptiveStepPolicy::protocolTable();
        return p;
    }

    void StegoProtocol::validate() const
    {
        if (bandOrder.empty()) {
            throw ConfigurationError("protocol band order is empty");
        }
        if (rowSkip < 0 || colSkip < 0) {
            throw ConfigurationError("border margins must be non-negative");
        }
        if (!(headerStep > 0.0) || !std::isfinite(headerStep)) {
            throw ConfigurationError("header step must be a positive finite value");
        }
    }

}
