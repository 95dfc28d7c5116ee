#ifndef DWT_STEGO_HPP
#define DWT_STEGO_HPP

#include "coefficient_bands.hpp"
#include "protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dwtstego {

    // Two-phase protocol over the selector's position stream:
    //   positions [0, 32)          payload length, big-endian, step Q0
    //   positions [32, 32 + 8*len) payload bytes, step = stepPolicy(len)
    // The extractor learns len from the header before it needs the step.

    enum class SessionPhase { Init, Header, Payload, Done, Failed };

    struct EmbedReport {
        uint32_t lengthBytes = 0;
        double headerStep = 0.0;
        double payloadStep = 0.0;
        size_t bitsWritten = 0;
        size_t capacityBits = 0;
    };

    struct ExtractReport {
        uint32_t lengthBytes = 0;
        double headerStep = 0.0;
        double payloadStep = 0.0;
        size_t capacityBits = 0;
    };

    // Works on its own deep copy of the bands; the caller's set is never
    // written. Single use, not thread-shared.
    class EmbeddingSession {
    public:
        EmbeddingSession(const BandSet& bands,
                         std::vector<uint8_t> payload,
                         StegoProtocol protocol = StegoProtocol::defaults());

        // Returns the modified bands, same shapes as the input.
        // throws ConfigurationError, CapacityExceeded (nothing written yet),
        // SessionError on a second call
        BandSet run();

        SessionPhase phase() const { return phase_; }
        const EmbedReport& report() const { return report_; }

    private:
        BandSet bands_;
        std::vector<uint8_t> payload_;
        StegoProtocol protocol_;
        SessionPhase phase_ = SessionPhase::Init;
        EmbedReport report_;
    };

    class ExtractionSession {
    public:
        ExtractionSession(BandSet bands,
                          StegoProtocol protocol = StegoProtocol::defaults());

        // throws ConfigurationError, CorruptHeader, FrameError, SessionError
        std::vector<uint8_t> run();

        SessionPhase phase() const { return phase_; }
        const ExtractReport& report() const { return report_; }

    private:
        BandSet bands_;     // read only
        StegoProtocol protocol_;
        SessionPhase phase_ = SessionPhase::Init;
        ExtractReport report_;
    };

    BandSet embedPayload(const BandSet& bands,
                         const std::vector<uint8_t>& payload,
                         const StegoProtocol& protocol = StegoProtocol::defaults(),
                         EmbedReport* report = nullptr);

    std::vector<uint8_t> extractPayload(const BandSet& bands,
                                        const StegoProtocol& protocol = StegoProtocol::defaults(),
                                        ExtractReport* report = nullptr);

    // Header phase only. Does not consult the step policy.
    uint32_t readLengthHeader(const BandSet& bands,
                              const StegoProtocol& protocol = StegoProtocol::defaults());

}

#endif
