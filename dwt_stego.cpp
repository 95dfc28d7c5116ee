#include "dwt_stego.hpp"
#include "capacity.hpp"
#include "coefficient_selector.hpp"
#include "payload_frame.hpp"
#include "qim.hpp"
#include "stego_errors.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <utility>

namespace dwtstego {

    static CoefficientSelector makeSelector(const BandSet& bands, const StegoProtocol& protocol)
    {
        protocol.validate();
        return CoefficientSelector(bands, protocol.bandOrder, protocol.rowSkip, protocol.colSkip);
    }

    // Mat headers indexed like the selector's bands; they share pixel data
    // with the band set, so writes land in the set.
    static std::vector<cv::Mat> bindGrids(const BandSet& bands, const CoefficientSelector& selector)
    {
        std::vector<cv::Mat> grids;
        grids.reserve(selector.bandShapes().size());
        for (const BandShape& shape : selector.bandShapes()) {
            const cv::Mat& m = bands.at(shape.name);
            if (m.type() != CV_64F) {
                throw ConfigurationError("band " + shape.name + " is not CV_64F");
            }
            grids.push_back(m);
        }
        return grids;
    }

    static void writeBits(std::vector<cv::Mat>& grids,
                          const CoefficientSelector& selector,
                          size_t first,
                          const std::vector<uint8_t>& bits,
                          double step)
    {
        for (size_t i = 0; i < bits.size(); ++i) {
            const CoefficientPosition pos = selector.at(first + i);
            double& c = grids[pos.band].at<double>(pos.row, pos.col);
            c = embedBit(c, bits[i], step);
        }
    }

    static std::vector<uint8_t> readBits(const std::vector<cv::Mat>& grids,
                                         const CoefficientSelector& selector,
                                         size_t first,
                                         size_t n,
                                         double step)
    {
        std::vector<uint8_t> bits(n, 0);
        for (size_t i = 0; i < n; ++i) {
            const CoefficientPosition pos = selector.at(first + i);
            bits[i] = extractBit(grids[pos.band].at<double>(pos.row, pos.col), step);
        }
        return bits;
    }

    static std::vector<uint8_t> readHeaderBits(const std::vector<cv::Mat>& grids,
                                               const CoefficientSelector& selector,
                                               const StegoProtocol& protocol)
    {
        if (selector.count() < HEADER_BITS) {
            throw FrameError("only " + std::to_string(selector.count())
                             + " positions available, the length header needs "
                             + std::to_string(HEADER_BITS));
        }
        return readBits(grids, selector, 0, HEADER_BITS, protocol.headerStep);
    }

    // ---------------------------------------------------------------- embed

    EmbeddingSession::EmbeddingSession(const BandSet& bands,
                                       std::vector<uint8_t> payload,
                                       StegoProtocol protocol)
        : bands_(bands.clone()),
          payload_(std::move(payload)),
          protocol_(std::move(protocol))
    {
    }

    BandSet EmbeddingSession::run()
    {
        if (phase_ != SessionPhase::Init) {
            throw SessionError("embedding session has already run");
        }
        phase_ = SessionPhase::Failed;

        // Init: every check happens before the first write
        CoefficientSelector selector = makeSelector(bands_, protocol_);
        std::vector<cv::Mat> grids = bindGrids(bands_, selector);

        const size_t available = capacityBits(selector);
        const size_t requested = HEADER_BITS + payload_.size() * 8;
        if (requested > available) {
            throw CapacityExceeded(requested, available);
        }
        if (payload_.size() > protocol_.maxPayloadBytes) {
            throw CapacityExceeded(requested,
                                   HEADER_BITS + static_cast<size_t>(protocol_.maxPayloadBytes) * 8);
        }

        const uint32_t length = static_cast<uint32_t>(payload_.size());
        report_.lengthBytes = length;
        report_.capacityBits = available;

        phase_ = SessionPhase::Header;
        report_.headerStep = protocol_.headerStep;
        writeBits(grids, selector, 0, encodeLength(length), protocol_.headerStep);

        // the header is complete before the payload step is chosen
        phase_ = SessionPhase::Payload;
        report_.payloadStep = protocol_.stepPolicy.stepFor(length);
        writeBits(grids, selector, HEADER_BITS, bytesToBits(payload_), report_.payloadStep);

        report_.bitsWritten = requested;
        phase_ = SessionPhase::Done;
        return std::move(bands_);
    }

    // -------------------------------------------------------------- extract

    ExtractionSession::ExtractionSession(BandSet bands, StegoProtocol protocol)
        : bands_(std::move(bands)),
          protocol_(std::move(protocol))
    {
    }

    std::vector<uint8_t> ExtractionSession::run()
    {
        if (phase_ != SessionPhase::Init) {
            throw SessionError("extraction session has already run");
        }
        phase_ = SessionPhase::Failed;

        CoefficientSelector selector = makeSelector(bands_, protocol_);
        const std::vector<cv::Mat> grids = bindGrids(bands_, selector);
        report_.capacityBits = capacityBits(selector);

        phase_ = SessionPhase::Header;
        report_.headerStep = protocol_.headerStep;
        std::vector<uint8_t> bits = readHeaderBits(grids, selector, protocol_);
        const uint32_t length = decodeLength(bits);
        if (length > protocol_.maxPayloadBytes) {
            throw CorruptHeader(length);
        }
        report_.lengthBytes = length;

        phase_ = SessionPhase::Payload;
        report_.payloadStep = protocol_.stepPolicy.stepFor(length);

        const size_t payloadBits = static_cast<size_t>(length) * 8;
        if (HEADER_BITS + payloadBits > selector.count()) {
            throw FrameError("header declares " + std::to_string(length)
                             + " bytes but the image holds only "
                             + std::to_string(maxPayloadBytes(selector)));
        }

        std::vector<uint8_t> body = readBits(grids, selector, HEADER_BITS, payloadBits, report_.payloadStep);
        bits.insert(bits.end(), body.begin(), body.end());

        Unframed framed = unframe(bits);
        phase_ = SessionPhase::Done;
        return std::move(framed.payload);
    }

    // ------------------------------------------------------------ one-shots

    BandSet embedPayload(const BandSet& bands,
                         const std::vector<uint8_t>& payload,
                         const StegoProtocol& protocol,
                         EmbedReport* report)
    {
        EmbeddingSession session(bands, payload, protocol);
        BandSet out = session.run();
        if (report) *report = session.report();
        return out;
    }

    std::vector<uint8_t> extractPayload(const BandSet& bands,
                                        const StegoProtocol& protocol,
                                        ExtractReport* report)
    {
        ExtractionSession session(bands, protocol);
        std::vector<uint8_t> payload = session.run();
        if (report) *report = session.report();
        return payload;
    }

    uint32_t readLengthHeader(const BandSet& bands, const StegoProtocol& protocol)
    {
        CoefficientSelector selector = makeSelector(bands, protocol);
        const std::vector<cv::Mat> grids = bindGrids(bands, selector);
        return decodeLength(readHeaderBits(grids, selector, protocol));
    }

}
