#include "payload_frame.hpp"
#include "protocol.hpp"
#include "stego_errors.hpp"

#include <limits>
#include <string>

namespace dwtstego {

    std::vector<uint8_t> frame(const std::vector<uint8_t>& payload)
    {
        if (payload.size() > std::numeric_limits<uint32_t>::max()) {
            throw FrameError("payload of " + std::to_string(payload.size())
                             + " bytes does not fit a 32-bit length header");
        }
        const uint32_t len = static_cast<uint32_t>(payload.size());

        std::vector<uint8_t> out;
        out.reserve(4 + payload.size());
        out.push_back(static_cast<uint8_t>(len >> 24));
        out.push_back(static_cast<uint8_t>(len >> 16));
        out.push_back(static_cast<uint8_t>(len >> 8));
        out.push_back(static_cast<uint8_t>(len));
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }

    Unframed unframe(const std::vector<uint8_t>& bits)
    {
        Unframed out;
        out.length = decodeLength(bits);

        const size_t needed = HEADER_BITS + static_cast<size_t>(out.length) * 8;
        if (bits.size() < needed) {
            throw FrameError("frame declares " + std::to_string(out.length)
                             + " bytes but only " + std::to_string(bits.size() - HEADER_BITS)
                             + " payload bits follow");
        }

        std::vector<uint8_t> body(bits.begin() + HEADER_BITS, bits.begin() + needed);
        out.payload = bitsToBytes(body);
        return out;
    }

    std::vector<uint8_t> bytesToBits(const std::vector<uint8_t>& bytes)
    {
        std::vector<uint8_t> bits;
        bits.reserve(bytes.size() * 8);
        for (uint8_t byte : bytes) {
            for (int i = 7; i >= 0; --i) {
                bits.push_back((byte >> i) & 1);
            }
        }
        return bits;
    }

    std::vector<uint8_t> bitsToBytes(const std::vector<uint8_t>& bits)
    {
        if (bits.size() % 8 != 0) {
            throw FrameError("bit stream of " + std::to_string(bits.size())
                             + " bits is not byte aligned");
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(bits.size() / 8);
        for (size_t i = 0; i < bits.size(); i += 8) {
            uint8_t cur = 0;
            for (size_t j = 0; j < 8; ++j) {
                cur = static_cast<uint8_t>((cur << 1) | (bits[i + j] & 1));
            }
            bytes.push_back(cur);
        }
        return bytes;
    }

    std::vector<uint8_t> encodeLength(uint32_t length)
    {
        std::vector<uint8_t> bits;
        bits.reserve(HEADER_BITS);
        for (int i = 31; i >= 0; --i) {
            bits.push_back((length >> i) & 1);
        }
        return bits;
    }

    uint32_t decodeLength(const std::vector<uint8_t>& bits)
    {
        if (bits.size() < HEADER_BITS) {
            throw FrameError("not enough bits for the length header");
        }

        uint32_t length = 0;
        for (size_t i = 0; i < HEADER_BITS; ++i) {
            length = (length << 1) | (bits[i] & 1u);
        }
        return length;
    }

}
