#ifndef PAYLOAD_FRAME_HPP
#define PAYLOAD_FRAME_HPP

#include <cstdint>
#include <vector>

namespace dwtstego {

    // frame = [length: u32 big-endian][payload bytes], bits MSB first

    std::vector<uint8_t> frame(const std::vector<uint8_t>& payload);

    struct Unframed {
        uint32_t length = 0;
        std::vector<uint8_t> payload;
    };

    // bits: one 0/1 value per element. throws FrameError if the stream is
    // shorter than 32 + 8 * length
    Unframed unframe(const std::vector<uint8_t>& bits);

    std::vector<uint8_t> bytesToBits(const std::vector<uint8_t>& bytes);

    // throws FrameError unless bits.size() is a multiple of 8
    std::vector<uint8_t> bitsToBytes(const std::vector<uint8_t>& bits);

    std::vector<uint8_t> encodeLength(uint32_t length);

    // reads the first 32 bits; throws FrameError if there are fewer
    uint32_t decodeLength(const std::vector<uint8_t>& bits);

}

#endif
