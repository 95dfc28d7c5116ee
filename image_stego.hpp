#ifndef IMAGE_STEGO_HPP
#define IMAGE_STEGO_HPP

#include "protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// File-level wrappers: grayscale cover -> Haar DWT -> QIM -> lossless stego image.
// Failures are logged to std::cerr and reported as false.
namespace dwtstego {

    // .png .bmp .tif .tiff .pgm .ppm; anything lossy breaks extraction
    bool isLosslessPath(const std::string& path);

    bool embedFileDWT(const std::string& coverImagePath,
                      const std::string& stegoImagePath,
                      const std::vector<uint8_t>& payload,
                      const StegoProtocol& protocol = StegoProtocol::defaults());

    bool extractFileDWT(const std::string& stegoImagePath,
                        std::vector<uint8_t>& outPayload,
                        const StegoProtocol& protocol = StegoProtocol::defaults());

    bool embedTextDWT(const std::string& coverImagePath,
                      const std::string& stegoImagePath,
                      const std::string& message);

    bool extractTextDWT(const std::string& stegoImagePath,
                        std::string& outMessage);

    bool imageCapacityBytes(const std::string& coverImagePath,
                            size_t& outBytes,
                            const StegoProtocol& protocol = StegoProtocol::defaults());

}

#endif // IMAGE_STEGO_HPP
