#ifndef STEGO_ERRORS_HPP
#define STEGO_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dwtstego {

    class StegoError : public std::runtime_error {
    public:
        explicit StegoError(const std::string& what)
            : std::runtime_error(what) {}
    };

    // bad margins, band set, step table or transform input
    class ConfigurationError : public StegoError {
    public:
        explicit ConfigurationError(const std::string& what)
            : StegoError(what) {}
    };

    // payload does not fit; raised before any coefficient is written
    class CapacityExceeded : public StegoError {
    public:
        CapacityExceeded(size_t requestedBits, size_t availableBits)
            : StegoError("payload needs " + std::to_string(requestedBits)
                         + " bits but only " + std::to_string(availableBits)
                         + " are available"),
              requestedBits_(requestedBits),
              availableBits_(availableBits) {}

        size_t requestedBits() const { return requestedBits_; }
        size_t availableBits() const { return availableBits_; }

    private:
        size_t requestedBits_;
        size_t availableBits_;
    };

    class FrameError : public StegoError {
    public:
        explicit FrameError(const std::string& what)
            : StegoError(what) {}
    };

    class CorruptHeader : public StegoError {
    public:
        explicit CorruptHeader(uint32_t length)
            : StegoError("implausible payload length in header: "
                         + std::to_string(length)),
              length_(length) {}

        uint32_t length() const { return length_; }

    private:
        uint32_t length_;
    };

    // a session object was driven twice
    class SessionError : public StegoError {
    public:
        explicit SessionError(const std::string& what)
            : StegoError(what) {}
    };

}

#endif
