#include "image_stego.hpp"
#include "capacity.hpp"
#include "dwt_stego.hpp"
#include "metrics.hpp"
#include "stego_errors.hpp"
#include "wavelet.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace dwtstego {

    // string <-> bytes
    static std::vector<uint8_t> stringToBytes(const std::string& s) {
        return std::vector<uint8_t>(s.begin(), s.end());
    }

    static std::string bytesToString(const std::vector<uint8_t>& bytes) {
        return std::string(bytes.begin(), bytes.end());
    }

    static cv::Mat loadGray(const std::string& path, const char* tag)
    {
        cv::Mat img = cv::imread(path, cv::IMREAD_GRAYSCALE);
        if (img.empty()) {
            std::cerr << "[" << tag << "] Failed to load image: " << path << std::endl;
        }
        return img;
    }

    bool isLosslessPath(const std::string& path)
    {
        const size_t dot = path.find_last_of('.');
        if (dot == std::string::npos) return false;

        std::string ext = path.substr(dot);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

        return ext == ".png" || ext == ".bmp" || ext == ".tif" || ext == ".tiff"
            || ext == ".pgm" || ext == ".ppm";
    }

    bool embedFileDWT(const std::string& coverImagePath,
                      const std::string& stegoImagePath,
                      const std::vector<uint8_t>& payload,
                      const StegoProtocol& protocol)
    {
        if (!isLosslessPath(stegoImagePath)) {
            std::cerr << "[dwt embed] Stego image must use a lossless format: "
                      << stegoImagePath << std::endl;
            return false;
        }

        cv::Mat cover = loadGray(coverImagePath, "dwt embed");
        if (cover.empty()) return false;

        try {
            BandSet bands = HaarWavelet::decompose(cover, DWT_LEVELS);

            EmbedReport report;
            BandSet stegoBands = embedPayload(bands, payload, protocol, &report);
            cv::Mat stego = HaarWavelet::toImage8U(HaarWavelet::reconstruct(stegoBands));

            if (!cv::imwrite(stegoImagePath, stego)) {
                std::cerr << "[dwt embed] Failed to save stego image: " << stegoImagePath << std::endl;
                return false;
            }

            std::cout << "[dwt embed] " << report.lengthBytes << " bytes, "
                      << report.bitsWritten << "/" << report.capacityBits << " positions, Q="
                      << report.payloadStep << ", PSNR " << metrics::computePSNR(cover, stego)
                      << " dB" << std::endl;
            std::cout << "[dwt embed] Done. Saved: " << stegoImagePath << std::endl;
            return true;
        }
        catch (const CapacityExceeded& e) {
            std::cerr << "[dwt embed] Not enough capacity: need " << e.requestedBits()
                      << " bits but only " << e.availableBits() << "\n";
        }
        catch (const StegoError& e) {
            std::cerr << "[dwt embed] " << e.what() << "\n";
        }
        catch (const cv::Exception& e) {
            std::cerr << "[dwt embed] OpenCV error: " << e.what() << "\n";
        }
        return false;
    }

    bool extractFileDWT(const std::string& stegoImagePath,
                        std::vector<uint8_t>& outPayload,
                        const StegoProtocol& protocol)
    {
        outPayload.clear();

        cv::Mat stego = loadGray(stegoImagePath, "dwt extract");
        if (stego.empty()) return false;

        try {
            BandSet bands = HaarWavelet::decompose(stego, DWT_LEVELS);

            ExtractReport report;
            outPayload = extractPayload(bands, protocol, &report);

            std::cout << "[dwt extract] " << report.lengthBytes << " bytes, Q="
                      << report.payloadStep << std::endl;
            return true;
        }
        catch (const CorruptHeader& e) {
            std::cerr << "[dwt extract] Corrupt length header (" << e.length()
                      << " bytes); no payload or wrong protocol\n";
        }
        catch (const StegoError& e) {
            std::cerr << "[dwt extract] " << e.what() << "\n";
        }
        catch (const cv::Exception& e) {
            std::cerr << "[dwt extract] OpenCV error: " << e.what() << "\n";
        }
        return false;
    }

    bool embedTextDWT(const std::string& coverImagePath,
                      const std::string& stegoImagePath,
                      const std::string& message)
    {
        return embedFileDWT(coverImagePath, stegoImagePath, stringToBytes(message));
    }

    bool extractTextDWT(const std::string& stegoImagePath,
                        std::string& outMessage)
    {
        std::vector<uint8_t> bytes;
        if (!extractFileDWT(stegoImagePath, bytes)) {
            return false;
        }
        outMessage = bytesToString(bytes);
        return true;
    }

    bool imageCapacityBytes(const std::string& coverImagePath,
                            size_t& outBytes,
                            const StegoProtocol& protocol)
    {
        outBytes = 0;

        cv::Mat cover = loadGray(coverImagePath, "capacity");
        if (cover.empty()) return false;

        try {
            outBytes = maxPayloadBytes(cover.size(), protocol, DWT_LEVELS);
            return true;
        }
        catch (const StegoError& e) {
            std::cerr << "[capacity] " << e.what() << "\n";
        }
        return false;
    }

}
