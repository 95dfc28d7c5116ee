#include "metrics.hpp"

#include <opencv2/imgcodecs.hpp>

#include <cmath>
#include <iostream>

namespace metrics {

    // --- PSNR ---
    double computePSNR(const cv::Mat& I1, const cv::Mat& I2)
    {
        if (I1.empty() || I1.size() != I2.size() || I1.type() != I2.type()) {
            return -1;
        }

        cv::Mat a, b;
        I1.convertTo(a, CV_64F);
        I2.convertTo(b, CV_64F);

        cv::Mat s1 = a - b;
        s1 = s1.mul(s1);

        cv::Scalar s = cv::sum(s1);
        double sse = 0.0;
        for (int c = 0; c < I1.channels(); ++c) {
            sse += s.val[c];
        }

        if (sse <= 1e-10) return 100; // identical
        double mse = sse / (double)(I1.channels() * I1.total());
        return 10.0 * std::log10((255.0 * 255.0) / mse);
    }

    double psnrImages(const std::string& originalPath, const std::string& stegoPath)
    {
        cv::Mat original = cv::imread(originalPath, cv::IMREAD_GRAYSCALE);
        cv::Mat stego = cv::imread(stegoPath, cv::IMREAD_GRAYSCALE);
        if (original.empty() || stego.empty()) {
            std::cerr << "[metrics] Failed to load " << originalPath << " or " << stegoPath << "\n";
            return -1;
        }
        return computePSNR(original, stego);
    }

    // --- BER ---
    double computeBER(const std::vector<uint8_t>& original,
                      const std::vector<uint8_t>& extracted)
    {
        if (original.size() != extracted.size()) {
            return 1.0; // 100% wrong
        }
        if (original.empty()) {
            return 0.0;
        }

        size_t bitErrors = 0;
        size_t totalBits = original.size() * 8;

        for (size_t i = 0; i < original.size(); i++) {
            uint8_t diff = original[i] ^ extracted[i];
            while (diff) {
                bitErrors += diff & 1u;
                diff >>= 1;
            }
        }

        return (double)bitErrors / totalBits;
    }

}
