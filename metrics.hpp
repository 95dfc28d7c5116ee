#ifndef METRICS_HPP
#define METRICS_HPP

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace metrics {

    // 8-bit peak; 100 for identical images, -1 on size/type mismatch
    double computePSNR(const cv::Mat& I1, const cv::Mat& I2);

    // both files read as grayscale; -1 if either cannot be read
    double psnrImages(const std::string& originalPath, const std::string& stegoPath);

    // BER for extracted vs original payload
    double computeBER(const std::vector<uint8_t>& original,
                      const std::vector<uint8_t>& extracted);

}

#endif
