#ifndef COEFFICIENT_BANDS_HPP
#define COEFFICIENT_BANDS_HPP

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace dwtstego {

    // One sub-band at one decomposition level, CV_64F.
    struct CoefficientBand {
        std::string name;
        cv::Mat data;
    };

    struct BandSet {
        std::vector<CoefficientBand> bands;
        cv::Size imageSize;
        cv::Size transformSize;   // top-left region covered by the bands
        cv::Mat uncovered;        // source pixels, CV_64F; only set when the sizes differ
        int levels = 0;

        CoefficientBand* find(const std::string& name);
        const CoefficientBand* find(const std::string& name) const;

        // throws ConfigurationError if the band is missing
        cv::Mat& at(const std::string& name);
        const cv::Mat& at(const std::string& name) const;

        // deep copy, no shared pixel buffers
        BandSet clone() const;
    };

    // Wrap a single grid as a one-band set (no transform geometry).
    BandSet singleBand(const std::string& name, const cv::Mat& grid);

}

#endif
