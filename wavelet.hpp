#ifndef WAVELET_HPP
#define WAVELET_HPP

#include "coefficient_bands.hpp"

#include <opencv2/core.hpp>

namespace dwtstego {

    // Orthonormal 2-D Haar DWT.
    //
    // decompose() transforms the largest top-left region whose sides are
    // multiples of 2^levels; right and bottom strips outside it are carried
    // in BandSet::uncovered and come back verbatim. Each level splits the
    // approximation into LL/LH/HL/HH. Bands come out as LL<levels>, then
    // LH<k>, HL<k>, HH<k> from the coarsest level k = levels down to 1.
    // Band shapes depend only on the image size and the level count.
    //
    // reconstruct() inverts it exactly up to floating error. Rounding the
    // result to 8-bit pixels and decomposing again is NOT lossless for the
    // coefficients.
    class HaarWavelet {
    public:
        // image: single channel, any depth. throws ConfigurationError
        static BandSet decompose(const cv::Mat& image, int levels);

        // returns CV_64F at BandSet::imageSize. throws ConfigurationError
        static cv::Mat reconstruct(const BandSet& bands);

        // round + saturate to CV_8U
        static cv::Mat toImage8U(const cv::Mat& image);

        // band shapes decompose() would produce, without touching pixels
        static BandSet layout(cv::Size imageSize, int levels);
    };

}

#endif
