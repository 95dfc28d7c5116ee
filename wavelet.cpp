#include "wavelet.hpp"
#include "stego_errors.hpp"

#include <string>
#include <vector>

namespace dwtstego {

    static const int MAX_LEVELS = 16;

    static void checkLevels(int levels)
    {
        if (levels < 1 || levels > MAX_LEVELS) {
            throw ConfigurationError("wavelet levels must be in [1, "
                                     + std::to_string(MAX_LEVELS) + "], got "
                                     + std::to_string(levels));
        }
    }

    // largest top-left region whose sides are multiples of 2^levels
    static cv::Size transformSizeFor(cv::Size imageSize, int levels)
    {
        const int unit = 1 << levels;
        const cv::Size covered((imageSize.width / unit) * unit,
                               (imageSize.height / unit) * unit);
        if (covered.width == 0 || covered.height == 0) {
            throw ConfigurationError("image of " + std::to_string(imageSize.width) + "x"
                                     + std::to_string(imageSize.height) + " is too small for "
                                     + std::to_string(levels) + " wavelet levels");
        }
        return covered;
    }

    static std::string bandName(const char* kind, int level)
    {
        return std::string(kind) + std::to_string(level);
    }

    // one analysis step: 2x2 blocks -> four half-size bands
    static void haarSplit(const cv::Mat& src, cv::Mat& ll, cv::Mat& lh, cv::Mat& hl, cv::Mat& hh)
    {
        const int rows = src.rows / 2;
        const int cols = src.cols / 2;
        ll.create(rows, cols, CV_64F);
        lh.create(rows, cols, CV_64F);
        hl.create(rows, cols, CV_64F);
        hh.create(rows, cols, CV_64F);

        for (int r = 0; r < rows; ++r) {
            const double* top = src.ptr<double>(2 * r);
            const double* bottom = src.ptr<double>(2 * r + 1);
            double* pll = ll.ptr<double>(r);
            double* plh = lh.ptr<double>(r);
            double* phl = hl.ptr<double>(r);
            double* phh = hh.ptr<double>(r);

            for (int c = 0; c < cols; ++c) {
                const double a = top[2 * c];
                const double b = top[2 * c + 1];
                const double d = bottom[2 * c];
                const double e = bottom[2 * c + 1];

                pll[c] = (a + b + d + e) * 0.5;
                plh[c] = (a + b - d - e) * 0.5;
                phl[c] = (a - b + d - e) * 0.5;
                phh[c] = (a - b - d + e) * 0.5;
            }
        }
    }

    // inverse of haarSplit
    static cv::Mat haarMerge(const cv::Mat& ll, const cv::Mat& lh, const cv::Mat& hl, const cv::Mat& hh)
    {
        cv::Mat dst(ll.rows * 2, ll.cols * 2, CV_64F);

        for (int r = 0; r < ll.rows; ++r) {
            const double* pll = ll.ptr<double>(r);
            const double* plh = lh.ptr<double>(r);
            const double* phl = hl.ptr<double>(r);
            const double* phh = hh.ptr<double>(r);
            double* top = dst.ptr<double>(2 * r);
            double* bottom = dst.ptr<double>(2 * r + 1);

            for (int c = 0; c < ll.cols; ++c) {
                const double s = pll[c];
                const double h = plh[c];
                const double v = phl[c];
                const double g = phh[c];

                top[2 * c]        = (s + h + v + g) * 0.5;
                top[2 * c + 1]    = (s + h - v - g) * 0.5;
                bottom[2 * c]     = (s - h + v - g) * 0.5;
                bottom[2 * c + 1] = (s - h - v + g) * 0.5;
            }
        }
        return dst;
    }

    static const cv::Mat& requireBand(const BandSet& bands, const std::string& name, cv::Size expected)
    {
        const cv::Mat& m = bands.at(name);
        if (m.type() != CV_64F || m.size() != expected) {
            throw ConfigurationError("band " + name + " has the wrong type or shape");
        }
        return m;
    }

    BandSet HaarWavelet::decompose(const cv::Mat& image, int levels)
    {
        checkLevels(levels);
        if (image.empty() || image.channels() != 1) {
            throw ConfigurationError("wavelet input must be a non-empty single-channel image");
        }

        BandSet out;
        out.imageSize = image.size();
        out.transformSize = transformSizeFor(image.size(), levels);
        out.levels = levels;

        cv::Mat source;
        image.convertTo(source, CV_64F);
        cv::Mat current = source(cv::Rect(cv::Point(0, 0), out.transformSize));
        if (out.transformSize != out.imageSize) {
            out.uncovered = source;
        }

        std::vector<CoefficientBand> details;
        for (int level = 1; level <= levels; ++level) {
            cv::Mat ll, lh, hl, hh;
            haarSplit(current, ll, lh, hl, hh);
            details.push_back({bandName("HH", level), hh});
            details.push_back({bandName("HL", level), hl});
            details.push_back({bandName("LH", level), lh});
            current = ll;
        }

        out.bands.push_back({bandName("LL", levels), current});
        for (auto it = details.rbegin(); it != details.rend(); ++it) {
            out.bands.push_back(*it);
        }
        return out;
    }

    cv::Mat HaarWavelet::reconstruct(const BandSet& bands)
    {
        checkLevels(bands.levels);
        const cv::Size expected = transformSizeFor(bands.imageSize, bands.levels);
        if (bands.transformSize != expected) {
            throw ConfigurationError("band set geometry does not match its image size");
        }
        if (expected != bands.imageSize
            && (bands.uncovered.size() != bands.imageSize || bands.uncovered.type() != CV_64F)) {
            throw ConfigurationError("band set is missing the pixels outside the transformed region");
        }

        const int unit = 1 << bands.levels;
        cv::Size levelSize(expected.width / unit, expected.height / unit);
        cv::Mat current = requireBand(bands, bandName("LL", bands.levels), levelSize);

        for (int level = bands.levels; level >= 1; --level) {
            const cv::Mat& lh = requireBand(bands, bandName("LH", level), levelSize);
            const cv::Mat& hl = requireBand(bands, bandName("HL", level), levelSize);
            const cv::Mat& hh = requireBand(bands, bandName("HH", level), levelSize);
            current = haarMerge(current, lh, hl, hh);
            levelSize = current.size();
        }

        if (expected == bands.imageSize) {
            return current;
        }

        // edge strips the transform does not cover pass through unchanged
        cv::Mat out = bands.uncovered.clone();
        current.copyTo(out(cv::Rect(cv::Point(0, 0), expected)));
        return out;
    }

    cv::Mat HaarWavelet::toImage8U(const cv::Mat& image)
    {
        cv::Mat out;
        image.convertTo(out, CV_8U);
        return out;
    }

    BandSet HaarWavelet::layout(cv::Size imageSize, int levels)
    {
        checkLevels(levels);
        if (imageSize.width <= 0 || imageSize.height <= 0) {
            throw ConfigurationError("image size must be positive");
        }

        BandSet out;
        out.imageSize = imageSize;
        out.transformSize = transformSizeFor(imageSize, levels);
        out.levels = levels;

        auto shape = [&](int level) -> cv::Mat {
            return cv::Mat::zeros(out.transformSize.height >> level, out.transformSize.width >> level, CV_64F);
        };

        out.bands.push_back({bandName("LL", levels), shape(levels)});
        for (int level = levels; level >= 1; --level) {
            out.bands.push_back({bandName("LH", level), shape(level)});
            out.bands.push_back({bandName("HL", level), shape(level)});
            out.bands.push_back({bandName("HH", level), shape(level)});
        }
        return out;
    }

}
