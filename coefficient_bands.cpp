#include "coefficient_bands.hpp"
#include "stego_errors.hpp"

namespace dwtstego {

    CoefficientBand* BandSet::find(const std::string& name)
    {
        for (CoefficientBand& b : bands) {
            if (b.name == name) return &b;
        }
        return nullptr;
    }

    const CoefficientBand* BandSet::find(const std::string& name) const
    {
        for (const CoefficientBand& b : bands) {
            if (b.name == name) return &b;
        }
        return nullptr;
    }

    cv::Mat& BandSet::at(const std::string& name)
    {
        CoefficientBand* b = find(name);
        if (!b) {
            throw ConfigurationError("band not found: " + name);
        }
        return b->data;
    }

    const cv::Mat& BandSet::at(const std::string& name) const
    {
        const CoefficientBand* b = find(name);
        if (!b) {
            throw ConfigurationError("band not found: " + name);
        }
        return b->data;
    }

    BandSet BandSet::clone() const
    {
        BandSet out;
        out.imageSize = imageSize;
        out.transformSize = transformSize;
        out.uncovered = uncovered.clone();
        out.levels = levels;
        out.bands.reserve(bands.size());
        for (const CoefficientBand& b : bands) {
            out.bands.push_back({b.name, b.data.clone()});
        }
        return out;
    }

    BandSet singleBand(const std::string& name, const cv::Mat& grid)
    {
        if (grid.empty() || grid.channels() != 1) {
            throw ConfigurationError("band grid must be a non-empty single-channel matrix");
        }
        BandSet set;
        cv::Mat data;
        grid.convertTo(data, CV_64F);
        set.bands.push_back({name, data});
        set.imageSize = grid.size();
        set.transformSize = grid.size();
        set.levels = 0;
        return set;
    }

}
