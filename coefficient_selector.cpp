#include "coefficient_selector.hpp"
#include "stego_errors.hpp"

#include <algorithm>

namespace dwtstego {

    CoefficientSelector::CoefficientSelector(const BandSet& bands,
                                             const std::vector<std::string>& bandOrder,
                                             int rowSkip, int colSkip)
        : rowSkip_(rowSkip), colSkip_(colSkip)
    {
        if (bandOrder.empty()) {
            throw ConfigurationError("selector needs at least one band");
        }
        if (rowSkip < 0 || colSkip < 0) {
            throw ConfigurationError("border margins must be non-negative");
        }

        for (const std::string& name : bandOrder) {
            auto dup = std::find_if(shapes_.begin(), shapes_.end(),
                                    [&](const BandShape& s) { return s.name == name; });
            if (dup != shapes_.end()) {
                throw ConfigurationError("band listed twice in selector order: " + name);
            }

            const cv::Mat& m = bands.at(name);
            if (rowSkip >= m.rows || colSkip >= m.cols) {
                throw ConfigurationError("margins (" + std::to_string(rowSkip) + ", "
                                         + std::to_string(colSkip) + ") do not fit band "
                                         + name + " of " + std::to_string(m.rows) + "x"
                                         + std::to_string(m.cols));
            }

            shapes_.push_back({name, m.rows, m.cols});
            offsets_.push_back(total_);
            total_ += static_cast<size_t>(m.rows - rowSkip) * static_cast<size_t>(m.cols - colSkip);
        }
    }

    CoefficientPosition CoefficientSelector::at(size_t index) const
    {
        if (index >= total_) {
            throw ConfigurationError("position " + std::to_string(index)
                                     + " is past the end of the selector ("
                                     + std::to_string(total_) + ")");
        }

        // last band whose offset <= index
        auto it = std::upper_bound(offsets_.begin(), offsets_.end(), index);
        const size_t band = static_cast<size_t>(it - offsets_.begin()) - 1;

        const size_t local = index - offsets_[band];
        const size_t width = static_cast<size_t>(shapes_[band].cols - colSkip_);

        CoefficientPosition pos;
        pos.band = band;
        pos.row = rowSkip_ + static_cast<int>(local / width);
        pos.col = colSkip_ + static_cast<int>(local % width);
        return pos;
    }

    std::vector<CoefficientPosition> CoefficientSelector::range(size_t first, size_t n) const
    {
        if (n > total_ || first > total_ - n) {
            throw ConfigurationError("requested positions exceed the selector");
        }

        std::vector<CoefficientPosition> out;
        out.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            out.push_back(at(first + i));
        }
        return out;
    }

    const std::string& CoefficientSelector::bandName(const CoefficientPosition& pos) const
    {
        return shapes_.at(pos.band).name;
    }

}
