#ifndef COEFFICIENT_SELECTOR_HPP
#define COEFFICIENT_SELECTOR_HPP

#include "coefficient_bands.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace dwtstego {

    struct CoefficientPosition {
        size_t band;        // index into the selector's band order
        int row;
        int col;
    };

    inline bool operator==(const CoefficientPosition& a, const CoefficientPosition& b)
    {
        return a.band == b.band && a.row == b.row && a.col == b.col;
    }

    struct BandShape {
        std::string name;
        int rows;
        int cols;
    };

    // Enumerates embedding positions: bands in the given priority order,
    // then row-major inside each band, skipping the first rowSkip rows and
    // colSkip columns. Only band shapes are read, never coefficient values,
    // so a cover and the stego image decomposed again give the same stream.
    class CoefficientSelector {
    public:
        // throws ConfigurationError
        CoefficientSelector(const BandSet& bands,
                            const std::vector<std::string>& bandOrder,
                            int rowSkip, int colSkip);

        size_t count() const { return total_; }

        // throws ConfigurationError when index >= count()
        CoefficientPosition at(size_t index) const;

        std::vector<CoefficientPosition> range(size_t first, size_t n) const;

        const std::string& bandName(const CoefficientPosition& pos) const;

        const std::vector<BandShape>& bandShapes() const { return shapes_; }
        int rowSkip() const { return rowSkip_; }
        int colSkip() const { return colSkip_; }

    private:
        std::vector<BandShape> shapes_;
        std::vector<size_t> offsets_;   // first stream index of each band
        int rowSkip_;
        int colSkip_;
        size_t total_ = 0;
    };

}

#endif
