#pragma once

#include "IndicatorRequest.hpp"
#include "Series.hpp"

#include <optional>
#include <vector>

namespace tdcore {

struct BandLine {
    int multiplier{0};
    double upper{0.0};
    double lower{0.0};
};

struct BandBarState {
    double basis{0.0};
    double stddev{0.0};
    std::vector<BandLine> lines;  // one per configured multiplier, in request order

    /// Line for multiplier `k`, or nullptr if `k` was not requested.
    const BandLine* line(int k) const noexcept;
};

/// One entry per input bar; bars before period-1 carry no value.
using BandSeries = std::vector<std::optional<BandBarState>>;

/// Moving-average basis with k-sigma envelopes over the close.
///
/// The deviation is always the sample (N-1) standard deviation of the simple
/// window, whichever basis kind is selected. The exponential basis is seeded
/// with the simple mean of the first `period` closes.
///
/// Throws std::invalid_argument if `params` fails validate_parameters().
BandSeries compute_bands(const BarSeries& series, const BandParameters& params);

} // namespace tdcore
