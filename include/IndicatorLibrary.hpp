#pragma once

#include "IndicatorRequest.hpp"
#include "IndicatorResult.hpp"
#include "Series.hpp"

#include <cstddef>

namespace tdcore {

/// Computes one indicator from the raw series. Never throws: invalid bars or
/// parameters come back as ResultStatus::Error, a series too short for any
/// output as ResultStatus::NoData.
IndicatorResult compute_indicator(const BarSeries& series, const IndicatorRequest& request);

/// Bars needed before the indicator can emit a single non-default value.
std::size_t minimum_history(const IndicatorParameters& params);

} // namespace tdcore
