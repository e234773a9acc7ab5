#pragma once

#include "Series.hpp"

namespace tdcore {

/// Heiken-Ashi candles for `series`, same length and timestamps.
///
/// ha_close = (O + H + L + C) / 4
/// ha_open  = (O[0] + C[0]) / 2 on the first bar, then (ha_open[i-1] + ha_close[i-1]) / 2
/// ha_high  = max(H, ha_open, ha_close)
/// ha_low   = min(L, ha_open, ha_close)
///
/// ha_open is a recurrence, so this is a single left-to-right scan.
BarSeries compute_heiken_ashi(const BarSeries& series);

} // namespace tdcore
