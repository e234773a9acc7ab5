#include "HeikenAshi.hpp"

#include <algorithm>

namespace tdcore {

BarSeries compute_heiken_ashi(const BarSeries& series)
{
    BarSeries ha;
    const std::size_t n = series.size();
    if (n == 0) {
        return ha;
    }

    ha.timestamp = series.timestamp;
    ha.open.resize(n);
    ha.high.resize(n);
    ha.low.resize(n);
    ha.close.resize(n);

    double prev_open = 0.0;
    double prev_close = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double ha_close = (series.open[i] + series.high[i] + series.low[i] + series.close[i]) / 4.0;
        const double ha_open = (i == 0) ? (series.open[0] + series.close[0]) / 2.0
                                        : (prev_open + prev_close) / 2.0;

        ha.open[i] = ha_open;
        ha.close[i] = ha_close;
        ha.high[i] = std::max({series.high[i], ha_open, ha_close});
        ha.low[i] = std::min({series.low[i], ha_open, ha_close});

        prev_open = ha_open;
        prev_close = ha_close;
    }

    return ha;
}

} // namespace tdcore
