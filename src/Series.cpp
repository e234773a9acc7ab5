#include "Series.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tdcore {

void BarSeries::reserve(std::size_t n)
{
    timestamp.reserve(n);
    open.reserve(n);
    high.reserve(n);
    low.reserve(n);
    close.reserve(n);
}

void BarSeries::push_back(const Bar& bar)
{
    timestamp.push_back(bar.timestamp);
    open.push_back(bar.open);
    high.push_back(bar.high);
    low.push_back(bar.low);
    close.push_back(bar.close);
}

Bar BarSeries::bar(std::size_t index) const
{
    return Bar{timestamp[index], open[index], high[index], low[index], close[index]};
}

BarSeries BarSeries::from_bars(const std::vector<Bar>& bars)
{
    BarSeries series;
    series.reserve(bars.size());
    for (const auto& bar : bars) {
        series.push_back(bar);
    }
    return series;
}

bool validate_series(const BarSeries& series, std::string& error)
{
    const std::size_t n = series.close.size();
    if (series.timestamp.size() != n || series.open.size() != n
        || series.high.size() != n || series.low.size() != n) {
        error = "Input series vectors must share identical length.";
        return false;
    }

    for (std::size_t i = 0; i < n; ++i) {
        const double o = series.open[i];
        const double h = series.high[i];
        const double l = series.low[i];
        const double c = series.close[i];

        std::ostringstream oss;
        if (!std::isfinite(o) || !std::isfinite(h) || !std::isfinite(l) || !std::isfinite(c)) {
            oss << "Bar " << i << " has a non-finite price.";
        } else if (h < std::max(o, c)) {
            oss << "Bar " << i << " high " << h << " is below max(open, close) " << std::max(o, c) << ".";
        } else if (l > std::min(o, c)) {
            oss << "Bar " << i << " low " << l << " is above min(open, close) " << std::min(o, c) << ".";
        } else if (i > 0 && series.timestamp[i] <= series.timestamp[i - 1]) {
            oss << "Bar " << i << " timestamp " << series.timestamp[i]
                << " does not follow previous timestamp " << series.timestamp[i - 1] << ".";
        } else {
            continue;
        }
        error = oss.str();
        return false;
    }

    error.clear();
    return true;
}

} // namespace tdcore
