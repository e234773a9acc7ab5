#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tdcore {

struct Bar {
    std::int64_t timestamp{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
};

/// Chronologically ordered OHLC bars stored column-wise.
struct BarSeries {
    std::vector<std::int64_t> timestamp;
    std::vector<double> open;
    std::vector<double> high;
    std::vector<double> low;
    std::vector<double> close;

    std::size_t size() const noexcept { return close.size(); }
    bool empty() const noexcept { return close.empty(); }

    void reserve(std::size_t n);
    void push_back(const Bar& bar);
    Bar bar(std::size_t index) const;

    static BarSeries from_bars(const std::vector<Bar>& bars);
};

/// Checks column lengths, finite prices, high/low envelope and strictly
/// increasing timestamps. On failure `error` names the first offending bar.
bool validate_series(const BarSeries& series, std::string& error);

} // namespace tdcore
