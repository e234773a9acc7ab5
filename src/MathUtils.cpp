#include "MathUtils.hpp"

#include <algorithm>

namespace tdcore {

double window_mean(std::span<const double> prices, std::size_t index, int length) noexcept
{
    if (length <= 0 || index + 1 < static_cast<std::size_t>(length)) {
        return 0.0;
    }
    const std::size_t start = index + 1 - static_cast<std::size_t>(length);
    double sum = 0.0;
    for (std::size_t i = start; i <= index; ++i) {
        sum += prices[i];
    }
    return sum / static_cast<double>(length);
}

double sample_variance(std::span<const double> prices, std::size_t index, int length, double mean) noexcept
{
    if (length < 2 || index + 1 < static_cast<std::size_t>(length)) {
        return 0.0;
    }
    const std::size_t start = index + 1 - static_cast<std::size_t>(length);
    double sum_sq = 0.0;
    for (std::size_t i = start; i <= index; ++i) {
        const double diff = prices[i] - mean;
        sum_sq += diff * diff;
    }
    return sum_sq / static_cast<double>(length - 1);
}

double true_high(std::span<const double> high, std::span<const double> close, std::size_t index) noexcept
{
    if (index == 0) {
        return high[0];
    }
    return std::max(high[index], close[index - 1]);
}

double true_low(std::span<const double> low, std::span<const double> close, std::size_t index) noexcept
{
    if (index == 0) {
        return low[0];
    }
    return std::min(low[index], close[index - 1]);
}

} // namespace tdcore
