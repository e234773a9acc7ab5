#pragma once

#include <cstddef>
#include <span>

namespace tdcore {

/// Arithmetic mean of prices[index-length+1 .. index].
double window_mean(std::span<const double> prices, std::size_t index, int length) noexcept;

/// Sample (N-1) variance of prices[index-length+1 .. index] around `mean`.
/// Returns 0 for windows shorter than two values.
double sample_variance(std::span<const double> prices, std::size_t index, int length, double mean) noexcept;

/// Smoothing factor 2 / (period + 1) used by the exponential average.
constexpr double ema_alpha(int period) noexcept
{
    return 2.0 / (static_cast<double>(period) + 1.0);
}

/// max(high[index], close[index-1]); the plain high on the first bar.
double true_high(std::span<const double> high, std::span<const double> close, std::size_t index) noexcept;

/// min(low[index], close[index-1]); the plain low on the first bar.
double true_low(std::span<const double> low, std::span<const double> close, std::size_t index) noexcept;

} // namespace tdcore
