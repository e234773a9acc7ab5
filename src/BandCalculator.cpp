#include "BandCalculator.hpp"

#include "MathUtils.hpp"

#include <cmath>
#include <span>
#include <stdexcept>
#include <string>

namespace tdcore {

const BandLine* BandBarState::line(int k) const noexcept
{
    for (const auto& entry : lines) {
        if (entry.multiplier == k) {
            return &entry;
        }
    }
    return nullptr;
}

BandSeries compute_bands(const BarSeries& series, const BandParameters& params)
{
    std::string error;
    if (!validate_parameters(params, error)) {
        throw std::invalid_argument(error);
    }

    const std::size_t n = series.size();
    BandSeries bands(n);

    const int period = params.period;
    if (n < static_cast<std::size_t>(period)) {
        return bands;
    }

    const std::span<const double> close(series.close.data(), series.close.size());
    const double alpha = ema_alpha(period);
    double ema = 0.0;

    for (std::size_t index = static_cast<std::size_t>(period - 1); index < n; ++index) {
        const double mean = window_mean(close, index, period);
        const double stddev = std::sqrt(sample_variance(close, index, period, mean));

        double basis = mean;
        if (params.ma_kind == MovingAverageKind::Exponential) {
            ema = (index == static_cast<std::size_t>(period - 1)) ? mean
                                                                  : ema + alpha * (close[index] - ema);
            basis = ema;
        }

        BandBarState state;
        state.basis = basis;
        state.stddev = stddev;
        state.lines.reserve(params.multipliers.size());
        for (int k : params.multipliers) {
            const double offset = static_cast<double>(k) * stddev;
            state.lines.push_back(BandLine{k, basis + offset, basis - offset});
        }
        bands[index] = std::move(state);
    }

    return bands;
}

} // namespace tdcore
