#include "IndicatorLibrary.hpp"

#include "BandCalculator.hpp"
#include "HeikenAshi.hpp"
#include "SequentialEngine.hpp"

#include <string>
#include <type_traits>

namespace tdcore {

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

IndicatorResult initialize_result(const IndicatorRequest& request)
{
    IndicatorResult result;
    result.kind = kind_of(request.params);
    result.name = request.name.empty() ? std::string(to_string(result.kind)) : request.name;
    return result;
}

IndicatorResult make_error(IndicatorResult result, std::string message)
{
    result.status = ResultStatus::Error;
    result.error_message = std::move(message);
    result.output = std::monostate{};
    return result;
}

IndicatorResult make_no_data(IndicatorResult result, std::size_t have, std::size_t need)
{
    result.status = ResultStatus::NoData;
    result.error_message = "Insufficient history: " + std::to_string(have) + " bars, need "
                           + std::to_string(need);
    result.output = std::monostate{};
    return result;
}

/// Heiken-Ashi input is always re-derived from the raw bars handed in.
BarSeries select_source(const BarSeries& raw, PriceSource source)
{
    return source == PriceSource::HeikenAshi ? compute_heiken_ashi(raw) : raw;
}

IndicatorOutput compute_output(const BarSeries& series, const IndicatorParameters& params)
{
    return std::visit([&series](const auto& p) -> IndicatorOutput {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, HeikenAshiParameters>) {
            return HeikenAshiOutput{compute_heiken_ashi(series)};
        } else if constexpr (std::is_same_v<T, SequentialParameters>) {
            return SequentialOutput{compute_sequential(select_source(series, p.source), p)};
        } else if constexpr (std::is_same_v<T, BandParameters>) {
            return BandOutput{compute_bands(select_source(series, p.source), p)};
        } else {
            static_assert(kAlwaysFalse<T>, "indicator kind without a computation");
        }
    }, params);
}

} // namespace

std::size_t minimum_history(const IndicatorParameters& params)
{
    return std::visit([](const auto& p) -> std::size_t {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, HeikenAshiParameters>) {
            return 1;
        } else if constexpr (std::is_same_v<T, SequentialParameters>) {
            // First bar able to flip is index lookback + 1.
            return static_cast<std::size_t>(p.setup_lookback) + 2;
        } else if constexpr (std::is_same_v<T, BandParameters>) {
            return static_cast<std::size_t>(p.period);
        } else {
            static_assert(kAlwaysFalse<T>, "indicator kind without a history requirement");
        }
    }, params);
}

IndicatorResult compute_indicator(const BarSeries& series, const IndicatorRequest& request)
{
    IndicatorResult result = initialize_result(request);

    std::string error;
    if (!validate_parameters(request.params, error)) {
        return make_error(std::move(result), "Invalid parameters: " + error);
    }
    if (!validate_series(series, error)) {
        return make_error(std::move(result), "Invalid bar series: " + error);
    }

    const std::size_t need = minimum_history(request.params);
    if (series.size() < need) {
        return make_no_data(std::move(result), series.size(), need);
    }

    result.output = compute_output(series, request.params);
    return result;
}

std::string_view to_string(ResultStatus status)
{
    switch (status) {
        case ResultStatus::Ok: return "ok";
        case ResultStatus::NoData: return "no data";
        case ResultStatus::Error: return "error";
    }
    return "unknown";
}

} // namespace tdcore
