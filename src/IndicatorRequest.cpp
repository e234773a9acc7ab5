#include "IndicatorRequest.hpp"

#include <algorithm>
#include <set>

namespace tdcore {

IndicatorKind kind_of(const IndicatorParameters& params) noexcept
{
    static_assert(std::variant_size_v<IndicatorParameters> == kAllIndicatorKinds.size());
    return static_cast<IndicatorKind>(params.index());
}

IndicatorParameters default_parameters(IndicatorKind kind)
{
    switch (kind) {
        case IndicatorKind::HeikenAshi: return HeikenAshiParameters{};
        case IndicatorKind::Sequential: return SequentialParameters{};
        case IndicatorKind::Bands: return BandParameters{};
    }
    return HeikenAshiParameters{};
}

bool validate_parameters(const HeikenAshiParameters&, std::string& error)
{
    error.clear();
    return true;
}

bool validate_parameters(const SequentialParameters& params, std::string& error)
{
    if (params.setup_lookback < 1) {
        error = "Setup lookback must be >= 1";
        return false;
    }
    if (params.countdown_lookback < 1) {
        error = "Countdown lookback must be >= 1";
        return false;
    }
    // Perfection inspects the last four setup bars.
    if (params.setup_target < 4) {
        error = "Setup target must be >= 4";
        return false;
    }
    if (params.countdown_target < 2) {
        error = "Countdown target must be >= 2";
        return false;
    }
    if (params.qualifier_bar < 1 || params.qualifier_bar >= params.countdown_target) {
        error = "Qualifier bar must lie in [1, countdown target)";
        return false;
    }
    error.clear();
    return true;
}

bool validate_parameters(const BandParameters& params, std::string& error)
{
    if (params.period < 2) {
        error = "Band period must be >= 2";
        return false;
    }
    if (params.multipliers.empty()) {
        error = "Band multiplier set is empty";
        return false;
    }
    std::set<int> seen;
    for (int k : params.multipliers) {
        if (k <= 0) {
            error = "Band multipliers must be positive, got " + std::to_string(k);
            return false;
        }
        if (!seen.insert(k).second) {
            error = "Band multiplier " + std::to_string(k) + " is listed twice";
            return false;
        }
    }
    error.clear();
    return true;
}

bool validate_parameters(const IndicatorParameters& params, std::string& error)
{
    return std::visit([&error](const auto& p) { return validate_parameters(p, error); }, params);
}

std::string_view to_string(TdstSource source)
{
    switch (source) {
        case TdstSource::HighLow: return "high_low";
        case TdstSource::TrueRange: return "true_range";
    }
    return "unknown";
}

std::optional<TdstSource> parse_tdst_source(std::string_view text)
{
    if (text == "high_low" || text == "highlow" || text == "HIGH LOW") {
        return TdstSource::HighLow;
    }
    if (text == "true_range" || text == "truerange" || text == "TRUE RANGE") {
        return TdstSource::TrueRange;
    }
    return std::nullopt;
}

} // namespace tdcore
