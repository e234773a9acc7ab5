#pragma once

#include "IndicatorId.hpp"

#include <string>
#include <variant>
#include <vector>

namespace tdcore {

/// Where TDST levels take their extreme prices from.
enum class TdstSource : std::uint8_t {
    HighLow,    // highest high / lowest low of the setup bars
    TrueRange,  // high and low widened by the previous close
};

struct HeikenAshiParameters {
    bool operator==(const HeikenAshiParameters&) const = default;
};

struct SequentialParameters {
    int setup_lookback{4};
    int countdown_lookback{2};
    int setup_target{9};
    int countdown_target{13};
    int qualifier_bar{8};
    TdstSource tdst_source{TdstSource::HighLow};
    PriceSource source{PriceSource::Raw};

    bool operator==(const SequentialParameters&) const = default;
};

struct BandParameters {
    int period{20};
    MovingAverageKind ma_kind{MovingAverageKind::Simple};
    std::vector<int> multipliers{2};
    PriceSource source{PriceSource::Raw};

    bool operator==(const BandParameters&) const = default;
};

/// One alternative per indicator kind; the index order matches IndicatorKind.
using IndicatorParameters = std::variant<HeikenAshiParameters, SequentialParameters, BandParameters>;

struct IndicatorRequest {
    IndicatorParameters params{};
    std::string name;

    bool operator==(const IndicatorRequest&) const = default;
};

/// The set of enabled indicators with their parameters; at most one request
/// per kind is honoured (the last one listed).
struct PipelineConfig {
    std::vector<IndicatorRequest> requests;

    bool operator==(const PipelineConfig&) const = default;
};

IndicatorKind kind_of(const IndicatorParameters& params) noexcept;

/// Default-constructed parameters for `kind`.
IndicatorParameters default_parameters(IndicatorKind kind);

bool validate_parameters(const HeikenAshiParameters& params, std::string& error);
bool validate_parameters(const SequentialParameters& params, std::string& error);
bool validate_parameters(const BandParameters& params, std::string& error);
bool validate_parameters(const IndicatorParameters& params, std::string& error);

std::string_view to_string(TdstSource source);
std::optional<TdstSource> parse_tdst_source(std::string_view text);

} // namespace tdcore
