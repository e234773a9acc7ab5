#pragma once

#include "BandCalculator.hpp"
#include "IndicatorId.hpp"
#include "SequentialEngine.hpp"
#include "Series.hpp"

#include <string>
#include <variant>

namespace tdcore {

enum class ResultStatus : std::uint8_t {
    Ok,
    NoData,  // the whole series is shorter than the indicator's minimum history
    Error,   // invalid parameters or invalid input bars
};

struct HeikenAshiOutput {
    BarSeries candles;
};

struct SequentialOutput {
    SequentialSeries states;
};

struct BandOutput {
    BandSeries bands;
};

using IndicatorOutput = std::variant<std::monostate, HeikenAshiOutput, SequentialOutput, BandOutput>;

struct IndicatorResult {
    std::string name;
    IndicatorKind kind{IndicatorKind::HeikenAshi};
    ResultStatus status{ResultStatus::Ok};
    std::string error_message;
    IndicatorOutput output;

    bool success() const noexcept { return status != ResultStatus::Error; }
    bool has_output() const noexcept { return status == ResultStatus::Ok; }
};

std::string_view to_string(ResultStatus status);

} // namespace tdcore
