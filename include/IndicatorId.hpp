#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tdcore {

enum class IndicatorKind : std::uint8_t {
    HeikenAshi,
    Sequential,
    Bands,
};

inline constexpr std::array<IndicatorKind, 3> kAllIndicatorKinds{
    IndicatorKind::HeikenAshi,
    IndicatorKind::Sequential,
    IndicatorKind::Bands,
};

/// Which price series an indicator reads from.
enum class PriceSource : std::uint8_t {
    Raw,
    HeikenAshi,
};

enum class MovingAverageKind : std::uint8_t {
    Simple,
    Exponential,
};

std::string_view to_string(IndicatorKind kind);
std::string_view to_string(PriceSource source);
std::string_view to_string(MovingAverageKind kind);

/// Accepts the display names returned by to_string() and the config-file
/// spellings ("TD SEQUENTIAL", "BOLLINGER BANDS", "HEIKEN ASHI", ...).
std::optional<IndicatorKind> parse_indicator_kind(std::string_view text);
std::optional<PriceSource> parse_price_source(std::string_view text);
std::optional<MovingAverageKind> parse_moving_average_kind(std::string_view text);

} // namespace tdcore
