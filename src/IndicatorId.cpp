#include "IndicatorId.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace tdcore {

namespace {

std::string normalize(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        if (ch == '_' || ch == '-') {
            ch = ' ';
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    out.erase(0, out.find_first_not_of(' '));
    out.erase(out.find_last_not_of(' ') + 1);
    return out;
}

} // namespace

std::string_view to_string(IndicatorKind kind)
{
    switch (kind) {
        case IndicatorKind::HeikenAshi: return "HEIKEN ASHI";
        case IndicatorKind::Sequential: return "TD SEQUENTIAL";
        case IndicatorKind::Bands: return "BOLLINGER BANDS";
    }
    return "UNKNOWN";
}

std::string_view to_string(PriceSource source)
{
    switch (source) {
        case PriceSource::Raw: return "raw";
        case PriceSource::HeikenAshi: return "heiken_ashi";
    }
    return "unknown";
}

std::string_view to_string(MovingAverageKind kind)
{
    switch (kind) {
        case MovingAverageKind::Simple: return "sma";
        case MovingAverageKind::Exponential: return "ema";
    }
    return "unknown";
}

std::optional<IndicatorKind> parse_indicator_kind(std::string_view text)
{
    static const std::map<std::string, IndicatorKind> kind_map = {
        {"HEIKEN ASHI", IndicatorKind::HeikenAshi},
        {"HEIKIN ASHI", IndicatorKind::HeikenAshi},
        {"HA", IndicatorKind::HeikenAshi},
        {"TD SEQUENTIAL", IndicatorKind::Sequential},
        {"SEQUENTIAL", IndicatorKind::Sequential},
        {"TD", IndicatorKind::Sequential},
        {"BOLLINGER BANDS", IndicatorKind::Bands},
        {"BOLLINGER", IndicatorKind::Bands},
        {"BANDS", IndicatorKind::Bands},
        {"BB", IndicatorKind::Bands},
    };

    auto it = kind_map.find(normalize(text));
    if (it != kind_map.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<PriceSource> parse_price_source(std::string_view text)
{
    const auto key = normalize(text);
    if (key == "RAW" || key == "CLOSE" || key == "PRICE") {
        return PriceSource::Raw;
    }
    if (key == "HEIKEN ASHI" || key == "HEIKIN ASHI" || key == "HA") {
        return PriceSource::HeikenAshi;
    }
    return std::nullopt;
}

std::optional<MovingAverageKind> parse_moving_average_kind(std::string_view text)
{
    const auto key = normalize(text);
    if (key == "SMA" || key == "SIMPLE") {
        return MovingAverageKind::Simple;
    }
    if (key == "EMA" || key == "EXPONENTIAL") {
        return MovingAverageKind::Exponential;
    }
    return std::nullopt;
}

} // namespace tdcore
