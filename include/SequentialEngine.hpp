#pragma once

#include "IndicatorRequest.hpp"
#include "Series.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tdcore {

enum class PriceFlip : std::uint8_t {
    None,
    Bullish,  // close rose above the close `lookback` bars ago
    Bearish,  // close fell below the close `lookback` bars ago
};

enum class TradeDirection : std::uint8_t {
    None,
    Buy,
    Sell,
};

enum class TdstSide : std::uint8_t {
    Resistance,  // recorded by a buy setup
    Support,     // recorded by a sell setup
};

struct TdstLevel {
    double price{0.0};
    TdstSide side{TdstSide::Resistance};
    std::size_t origin_index{0};  // bar that completed the recording setup

    bool operator==(const TdstLevel&) const = default;
};

/// Countdown progress. A countdown whose final bar failed the qualifier is
/// held as Deferred ("13+") rather than as a number.
class CountdownValue {
public:
    enum class Kind : std::uint8_t {
        Count,
        Deferred,
    };

    constexpr CountdownValue() noexcept = default;

    static constexpr CountdownValue counted(int count) noexcept { return CountdownValue(Kind::Count, count); }
    static constexpr CountdownValue deferred(int target) noexcept { return CountdownValue(Kind::Deferred, target); }

    constexpr Kind kind() const noexcept { return kind_; }
    constexpr bool is_deferred() const noexcept { return kind_ == Kind::Deferred; }

    /// Qualifying bars counted so far; for Deferred, the pending target.
    constexpr int count() const noexcept { return count_; }

    /// "" for zero, the count otherwise, "13+" while deferred.
    std::string label() const;

    constexpr bool operator==(const CountdownValue&) const noexcept = default;

private:
    constexpr CountdownValue(Kind kind, int count) noexcept : kind_(kind), count_(count) {}

    Kind kind_{Kind::Count};
    int count_{0};
};

struct SequentialBarState {
    PriceFlip price_flip{PriceFlip::None};

    TradeDirection setup_direction{TradeDirection::None};
    int setup_count{0};
    bool setup_perfected{false};

    /// Most recent TDST level in force on this bar.
    std::optional<TdstLevel> tdst;

    TradeDirection countdown_direction{TradeDirection::None};
    CountdownValue countdown{};
    bool countdown_advanced{false};   // this bar qualified as a countdown bar
    bool countdown_cancelled{false};  // an unfinished countdown was invalidated on this bar
    bool countdown_completed{false};  // the final count was accepted on this bar

    bool operator==(const SequentialBarState&) const = default;
};

using SequentialSeries = std::vector<SequentialBarState>;

/// TD Sequential as a forward-only state machine.
///
/// step() must be fed bars 0, 1, 2, ... of one series in order; every call
/// reads only bars up to the one being stepped.
///
/// Setup:     a bearish flip starts a buy setup and a bullish flip a sell setup,
///            the flip bar being bar 1. A buy setup continues while
///            close < close[lookback] (sell: close >) and stops at the target.
/// Countdown: armed by a completed setup, counts bars strictly after it where
///            close <= low[countdown_lookback] (sell: close >= high[...]).
///            The final bar must close at or beyond the close of the qualifier
///            bar, otherwise the countdown is deferred until a later bar does.
/// Cancel:    an opposite completed setup, or a close through the TDST level
///            recorded by the countdown's own setup.
class SequentialStateMachine {
public:
    /// Throws std::invalid_argument if `params` fails validate_parameters().
    explicit SequentialStateMachine(SequentialParameters params);

    /// Advances over bar `index`. Throws std::logic_error unless `index`
    /// equals processed() and lies inside `series`.
    SequentialBarState step(const BarSeries& series, std::size_t index);

    std::size_t processed() const noexcept { return next_index_; }
    const SequentialParameters& parameters() const noexcept { return params_; }

private:
    void update_setup(const BarSeries& series, std::size_t index, SequentialBarState& state);
    void complete_setup(const BarSeries& series, std::size_t index, SequentialBarState& state);
    void update_countdown(const BarSeries& series, std::size_t index, SequentialBarState& state);
    bool passes_qualifier(double close) const noexcept;
    void reset_countdown() noexcept;

    SequentialParameters params_;
    std::size_t next_index_{0};

    TradeDirection setup_direction_{TradeDirection::None};
    int setup_count_{0};
    std::size_t setup_start_{0};

    std::optional<TdstLevel> tdst_;

    TradeDirection countdown_direction_{TradeDirection::None};
    int countdown_count_{0};
    bool countdown_deferred_{false};
    std::size_t countdown_armed_at_{0};
    double qualifier_close_{0.0};
};

/// Runs the state machine over the whole series. Shorter series than the
/// first flip-capable bar simply produce all-default states.
///
/// Throws std::invalid_argument if `params` fails validate_parameters().
SequentialSeries compute_sequential(const BarSeries& series, const SequentialParameters& params);

std::string_view to_string(PriceFlip flip);
std::string_view to_string(TradeDirection direction);
std::string_view to_string(TdstSide side);

} // namespace tdcore
