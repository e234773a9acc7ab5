#include "SequentialEngine.hpp"

#include "MathUtils.hpp"

#include <algorithm>
#include <span>
#include <stdexcept>

namespace tdcore {

namespace {

TradeDirection opposite(TradeDirection direction) noexcept
{
    switch (direction) {
        case TradeDirection::Buy: return TradeDirection::Sell;
        case TradeDirection::Sell: return TradeDirection::Buy;
        case TradeDirection::None: break;
    }
    return TradeDirection::None;
}

} // namespace

std::string CountdownValue::label() const
{
    if (kind_ == Kind::Deferred) {
        return std::to_string(count_) + "+";
    }
    return count_ > 0 ? std::to_string(count_) : std::string();
}

SequentialStateMachine::SequentialStateMachine(SequentialParameters params)
    : params_(params)
{
    std::string error;
    if (!validate_parameters(params_, error)) {
        throw std::invalid_argument(error);
    }
}

SequentialBarState SequentialStateMachine::step(const BarSeries& series, std::size_t index)
{
    if (index != next_index_ || index >= series.size()) {
        throw std::logic_error("SequentialStateMachine::step called out of order (expected bar "
                               + std::to_string(next_index_) + ", got " + std::to_string(index) + ")");
    }
    ++next_index_;

    SequentialBarState state;
    update_setup(series, index, state);

    if (state.setup_count == params_.setup_target) {
        complete_setup(series, index, state);
    } else {
        update_countdown(series, index, state);
    }

    state.tdst = tdst_;
    if (countdown_direction_ != TradeDirection::None) {
        state.countdown_direction = countdown_direction_;
        state.countdown = countdown_deferred_ ? CountdownValue::deferred(params_.countdown_target)
                                              : CountdownValue::counted(countdown_count_);
    }

    if (state.countdown_completed) {
        reset_countdown();
    }
    return state;
}

void SequentialStateMachine::update_setup(const BarSeries& series, std::size_t index, SequentialBarState& state)
{
    const auto lookback = static_cast<std::size_t>(params_.setup_lookback);
    if (index < lookback + 1) {
        return;
    }

    const auto& close = series.close;
    const bool below = close[index] < close[index - lookback];
    const bool above = close[index] > close[index - lookback];

    if (below && close[index - 1] >= close[index - 1 - lookback]) {
        state.price_flip = PriceFlip::Bearish;
        setup_direction_ = TradeDirection::Buy;
        setup_count_ = 1;
        setup_start_ = index;
    } else if (above && close[index - 1] <= close[index - 1 - lookback]) {
        state.price_flip = PriceFlip::Bullish;
        setup_direction_ = TradeDirection::Sell;
        setup_count_ = 1;
        setup_start_ = index;
    } else if ((setup_direction_ == TradeDirection::Buy && below)
               || (setup_direction_ == TradeDirection::Sell && above)) {
        ++setup_count_;
    } else {
        setup_direction_ = TradeDirection::None;
        setup_count_ = 0;
    }

    if (setup_direction_ == TradeDirection::None) {
        return;
    }

    state.setup_direction = setup_direction_;
    state.setup_count = setup_count_;

    // A setup ends at its target; the next one needs a fresh flip.
    if (setup_count_ == params_.setup_target) {
        setup_direction_ = TradeDirection::None;
        setup_count_ = 0;
    }
}

void SequentialStateMachine::complete_setup(const BarSeries& series, std::size_t index, SequentialBarState& state)
{
    const auto direction = state.setup_direction;
    const std::span<const double> high(series.high.data(), series.high.size());
    const std::span<const double> low(series.low.data(), series.low.size());
    const std::span<const double> close(series.close.data(), series.close.size());

    // Bars target-3 .. target of the setup are index-3 .. index.
    if (direction == TradeDirection::Buy) {
        const double reference = std::min(low[index - 3], low[index - 2]);
        state.setup_perfected = low[index - 1] <= reference || low[index] <= reference;
    } else {
        const double reference = std::max(high[index - 3], high[index - 2]);
        state.setup_perfected = high[index - 1] >= reference || high[index] >= reference;
    }

    const bool true_range = params_.tdst_source == TdstSource::TrueRange;
    TdstLevel level;
    level.origin_index = index;
    if (direction == TradeDirection::Buy) {
        level.side = TdstSide::Resistance;
        level.price = true_range ? true_high(high, close, setup_start_) : high[setup_start_];
        for (std::size_t i = setup_start_ + 1; i <= index; ++i) {
            level.price = std::max(level.price, true_range ? true_high(high, close, i) : high[i]);
        }
    } else {
        level.side = TdstSide::Support;
        level.price = true_range ? true_low(low, close, setup_start_) : low[setup_start_];
        for (std::size_t i = setup_start_ + 1; i <= index; ++i) {
            level.price = std::min(level.price, true_range ? true_low(low, close, i) : low[i]);
        }
    }
    tdst_ = level;

    // An unfinished countdown against this setup is invalidated; one in the
    // same direction is restarted from the new setup.
    if (countdown_direction_ == opposite(direction)) {
        state.countdown_cancelled = true;
    }

    reset_countdown();
    countdown_direction_ = direction;
    countdown_armed_at_ = index;
}

void SequentialStateMachine::update_countdown(const BarSeries& series, std::size_t index, SequentialBarState& state)
{
    if (countdown_direction_ == TradeDirection::None || index <= countdown_armed_at_) {
        return;
    }

    const double close = series.close[index];
    const bool buy = countdown_direction_ == TradeDirection::Buy;

    if (tdst_) {
        const bool broken = buy ? (tdst_->side == TdstSide::Resistance && close > tdst_->price)
                                : (tdst_->side == TdstSide::Support && close < tdst_->price);
        if (broken) {
            state.countdown_cancelled = true;
            reset_countdown();
            return;
        }
    }

    const auto lookback = static_cast<std::size_t>(params_.countdown_lookback);
    if (index < lookback) {
        return;
    }

    const bool qualifies = buy ? close <= series.low[index - lookback]
                               : close >= series.high[index - lookback];
    if (!qualifies) {
        return;
    }
    state.countdown_advanced = true;

    if (!countdown_deferred_) {
        ++countdown_count_;
        if (countdown_count_ == params_.qualifier_bar) {
            qualifier_close_ = close;
        }
        if (countdown_count_ < params_.countdown_target) {
            return;
        }
    }

    if (passes_qualifier(close)) {
        countdown_deferred_ = false;
        countdown_count_ = params_.countdown_target;
        state.countdown_completed = true;
    } else {
        countdown_deferred_ = true;
    }
}

bool SequentialStateMachine::passes_qualifier(double close) const noexcept
{
    return countdown_direction_ == TradeDirection::Buy ? close <= qualifier_close_
                                                       : close >= qualifier_close_;
}

void SequentialStateMachine::reset_countdown() noexcept
{
    countdown_direction_ = TradeDirection::None;
    countdown_count_ = 0;
    countdown_deferred_ = false;
    countdown_armed_at_ = 0;
    qualifier_close_ = 0.0;
}

SequentialSeries compute_sequential(const BarSeries& series, const SequentialParameters& params)
{
    SequentialStateMachine machine(params);
    SequentialSeries states;
    states.reserve(series.size());
    for (std::size_t i = 0; i < series.size(); ++i) {
        states.push_back(machine.step(series, i));
    }
    return states;
}

std::string_view to_string(PriceFlip flip)
{
    switch (flip) {
        case PriceFlip::None: return "none";
        case PriceFlip::Bullish: return "bullish";
        case PriceFlip::Bearish: return "bearish";
    }
    return "unknown";
}

std::string_view to_string(TradeDirection direction)
{
    switch (direction) {
        case TradeDirection::None: return "none";
        case TradeDirection::Buy: return "buy";
        case TradeDirection::Sell: return "sell";
    }
    return "unknown";
}

std::string_view to_string(TdstSide side)
{
    switch (side) {
        case TdstSide::Resistance: return "resistance";
        case TdstSide::Support: return "support";
    }
    return "unknown";
}

} // namespace tdcore
