#include <gtest/gtest.h>

#include "HeikenAshi.hpp"
#include "IndicatorLibrary.hpp"
#include "IndicatorPipeline.hpp"
#include "Logger.hpp"
#include "test_series_helpers.hpp"

#include <mutex>
#include <string>
#include <vector>

using namespace tdcore;
using test_helpers::declining_closes;
using test_helpers::series_from_closes;

namespace {

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Logger::SetCallback([this](const std::string& message) {
            std::lock_guard<std::mutex> lock(log_mutex_);
            log_.push_back(message);
        });
    }

    void TearDown() override { Logger::ClearCallback(); }

    std::vector<std::string> log_lines()
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        return log_;
    }

    void clear_log()
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        log_.clear();
    }

    static IndicatorRequest sequential(int lookback = 4, PriceSource source = PriceSource::Raw)
    {
        SequentialParameters p;
        p.setup_lookback = lookback;
        p.source = source;
        return IndicatorRequest{p, "TD"};
    }

    static IndicatorRequest bands(int period = 5, std::vector<int> multipliers = {1, 2})
    {
        BandParameters p;
        p.period = period;
        p.multipliers = std::move(multipliers);
        return IndicatorRequest{p, "BB"};
    }

    static IndicatorRequest heiken_ashi() { return IndicatorRequest{HeikenAshiParameters{}, "HA"}; }

    static SequentialSeries sequential_states(const IndicatorPipeline& pipeline)
    {
        auto result = pipeline.result(IndicatorKind::Sequential);
        if (!result) {
            return {};
        }
        const auto* out = std::get_if<SequentialOutput>(&result->output);
        return out ? out->states : SequentialSeries{};
    }

private:
    std::mutex log_mutex_;
    std::vector<std::string> log_;
};

} // namespace

TEST_F(PipelineTest, SnapshotAlignsEveryIndicatorWithBars)
{
    IndicatorPipeline pipeline;
    const auto series = series_from_closes(declining_closes(30));
    ASSERT_TRUE(pipeline.load_series(series));

    EXPECT_EQ(pipeline.configure(heiken_ashi()), ResultStatus::Ok);
    EXPECT_EQ(pipeline.configure(sequential()), ResultStatus::Ok);
    EXPECT_EQ(pipeline.configure(bands(5)), ResultStatus::Ok);

    const auto snap = pipeline.snapshot();
    ASSERT_EQ(snap.bars.size(), series.size());
    ASSERT_EQ(snap.indicators.size(), 3u);

    for (std::size_t i = 0; i < series.size(); ++i) {
        const auto& row = snap.bars[i];
        EXPECT_EQ(row.index, i);
        EXPECT_EQ(row.bar.timestamp, series.timestamp[i]);
        EXPECT_DOUBLE_EQ(row.bar.close, series.close[i]);
        EXPECT_TRUE(row.heiken_ashi.has_value()) << "bar " << i;
        EXPECT_TRUE(row.sequential.has_value()) << "bar " << i;
        EXPECT_EQ(row.bands.has_value(), i >= 4) << "bar " << i;
    }
    EXPECT_EQ(snap.bars[13].sequential->setup_count, 9);
}

TEST_F(PipelineTest, DisabledIndicatorsLeaveFieldsEmpty)
{
    IndicatorPipeline pipeline;
    ASSERT_TRUE(pipeline.load_series(series_from_closes(declining_closes(20))));
    pipeline.configure(bands(5));

    auto snap = pipeline.snapshot();
    EXPECT_EQ(snap.status(IndicatorKind::Sequential), nullptr);
    EXPECT_EQ(snap.status(IndicatorKind::HeikenAshi), nullptr);
    ASSERT_NE(snap.status(IndicatorKind::Bands), nullptr);
    for (const auto& row : snap.bars) {
        EXPECT_FALSE(row.sequential.has_value());
        EXPECT_FALSE(row.heiken_ashi.has_value());
    }

    pipeline.disable(IndicatorKind::Bands);
    snap = pipeline.snapshot();
    EXPECT_TRUE(snap.indicators.empty());
    EXPECT_EQ(pipeline.result(IndicatorKind::Bands), nullptr);
    for (const auto& row : snap.bars) {
        EXPECT_FALSE(row.bands.has_value());
    }
}

TEST_F(PipelineTest, FailuresStayIsolatedPerIndicator)
{
    IndicatorPipeline pipeline;
    ASSERT_TRUE(pipeline.load_series(series_from_closes({10, 9, 8, 7})));

    EXPECT_EQ(pipeline.configure(heiken_ashi()), ResultStatus::Ok);
    EXPECT_EQ(pipeline.configure(sequential()), ResultStatus::NoData);
    EXPECT_EQ(pipeline.configure(bands(1)), ResultStatus::Error);

    const auto snap = pipeline.snapshot();
    ASSERT_NE(snap.status(IndicatorKind::Sequential), nullptr);
    EXPECT_EQ(snap.status(IndicatorKind::Sequential)->status, ResultStatus::NoData);
    EXPECT_EQ(snap.status(IndicatorKind::Bands)->status, ResultStatus::Error);
    EXPECT_FALSE(snap.status(IndicatorKind::Bands)->message.empty());
    EXPECT_FALSE(snap.status(IndicatorKind::Bands)->pending);

    for (const auto& row : snap.bars) {
        EXPECT_TRUE(row.heiken_ashi.has_value());
        EXPECT_FALSE(row.sequential.has_value());
        EXPECT_FALSE(row.bands.has_value());
    }
}

TEST_F(PipelineTest, ConfigureWithoutSeriesComputesOnLoad)
{
    IndicatorPipeline pipeline;
    EXPECT_EQ(pipeline.configure(sequential()), ResultStatus::NoData);
    EXPECT_TRUE(pipeline.is_enabled(IndicatorKind::Sequential));

    auto snap = pipeline.snapshot();
    ASSERT_NE(snap.status(IndicatorKind::Sequential), nullptr);
    EXPECT_TRUE(snap.status(IndicatorKind::Sequential)->pending);

    ASSERT_TRUE(pipeline.load_series(series_from_closes(declining_closes(14))));
    auto result = pipeline.result(IndicatorKind::Sequential);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->status, ResultStatus::Ok);
}

TEST_F(PipelineTest, InvalidSeriesIsRejectedAndPreviousKept)
{
    IndicatorPipeline pipeline;
    ASSERT_TRUE(pipeline.load_series(series_from_closes(declining_closes(14))));
    pipeline.configure(sequential());
    const auto before = pipeline.result(IndicatorKind::Sequential);

    auto bad = series_from_closes({1, 2, 3});
    bad.high[1] = 0.0;
    std::string error;
    EXPECT_FALSE(pipeline.load_series(bad, &error));
    EXPECT_NE(error.find("Bar 1"), std::string::npos) << error;

    EXPECT_EQ(pipeline.size(), 14u);
    EXPECT_EQ(pipeline.result(IndicatorKind::Sequential), before);
}

TEST_F(PipelineTest, NewSeriesReplacesResults)
{
    IndicatorPipeline pipeline;
    ASSERT_TRUE(pipeline.load_series(series_from_closes(declining_closes(30))));
    pipeline.configure(sequential());
    ASSERT_EQ(sequential_states(pipeline).size(), 30u);

    ASSERT_TRUE(pipeline.load_series(series_from_closes(declining_closes(14))));
    EXPECT_EQ(sequential_states(pipeline).size(), 14u);
    EXPECT_EQ(pipeline.snapshot().bars.size(), 14u);

    pipeline.clear_series();
    EXPECT_FALSE(pipeline.has_series());
    EXPECT_EQ(pipeline.result(IndicatorKind::Sequential), nullptr);
    EXPECT_TRUE(pipeline.snapshot().bars.empty());
}

TEST_F(PipelineTest, RecomputeIsDeterministic)
{
    IndicatorPipeline pipeline;
    ASSERT_TRUE(pipeline.load_series(series_from_closes(declining_closes(40))));

    SequentialParameters shorter;
    shorter.setup_target = 5;

    pipeline.configure(sequential(4));
    const auto first = sequential_states(pipeline);
    pipeline.configure(IndicatorRequest{shorter, "TD"});
    const auto other = sequential_states(pipeline);
    pipeline.configure(sequential(4));
    const auto again = sequential_states(pipeline);

    EXPECT_EQ(first, again);
    EXPECT_NE(first, other);
}

TEST_F(PipelineTest, HeikenAshiSourceFeedsSequential)
{
    IndicatorPipeline pipeline;
    const auto raw = series_from_closes({10, 11, 12, 11, 10, 9, 8, 9, 10, 11, 12, 13, 12, 11, 10, 9});
    ASSERT_TRUE(pipeline.load_series(raw));
    pipeline.configure(sequential(4, PriceSource::HeikenAshi));

    const auto expected = compute_sequential(compute_heiken_ashi(raw), SequentialParameters{});
    EXPECT_EQ(sequential_states(pipeline), expected);
}

TEST_F(PipelineTest, LatestRequestWinsOverStaleAsyncResult)
{
    IndicatorPipeline pipeline;
    const auto series = series_from_closes(declining_closes(200));
    ASSERT_TRUE(pipeline.load_series(series));

    auto stale = pipeline.configure_async(sequential(2));
    EXPECT_EQ(pipeline.configure(sequential(3)), ResultStatus::Ok);
    stale.get();

    SequentialParameters wanted;
    wanted.setup_lookback = 3;
    EXPECT_EQ(sequential_states(pipeline), compute_sequential(series, wanted));
    EXPECT_EQ(pipeline.config().requests.front(), sequential(3));
}

TEST_F(PipelineTest, AsyncConfigurePublishesWhenCurrent)
{
    IndicatorPipeline pipeline;
    const auto series = series_from_closes(declining_closes(50));
    ASSERT_TRUE(pipeline.load_series(series));

    auto pending = pipeline.configure_async(bands(10, {2}));
    EXPECT_TRUE(pending.get());
    auto result = pipeline.result(IndicatorKind::Bands);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->status, ResultStatus::Ok);
}

TEST_F(PipelineTest, AsyncConfigureWithoutSeriesYieldsFalse)
{
    IndicatorPipeline pipeline;
    EXPECT_FALSE(pipeline.configure_async(heiken_ashi()).get());
}

TEST_F(PipelineTest, ApplyRecomputesOnlyChangedIndicators)
{
    IndicatorPipeline pipeline;
    ASSERT_TRUE(pipeline.load_series(series_from_closes(declining_closes(30))));

    PipelineConfig config;
    config.requests = {heiken_ashi(), sequential(4)};
    pipeline.apply(config);
    const auto ha_before = pipeline.result(IndicatorKind::HeikenAshi);
    const auto td_before = pipeline.result(IndicatorKind::Sequential);
    ASSERT_NE(ha_before, nullptr);
    ASSERT_NE(td_before, nullptr);

    clear_log();
    config.requests = {heiken_ashi(), sequential(3), bands(5)};
    pipeline.apply(config);

    EXPECT_EQ(pipeline.result(IndicatorKind::HeikenAshi), ha_before);
    EXPECT_NE(pipeline.result(IndicatorKind::Sequential), td_before);
    EXPECT_NE(pipeline.result(IndicatorKind::Bands), nullptr);
    EXPECT_EQ(pipeline.config(), config);

    bool saw_two = false;
    for (const auto& line : log_lines()) {
        if (line.rfind("Recomputed 2 indicator(s)", 0) == 0) {
            saw_two = true;
        }
    }
    EXPECT_TRUE(saw_two);

    config.requests = {bands(5)};
    pipeline.apply(config);
    EXPECT_FALSE(pipeline.is_enabled(IndicatorKind::HeikenAshi));
    EXPECT_FALSE(pipeline.is_enabled(IndicatorKind::Sequential));
    EXPECT_TRUE(pipeline.is_enabled(IndicatorKind::Bands));
}

TEST_F(PipelineTest, ComputeIndicatorReportsHistoryShortfall)
{
    const auto series = series_from_closes({1, 2, 3});
    auto result = compute_indicator(series, bands(5));
    EXPECT_EQ(result.status, ResultStatus::NoData);
    EXPECT_TRUE(result.success());
    EXPECT_FALSE(result.has_output());
    EXPECT_EQ(result.name, "BB");

    EXPECT_EQ(minimum_history(SequentialParameters{}), 6u);
    EXPECT_EQ(minimum_history(HeikenAshiParameters{}), 1u);
}
