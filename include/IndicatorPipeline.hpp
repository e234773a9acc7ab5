#pragma once

#include "IndicatorEngine.hpp"
#include "IndicatorRequest.hpp"
#include "IndicatorResult.hpp"
#include "Series.hpp"

#include <array>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tdcore {

/// One row of the merged output. Indicator fields are empty when the
/// indicator is disabled, still pending, failed, or lacks history at `index`.
struct MergedBar {
    std::size_t index{0};
    Bar bar;
    std::optional<Bar> heiken_ashi;
    std::optional<SequentialBarState> sequential;
    std::optional<BandBarState> bands;
};

struct IndicatorStatus {
    IndicatorKind kind{IndicatorKind::HeikenAshi};
    std::string name;
    bool pending{true};
    ResultStatus status{ResultStatus::Ok};
    std::string message;
};

struct PipelineSnapshot {
    std::uint64_t series_generation{0};
    std::vector<MergedBar> bars;
    std::vector<IndicatorStatus> indicators;  // enabled indicators only

    const IndicatorStatus* status(IndicatorKind kind) const noexcept;
};

/// Owns the cached raw series and the enabled indicators.
///
/// Every computation starts from the cached raw bars, so a parameter change
/// never depends on earlier output. Finished results are published as
/// immutable shared objects; a result computed for an older request or an
/// older series is dropped instead of published.
class IndicatorPipeline {
public:
    explicit IndicatorPipeline(ExecutionOptions options = {});

    /// Validates and caches `series`, then recomputes every enabled indicator.
    /// An invalid series leaves the pipeline untouched.
    bool load_series(BarSeries series, std::string* error = nullptr);
    void clear_series();
    bool has_series() const;
    std::size_t size() const;

    /// Enables the request's indicator, or replaces its parameters, and
    /// recomputes that indicator alone. Returns the published status
    /// (NoData while no series is loaded).
    ResultStatus configure(IndicatorRequest request);

    /// As configure(), computed on a background task. The future yields false
    /// when the result was superseded before it could be published. The
    /// pipeline must outlive the returned future.
    std::future<bool> configure_async(IndicatorRequest request);

    void disable(IndicatorKind kind);

    /// Enables exactly the listed indicators; only new or changed ones are
    /// recomputed.
    void apply(const PipelineConfig& config);
    PipelineConfig config() const;

    bool is_enabled(IndicatorKind kind) const;

    /// Latest published result for the current series, or nullptr.
    std::shared_ptr<const IndicatorResult> result(IndicatorKind kind) const;

    PipelineSnapshot snapshot() const;

private:
    struct Slot {
        bool enabled{false};
        IndicatorRequest request;
        std::uint64_t generation{0};
        std::uint64_t result_series_generation{0};
        std::shared_ptr<const IndicatorResult> result;
    };

    struct Job {
        IndicatorKind kind{IndicatorKind::HeikenAshi};
        IndicatorRequest request;
        std::uint64_t generation{0};
        std::uint64_t series_generation{0};
        std::shared_ptr<const BarSeries> series;
    };

    static std::size_t slot_index(IndicatorKind kind) noexcept;

    Slot& slot(IndicatorKind kind) noexcept { return slots_[slot_index(kind)]; }
    const Slot& slot(IndicatorKind kind) const noexcept { return slots_[slot_index(kind)]; }

    /// Caller holds mutex_. Returns nothing when no series is cached.
    std::optional<Job> schedule_locked(IndicatorKind kind, IndicatorRequest request);
    std::optional<Job> reschedule_locked(IndicatorKind kind);

    void run_jobs(const std::vector<Job>& jobs);
    bool publish(const Job& job, IndicatorResult result);

    ExecutionOptions options_;
    IndicatorEngine engine_;

    mutable std::mutex mutex_;
    std::shared_ptr<const BarSeries> series_;
    std::uint64_t series_generation_{0};
    std::array<Slot, kAllIndicatorKinds.size()> slots_{};
};

} // namespace tdcore
