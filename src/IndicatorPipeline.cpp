#include "IndicatorPipeline.hpp"

#include "IndicatorLibrary.hpp"
#include "Logger.hpp"

#include <chrono>
#include <sstream>
#include <utility>

namespace tdcore {

const IndicatorStatus* PipelineSnapshot::status(IndicatorKind kind) const noexcept
{
    for (const auto& entry : indicators) {
        if (entry.kind == kind) {
            return &entry;
        }
    }
    return nullptr;
}

IndicatorPipeline::IndicatorPipeline(ExecutionOptions options)
    : options_(options)
{
}

std::size_t IndicatorPipeline::slot_index(IndicatorKind kind) noexcept
{
    return static_cast<std::size_t>(kind);
}

bool IndicatorPipeline::load_series(BarSeries series, std::string* error)
{
    std::string message;
    if (!validate_series(series, message)) {
        Logger::Log("Rejected bar series: " + message);
        if (error) {
            *error = message;
        }
        return false;
    }

    const std::size_t bar_count = series.size();
    std::vector<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        series_ = std::make_shared<const BarSeries>(std::move(series));
        ++series_generation_;
        for (IndicatorKind kind : kAllIndicatorKinds) {
            if (auto job = reschedule_locked(kind)) {
                jobs.push_back(std::move(*job));
            }
        }
    }

    Logger::Log("Loaded " + std::to_string(bar_count) + " bars, recomputing "
                + std::to_string(jobs.size()) + " indicator(s)");
    run_jobs(jobs);

    if (error) {
        error->clear();
    }
    return true;
}

void IndicatorPipeline::clear_series()
{
    std::lock_guard<std::mutex> lock(mutex_);
    series_.reset();
    ++series_generation_;
    for (auto& entry : slots_) {
        entry.result.reset();
    }
}

bool IndicatorPipeline::has_series() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(series_);
}

std::size_t IndicatorPipeline::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return series_ ? series_->size() : 0;
}

ResultStatus IndicatorPipeline::configure(IndicatorRequest request)
{
    const IndicatorKind kind = kind_of(request.params);
    std::optional<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = schedule_locked(kind, std::move(request));
    }

    if (!job) {
        return ResultStatus::NoData;
    }

    run_jobs({*job});

    std::lock_guard<std::mutex> lock(mutex_);
    const auto& current = slot(kind);
    if (current.result && current.result_series_generation == series_generation_) {
        return current.result->status;
    }
    return ResultStatus::NoData;
}

std::future<bool> IndicatorPipeline::configure_async(IndicatorRequest request)
{
    const IndicatorKind kind = kind_of(request.params);
    std::optional<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = schedule_locked(kind, std::move(request));
    }

    if (!job) {
        std::promise<bool> nothing;
        nothing.set_value(false);
        return nothing.get_future();
    }

    return std::async(std::launch::async, [this, pending = std::move(*job)]() {
        return publish(pending, compute_indicator(*pending.series, pending.request));
    });
}

void IndicatorPipeline::disable(IndicatorKind kind)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = slot(kind);
    entry.enabled = false;
    ++entry.generation;
    entry.result.reset();
}

void IndicatorPipeline::apply(const PipelineConfig& config)
{
    std::array<std::optional<IndicatorRequest>, kAllIndicatorKinds.size()> wanted;
    for (const auto& request : config.requests) {
        wanted[slot_index(kind_of(request.params))] = request;
    }

    std::vector<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (IndicatorKind kind : kAllIndicatorKinds) {
            auto& entry = slot(kind);
            const auto& target = wanted[slot_index(kind)];

            if (!target) {
                if (entry.enabled) {
                    entry.enabled = false;
                    ++entry.generation;
                    entry.result.reset();
                }
                continue;
            }
            if (entry.enabled && entry.request == *target) {
                continue;
            }
            if (auto job = schedule_locked(kind, *target)) {
                jobs.push_back(std::move(*job));
            }
        }
    }

    run_jobs(jobs);
}

PipelineConfig IndicatorPipeline::config() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    PipelineConfig out;
    for (const auto& entry : slots_) {
        if (entry.enabled) {
            out.requests.push_back(entry.request);
        }
    }
    return out;
}

bool IndicatorPipeline::is_enabled(IndicatorKind kind) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return slot(kind).enabled;
}

std::shared_ptr<const IndicatorResult> IndicatorPipeline::result(IndicatorKind kind) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& entry = slot(kind);
    if (!entry.enabled || entry.result_series_generation != series_generation_) {
        return nullptr;
    }
    return entry.result;
}

PipelineSnapshot IndicatorPipeline::snapshot() const
{
    PipelineSnapshot snap;
    std::shared_ptr<const BarSeries> series;
    std::array<std::shared_ptr<const IndicatorResult>, kAllIndicatorKinds.size()> results;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        series = series_;
        snap.series_generation = series_generation_;
        for (IndicatorKind kind : kAllIndicatorKinds) {
            const auto& entry = slot(kind);
            if (!entry.enabled) {
                continue;
            }

            IndicatorStatus status;
            status.kind = kind;
            status.name = entry.request.name.empty() ? std::string(to_string(kind)) : entry.request.name;
            if (entry.result && entry.result_series_generation == series_generation_) {
                results[slot_index(kind)] = entry.result;
                status.pending = false;
                status.status = entry.result->status;
                status.message = entry.result->error_message;
            }
            snap.indicators.push_back(std::move(status));
        }
    }

    if (!series) {
        return snap;
    }

    const std::size_t n = series->size();
    snap.bars.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        snap.bars[i].index = i;
        snap.bars[i].bar = series->bar(i);
    }

    for (const auto& result : results) {
        if (!result || !result->has_output()) {
            continue;
        }
        if (const auto* ha = std::get_if<HeikenAshiOutput>(&result->output)) {
            for (std::size_t i = 0; i < n && i < ha->candles.size(); ++i) {
                snap.bars[i].heiken_ashi = ha->candles.bar(i);
            }
        } else if (const auto* seq = std::get_if<SequentialOutput>(&result->output)) {
            for (std::size_t i = 0; i < n && i < seq->states.size(); ++i) {
                snap.bars[i].sequential = seq->states[i];
            }
        } else if (const auto* bands = std::get_if<BandOutput>(&result->output)) {
            for (std::size_t i = 0; i < n && i < bands->bands.size(); ++i) {
                snap.bars[i].bands = bands->bands[i];
            }
        }
    }

    return snap;
}

std::optional<IndicatorPipeline::Job> IndicatorPipeline::schedule_locked(IndicatorKind kind, IndicatorRequest request)
{
    auto& entry = slot(kind);
    entry.enabled = true;
    entry.request = std::move(request);
    return reschedule_locked(kind);
}

std::optional<IndicatorPipeline::Job> IndicatorPipeline::reschedule_locked(IndicatorKind kind)
{
    auto& entry = slot(kind);
    if (!entry.enabled) {
        return std::nullopt;
    }
    ++entry.generation;
    if (!series_) {
        return std::nullopt;
    }

    Job job;
    job.kind = kind;
    job.request = entry.request;
    job.generation = entry.generation;
    job.series_generation = series_generation_;
    job.series = series_;
    return job;
}

void IndicatorPipeline::run_jobs(const std::vector<Job>& jobs)
{
    if (jobs.empty()) {
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();

    // Jobs scheduled together always share one series snapshot.
    std::vector<IndicatorRequest> requests;
    requests.reserve(jobs.size());
    for (const auto& job : jobs) {
        requests.push_back(job.request);
    }
    auto results = engine_.compute(*jobs.front().series, requests, options_);

    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    std::size_t published = 0;
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        if (publish(jobs[i], std::move(results[i]))) {
            ++published;
        }
    }

    Logger::Log("Recomputed " + std::to_string(jobs.size()) + " indicator(s) in "
                + std::to_string(elapsed.count()) + " ms, published " + std::to_string(published));
}

bool IndicatorPipeline::publish(const Job& job, IndicatorResult result)
{
    const std::string name = result.name;
    const ResultStatus status = result.status;
    const std::string message = result.error_message;

    bool current = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = slot(job.kind);
        current = entry.enabled && entry.generation == job.generation
                  && series_generation_ == job.series_generation;
        if (current) {
            entry.result = std::make_shared<const IndicatorResult>(std::move(result));
            entry.result_series_generation = job.series_generation;
        }
    }

    if (!current) {
        Logger::Log("Discarded stale result for " + name);
        return false;
    }

    if (status != ResultStatus::Ok) {
        std::ostringstream oss;
        oss << name << ": " << to_string(status) << " (" << message << ")";
        Logger::Log(oss.str());
    }
    return true;
}

} // namespace tdcore
