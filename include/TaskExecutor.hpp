#pragma once

#include "IndicatorConfig.hpp"
#include "IndicatorRequest.hpp"
#include "IndicatorResult.hpp"
#include "Series.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace tdcore {

/// A task to compute a single indicator
struct IndicatorTask {
    std::string variable_name;
    IndicatorRequest request;
    int definition_index = 0;  // Position in the parsed definition list
};

/// Result of executing an indicator task
struct TaskResult {
    std::string variable_name;
    IndicatorResult result;
    int definition_index = 0;
    double computation_time_ms = 0.0;
};

/// Progress callback signature
/// Args: completed_count, total_count, current_indicator_name
using ProgressCallback = std::function<void(int, int, const std::string&)>;

/// Parallel executor for indicator computations
class TaskExecutor {
public:
    /// @param num_threads Number of worker threads (0 = auto-detect)
    explicit TaskExecutor(int num_threads = 0);

    /// Execute all tasks in parallel; results come back in task order
    std::vector<TaskResult> execute_parallel(
        const BarSeries& series,
        const std::vector<IndicatorTask>& tasks,
        ProgressCallback progress_callback = nullptr
    );

    /// Execute tasks sequentially (useful for debugging)
    std::vector<TaskResult> execute_sequential(
        const BarSeries& series,
        const std::vector<IndicatorTask>& tasks,
        ProgressCallback progress_callback = nullptr
    );

    int get_thread_count() const { return num_threads_; }

    /// Create tasks from indicator definitions. Definitions that do not form
    /// a valid request are logged and skipped.
    static std::vector<IndicatorTask> create_tasks_from_definitions(
        const std::vector<IndicatorDefinition>& definitions
    );

private:
    int num_threads_;

    void worker_thread(
        const BarSeries& series,
        const std::vector<IndicatorTask>& tasks,
        std::vector<TaskResult>& results,
        std::atomic<int>& next_task_index,
        std::atomic<int>& completed_count,
        int total_count,
        const ProgressCallback& progress_callback
    );
};

/// High-level API for batch indicator computation
class BatchIndicatorComputer {
public:
    /// Compute all indicators listed in a config file over an OHLCV file
    /// and write them to one CSV
    /// @param ohlcv_file Path to OHLCV data file
    /// @param config_file Path to indicator config (var.txt format)
    /// @param output_file Path to output CSV file
    /// @param parallel Use parallel execution (default: true)
    /// @param num_threads Number of threads (0 = auto-detect)
    /// @param progress_callback Optional progress notification
    /// @param error Receives the reason on failure
    /// @return true if successful
    static bool compute_from_files(
        const std::string& ohlcv_file,
        const std::string& config_file,
        const std::string& output_file,
        bool parallel = true,
        int num_threads = 0,
        ProgressCallback progress_callback = nullptr,
        std::string* error = nullptr
    );

    /// Compute indicators from pre-loaded data
    static std::vector<TaskResult> compute_from_series(
        const BarSeries& series,
        const std::vector<IndicatorDefinition>& definitions,
        bool parallel = true,
        int num_threads = 0,
        ProgressCallback progress_callback = nullptr
    );
};

} // namespace tdcore
