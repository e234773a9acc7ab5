#include "TaskExecutor.hpp"

#include "IndicatorLibrary.hpp"
#include "Logger.hpp"
#include "validation/DataParsers.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace tdcore {

namespace {

TaskResult run_task(const BarSeries& series, const IndicatorTask& task)
{
    auto start = std::chrono::high_resolution_clock::now();
    auto indicator_result = compute_indicator(series, task.request);
    auto end = std::chrono::high_resolution_clock::now();

    TaskResult result;
    result.variable_name = task.variable_name;
    result.result = std::move(indicator_result);
    result.definition_index = task.definition_index;
    result.computation_time_ms =
        std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

void set_error(std::string* error, const std::string& message)
{
    Logger::Log(message);
    if (error) {
        *error = message;
    }
}

} // anonymous namespace

TaskExecutor::TaskExecutor(int num_threads)
    : num_threads_(num_threads)
{
    if (num_threads_ <= 0) {
        num_threads_ = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }
}

std::vector<TaskResult> TaskExecutor::execute_parallel(
    const BarSeries& series,
    const std::vector<IndicatorTask>& tasks,
    ProgressCallback progress_callback)
{
    if (tasks.empty()) {
        return {};
    }

    const int total_count = static_cast<int>(tasks.size());
    std::vector<TaskResult> results(tasks.size());
    std::atomic<int> next_task_index{0};
    std::atomic<int> completed_count{0};

    const int worker_count = std::min(num_threads_, total_count);
    std::vector<std::thread> workers;
    workers.reserve(worker_count);

    for (int i = 0; i < worker_count; ++i) {
        workers.emplace_back([&]() {
            worker_thread(series, tasks, results, next_task_index,
                          completed_count, total_count, progress_callback);
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    return results;
}

std::vector<TaskResult> TaskExecutor::execute_sequential(
    const BarSeries& series,
    const std::vector<IndicatorTask>& tasks,
    ProgressCallback progress_callback)
{
    std::vector<TaskResult> results;
    results.reserve(tasks.size());

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        results.push_back(run_task(series, tasks[i]));

        if (progress_callback) {
            progress_callback(static_cast<int>(i + 1),
                              static_cast<int>(tasks.size()),
                              tasks[i].variable_name);
        }
    }

    return results;
}

void TaskExecutor::worker_thread(
    const BarSeries& series,
    const std::vector<IndicatorTask>& tasks,
    std::vector<TaskResult>& results,
    std::atomic<int>& next_task_index,
    std::atomic<int>& completed_count,
    int total_count,
    const ProgressCallback& progress_callback)
{
    while (true) {
        int task_idx = next_task_index.fetch_add(1);
        if (task_idx >= static_cast<int>(tasks.size())) {
            break;
        }

        // Each worker writes only its own slot
        results[task_idx] = run_task(series, tasks[task_idx]);

        int completed = completed_count.fetch_add(1) + 1;
        if (progress_callback) {
            progress_callback(completed, total_count, tasks[task_idx].variable_name);
        }
    }
}

std::vector<IndicatorTask> TaskExecutor::create_tasks_from_definitions(
    const std::vector<IndicatorDefinition>& definitions)
{
    std::vector<IndicatorTask> tasks;
    tasks.reserve(definitions.size());

    for (std::size_t i = 0; i < definitions.size(); ++i) {
        const auto& def = definitions[i];

        IndicatorTask task;
        std::string error;
        if (!IndicatorConfigParser::to_request(def, task.request, error)) {
            Logger::Log("Skipping " + def.variable_name + " (line " + std::to_string(def.line_number)
                        + "): " + error);
            continue;
        }

        task.variable_name = def.variable_name;
        task.definition_index = static_cast<int>(i);
        tasks.push_back(std::move(task));
    }

    return tasks;
}

bool BatchIndicatorComputer::compute_from_files(
    const std::string& ohlcv_file,
    const std::string& config_file,
    const std::string& output_file,
    bool parallel,
    int num_threads,
    ProgressCallback progress_callback,
    std::string* error)
{
    auto config = IndicatorConfigParser::parse_file(config_file);
    if (!config.success) {
        set_error(error, "Error parsing config file: " + config.error_message);
        return false;
    }
    if (config.definitions.empty()) {
        set_error(error, "No indicators defined in " + config_file);
        return false;
    }

    Logger::Log("Parsed " + std::to_string(config.parsed_indicators) + " indicators from " + config_file);

    auto series = validation::OhlcvParser::parse_file(ohlcv_file);
    if (series.empty()) {
        set_error(error, "No data loaded from " + ohlcv_file + ": "
                         + validation::OhlcvParser::get_last_error());
        return false;
    }

    Logger::Log("Loaded " + std::to_string(series.size()) + " bars from " + ohlcv_file);

    auto task_results = compute_from_series(series, config.definitions, parallel,
                                            num_threads, progress_callback);

    std::vector<IndicatorResult> results;
    results.reserve(task_results.size());
    for (auto& task_result : task_results) {
        const auto& r = task_result.result;
        if (r.status != ResultStatus::Ok) {
            Logger::Log(task_result.variable_name + ": " + std::string(to_string(r.status))
                        + " (" + r.error_message + ")");
        }
        results.push_back(std::move(task_result.result));
    }

    std::string write_error;
    if (!IndicatorResultWriter::write_csv(output_file, series, results, &write_error)) {
        set_error(error, "Error writing output: " + write_error);
        return false;
    }

    Logger::Log("Results written to " + output_file);
    if (error) {
        error->clear();
    }
    return true;
}

std::vector<TaskResult> BatchIndicatorComputer::compute_from_series(
    const BarSeries& series,
    const std::vector<IndicatorDefinition>& definitions,
    bool parallel,
    int num_threads,
    ProgressCallback progress_callback)
{
    auto tasks = TaskExecutor::create_tasks_from_definitions(definitions);

    if (tasks.empty()) {
        return {};
    }

    TaskExecutor executor(num_threads);

    if (parallel) {
        return executor.execute_parallel(series, tasks, progress_callback);
    }
    return executor.execute_sequential(series, tasks, progress_callback);
}

} // namespace tdcore
