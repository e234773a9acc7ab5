#include "IndicatorEngine.hpp"

#include "IndicatorLibrary.hpp"

#include <future>
#include <utility>

namespace tdcore {

std::vector<IndicatorResult> IndicatorEngine::compute(
    const BarSeries& series,
    const std::vector<IndicatorRequest>& requests,
    ExecutionOptions options) const
{
    std::vector<IndicatorResult> results(requests.size());

    if (options.parallel && requests.size() > 1) {
        std::vector<std::future<void>> tasks;
        tasks.reserve(requests.size());
        for (std::size_t i = 0; i < requests.size(); ++i) {
            tasks.emplace_back(std::async(std::launch::async, [&, i]() {
                results[i] = compute_indicator(series, requests[i]);
            }));
        }
        for (auto& task : tasks) {
            task.get();
        }
    } else {
        for (std::size_t i = 0; i < requests.size(); ++i) {
            results[i] = compute_indicator(series, requests[i]);
        }
    }

    return results;
}

} // namespace tdcore
