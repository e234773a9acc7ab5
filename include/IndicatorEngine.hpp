#pragma once

#include "IndicatorRequest.hpp"
#include "IndicatorResult.hpp"
#include "Series.hpp"

#include <vector>

namespace tdcore {

struct ExecutionOptions {
    bool parallel{true};
};

class IndicatorEngine {
public:
    /// One result per request, in request order. Requests are independent, so
    /// with `parallel` each runs on its own task over the shared series.
    std::vector<IndicatorResult> compute(const BarSeries& series,
                                         const std::vector<IndicatorRequest>& requests,
                                         ExecutionOptions options = {}) const;
};

} // namespace tdcore
