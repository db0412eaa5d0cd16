#include "IntervalTable.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

namespace {
constexpr std::time_t kSecondsPerHour = 60 * 60;
constexpr double kMaxHoursLimit = 1.0e7;

const int kDefaultHours[] = {
    0, 1, 2, 3, 5, 9, 13, 20, 30, 45,
    67, 99, 146, 214, 315, 464, 682, 1001, 1471, 2160
};
}

IntervalTable::IntervalTable(std::vector<std::time_t> durations)
    : durations_(std::move(durations))
{
    if (durations_.empty()) {
        throw std::invalid_argument("interval table needs at least one step");
    }
    if (durations_.front() != 0) {
        throw std::invalid_argument("interval table must start at 0");
    }
    for (std::size_t i = 1; i < durations_.size(); ++i) {
        if (durations_[i] < durations_[i - 1]) {
            throw std::invalid_argument("interval table decreases at step " + std::to_string(i));
        }
    }
    spdlog::debug("IntervalTable: {} steps, last={}s", durations_.size(), durations_.back());
}

IntervalTable IntervalTable::defaults() {
    std::vector<std::time_t> d;
    d.reserve(sizeof(kDefaultHours) / sizeof(kDefaultHours[0]));
    for (int h : kDefaultHours) {
        d.push_back(static_cast<std::time_t>(h) * kSecondsPerHour);
    }
    return IntervalTable(std::move(d));
}

IntervalTable IntervalTable::fromGrowth(int steps, double maxHours) {
    if (steps < 1 || steps > kMaxSteps) {
        throw std::invalid_argument("steps must be in [1, " + std::to_string(kMaxSteps) + "], got "
            + std::to_string(steps));
    }
    if (!(maxHours >= 0.0) || maxHours > kMaxHoursLimit) {
        throw std::invalid_argument("max hours must be in [0, 1e7]");
    }

    std::vector<std::time_t> d(static_cast<std::size_t>(steps), 0);
    if (steps > 1) {
        // exp(0) - 1 == 0, so entry 0 stays exactly 0
        const double c = std::log(maxHours + 1.0) / static_cast<double>(steps - 1);
        for (int n = 1; n < steps; ++n) {
            double hours = std::exp(n * c) - 1.0;
            d[n] = static_cast<std::time_t>(hours * kSecondsPerHour);
        }
        // rounding noise must not break monotonicity
        for (std::size_t i = 1; i < d.size(); ++i) {
            if (d[i] < d[i - 1]) d[i] = d[i - 1];
        }
    }

    spdlog::info("IntervalTable from growth: steps={}, max_hours={}", steps, maxHours);
    return IntervalTable(std::move(d));
}

std::time_t IntervalTable::durationAt(std::size_t step) const {
    if (step >= durations_.size()) {
        spdlog::error("IntervalTable: step {} out of range [0, {})", step, durations_.size());
        throw std::out_of_range("interval step " + std::to_string(step) +
            " out of range [0, " + std::to_string(durations_.size()) + ")");
    }
    return durations_[step];
}
