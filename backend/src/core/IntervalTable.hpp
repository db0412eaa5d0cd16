#pragma once
#include <cstddef>
#include <ctime>
#include <vector>

/*
  Review interval per step, in seconds.
  Invariants (checked on construction):
   - at least one entry
   - entry 0 is 0 so a new item is due immediately
   - entries never decrease
*/

class IntervalTable {
public:
    explicit IntervalTable(std::vector<std::time_t> durations);

    // 0,1,2,3,5,9,13,...,1471,2160 hours (20 steps)
    static IntervalTable defaults();

    // table[n] = exp(n * ln(maxHours + 1) / (steps - 1)) - 1 hours
    // Throws std::invalid_argument unless steps is in [1, kMaxSteps]
    static IntervalTable fromGrowth(int steps, double maxHours);

    std::size_t length() const { return durations_.size(); }
    std::size_t lastStep() const { return durations_.size() - 1; }

    // Throws std::out_of_range when step is not in [0, length())
    std::time_t durationAt(std::size_t step) const;

    const std::vector<std::time_t>& durations() const { return durations_; }

    static constexpr int kDefaultSteps = 20;
    static constexpr double kDefaultMaxHours = 24.0 * 90.0;
    static constexpr int kMaxSteps = 10000;

private:
    std::vector<std::time_t> durations_;
};
