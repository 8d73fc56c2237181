#pragma once

#include <string>
#include <vector>

namespace board_placement {

struct TickSet {
    double step = 0;
    std::vector<double> values;
};

// "Nice" tick values for [lo, hi]: the step is snapped to {1, 2, 2.5, 5, 10} x 10^n.
// Empty when the range is empty or too wide for a finite step.
TickSet compute_nice_ticks(double lo, double hi, int target_count = 5);

// Formats a tick value with as many decimals as the step needs.
std::string format_tick(double value, double step);

} // namespace board_placement
