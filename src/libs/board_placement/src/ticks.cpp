#include <board_placement/ticks.hpp>
#include <cmath>
#include <cstdio>

namespace board_placement {

namespace {

// Upper bound on ticks per axis; anything above means the step collapsed.
constexpr double max_tick_count = 1000.0;

} // namespace

TickSet compute_nice_ticks(double lo, double hi, int target_count) {
    TickSet out;
    if (!(hi > lo) || target_count < 1) return out;

    const double raw_step = (hi - lo) / target_count;
    const double magnitude = std::pow(10.0, std::floor(std::log10(raw_step)));
    const double residual = raw_step / magnitude;

    double nice;
    if (residual <= 1.0) nice = 1.0;
    else if (residual <= 2.0) nice = 2.0;
    else if (residual <= 2.5) nice = 2.5;
    else if (residual <= 5.0) nice = 5.0;
    else nice = 10.0;
    out.step = nice * magnitude;

    const double eps = out.step * 1e-9;
    const double first = std::ceil((lo - eps) / out.step) * out.step;
    if (!std::isfinite(out.step) || !(out.step > 0.0) || !std::isfinite(first)
        || (hi - lo) / out.step > max_tick_count)
        return TickSet{};
    for (int i = 0;; ++i) {
        double v = first + i * out.step;
        if (v > hi + eps) break;
        if (std::abs(v) < eps) v = 0.0; // avoid "-0"
        out.values.push_back(v);
    }
    return out;
}

std::string format_tick(double value, double step) {
    int decimals = 0;
    if (step > 0.0 && step < 1.0)
        decimals = static_cast<int>(std::ceil(-std::log10(step) - 1e-9));
    // 2.5 x 10^n steps need one digit more than the magnitude suggests.
    const double scaled = step * std::pow(10.0, decimals);
    if (std::abs(scaled - std::round(scaled)) > 1e-6) ++decimals;
    char buf[64];
    (void)std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

} // namespace board_placement
