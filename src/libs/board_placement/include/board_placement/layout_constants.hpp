#pragma once

namespace board_placement {

// Shared by placer, renderer and canvas. Values in screen pixels.
namespace layout {

constexpr double plot_margin = 40.0;
constexpr double marker_radius = 7.0;
// Side of the square a picture marker is fitted into.
constexpr double image_marker_size = 48.0;
// Extra pixels around a marker that still count as a hit.
constexpr double hit_slop = 4.0;
constexpr double label_gap = 4.0;
constexpr double tick_length = 5.0;
constexpr int target_tick_count = 5;
// Below this the plot is too small to be useful; mapping still works.
constexpr double min_plot_extent = 1.0;

} // namespace layout

} // namespace board_placement
