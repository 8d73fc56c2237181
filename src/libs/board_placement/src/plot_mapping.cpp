#include <board_placement/plot_mapping.hpp>
#include <board_placement/layout_constants.hpp>
#include <algorithm>

namespace board_placement {

namespace {

double crossing(const board_model::Axis& a) {
    if (a.min <= 0.0 && a.max >= 0.0) return 0.0;
    return (a.min + a.max) * 0.5;
}

} // namespace

PlotMapping::PlotMapping(const board_model::Axis& x_axis, const board_model::Axis& y_axis,
    const Rect& region, double margin)
    : x_axis_(x_axis)
    , y_axis_(y_axis)
{
    plot_.x = region.x + margin;
    plot_.y = region.y + margin;
    plot_.width = std::max(layout::min_plot_extent, region.width - 2.0 * margin);
    plot_.height = std::max(layout::min_plot_extent, region.height - 2.0 * margin);
}

double PlotMapping::x_to_screen(double x) const {
    const double t = (x - x_axis_.min) / (x_axis_.max - x_axis_.min);
    return plot_.x + t * plot_.width;
}

double PlotMapping::y_to_screen(double y) const {
    const double t = (y - y_axis_.min) / (y_axis_.max - y_axis_.min);
    return plot_.y + plot_.height - t * plot_.height;
}

void PlotMapping::to_screen(board_model::Position p, double& screen_x, double& screen_y) const {
    screen_x = x_to_screen(p.x);
    screen_y = y_to_screen(p.y);
}

board_model::Position PlotMapping::to_board(double screen_x, double screen_y) const {
    const double tx = (screen_x - plot_.x) / plot_.width;
    const double ty = (plot_.y + plot_.height - screen_y) / plot_.height;
    return board_model::Position{
        x_axis_.min + tx * (x_axis_.max - x_axis_.min),
        y_axis_.min + ty * (y_axis_.max - y_axis_.min),
    };
}

bool PlotMapping::contains_screen(double screen_x, double screen_y) const {
    return screen_x >= plot_.x && screen_x <= plot_.x + plot_.width &&
           screen_y >= plot_.y && screen_y <= plot_.y + plot_.height;
}

board_model::Position PlotMapping::origin() const {
    return board_model::Position{ crossing(x_axis_), crossing(y_axis_) };
}

} // namespace board_placement
