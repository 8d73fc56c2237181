#pragma once

#include <board_model/types.hpp>
#include <board_placement/types.hpp>

namespace board_placement {

// Maps board coordinates (axis units, y up) to screen pixels (y down) inside a
// region shrunk by a margin on every side.
class PlotMapping {
public:
    PlotMapping(const board_model::Axis& x_axis, const board_model::Axis& y_axis,
        const Rect& region, double margin);

    void to_screen(board_model::Position p, double& screen_x, double& screen_y) const;
    // Not clamped: points outside the plot map outside the axis ranges.
    board_model::Position to_board(double screen_x, double screen_y) const;

    double x_to_screen(double x) const;
    double y_to_screen(double y) const;

    const Rect& plot_rect() const { return plot_; }
    bool contains_screen(double screen_x, double screen_y) const;

    // Where the two axes cross, in board coordinates: 0 when the range
    // contains it, otherwise the middle of the range.
    board_model::Position origin() const;

    const board_model::Axis& x_axis() const { return x_axis_; }
    const board_model::Axis& y_axis() const { return y_axis_; }

private:
    board_model::Axis x_axis_;
    board_model::Axis y_axis_;
    Rect plot_;
};

} // namespace board_placement
