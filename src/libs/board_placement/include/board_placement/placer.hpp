#pragma once

#include <board_model/board.hpp>
#include <board_placement/layout_constants.hpp>
#include <board_placement/plot_mapping.hpp>
#include <board_placement/types.hpp>

namespace board_placement {

// Items with a picture get a marker of half image_marker_size, the others
// marker_radius.
PlacedBoard place_board(const board_model::Board& board, const PlotMapping& mapping,
    double marker_radius, double image_marker_size = layout::image_marker_size);

// Topmost marker (last in list order) whose disc, grown by slop, contains the
// point. out_cx/out_cy receive the marker centre.
bool pick_marker_at(const PlacedBoard& placed, double screen_x, double screen_y, double slop,
    board_model::ItemId& out_id, double& out_cx, double& out_cy);

} // namespace board_placement
