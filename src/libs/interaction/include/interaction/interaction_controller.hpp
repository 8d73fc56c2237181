#pragma once

#include <board_model/board.hpp>
#include <board_placement/plot_mapping.hpp>
#include <board_placement/types.hpp>
#include <string>

namespace interaction {

enum class State { Idle, Dragging, Placing };

const char* to_string(State state);

// Rounds value to the nearest multiple of step. step <= 0 leaves value unchanged.
double snap_value(double value, double step);

// Pointer state machine for the quadrant canvas.
//
//   Idle --down on marker--> Dragging(id) --move--> move(id) --up--> Idle
//   Idle --down on empty plot--> Placing(pos) --confirm(label)--> add --> Idle
//                                             --cancel--> Idle
//
// Pointer coordinates are in screen pixels; the mapping converts them to board
// coordinates. Snapping (if any) is applied before the board clamps.
class InteractionController {
public:
    explicit InteractionController(board_model::Board& board);

    void set_snap_step(double step) { snap_step_ = step > 0.0 ? step : 0.0; }
    double snap_step() const { return snap_step_; }

    void pointer_down(const board_placement::PlacedBoard& placed,
        const board_placement::PlotMapping& mapping,
        double screen_x, double screen_y, double hit_slop);
    void pointer_move(const board_placement::PlotMapping& mapping, double screen_x, double screen_y);
    void pointer_up(const board_placement::PlotMapping& mapping, double screen_x, double screen_y);

    // Placing only. Empty labels keep the controller in Placing.
    board_model::EditStatus confirm_placement(const std::string& label, board_model::ItemId* out_id = nullptr);
    void cancel_placement();

    // Drops any drag or pending placement without touching the board.
    void reset();

    State state() const { return state_; }
    board_model::ItemId dragged_id() const { return dragged_id_; }
    board_model::Position pending_position() const { return pending_position_; }

private:
    board_model::Position pointer_to_board(const board_placement::PlotMapping& mapping,
        double screen_x, double screen_y) const;
    void drag_to(const board_placement::PlotMapping& mapping, double screen_x, double screen_y);
    void set_state(State state);

    board_model::Board& board_;
    State state_ = State::Idle;
    board_model::ItemId dragged_id_ = board_model::no_item;
    // Pointer minus marker centre at grab time, in pixels.
    double grab_dx_ = 0;
    double grab_dy_ = 0;
    board_model::Position pending_position_;
    double snap_step_ = 0;
};

} // namespace interaction
