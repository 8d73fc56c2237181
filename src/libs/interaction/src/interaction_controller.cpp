#include <interaction/interaction_controller.hpp>
#include <board_placement/placer.hpp>
#include <app_log/log.hpp>
#include <cmath>

namespace interaction {

const char* to_string(State state) {
    switch (state) {
    case State::Idle: return "idle";
    case State::Dragging: return "dragging";
    case State::Placing: return "placing";
    }
    return "unknown";
}

double snap_value(double value, double step) {
    if (!(step > 0.0)) return value;
    return std::round(value / step) * step;
}

InteractionController::InteractionController(board_model::Board& board)
    : board_(board)
{
}

void InteractionController::set_state(State state) {
    if (state == state_) return;
    app_log::logger()->trace("interaction: {} -> {}", to_string(state_), to_string(state));
    state_ = state;
}

board_model::Position InteractionController::pointer_to_board(
    const board_placement::PlotMapping& mapping, double screen_x, double screen_y) const
{
    board_model::Position p = mapping.to_board(screen_x, screen_y);
    p.x = snap_value(p.x, snap_step_);
    p.y = snap_value(p.y, snap_step_);
    return board_.clamp(p);
}

void InteractionController::pointer_down(const board_placement::PlacedBoard& placed,
    const board_placement::PlotMapping& mapping,
    double screen_x, double screen_y, double hit_slop)
{
    if (state_ != State::Idle) return;

    board_model::ItemId hit_id = board_model::no_item;
    double cx = 0;
    double cy = 0;
    if (board_placement::pick_marker_at(placed, screen_x, screen_y, hit_slop, hit_id, cx, cy)) {
        dragged_id_ = hit_id;
        grab_dx_ = screen_x - cx;
        grab_dy_ = screen_y - cy;
        set_state(State::Dragging);
        return;
    }

    if (!mapping.contains_screen(screen_x, screen_y)) return;
    pending_position_ = pointer_to_board(mapping, screen_x, screen_y);
    set_state(State::Placing);
}

void InteractionController::drag_to(const board_placement::PlotMapping& mapping,
    double screen_x, double screen_y)
{
    const board_model::Position p = pointer_to_board(mapping, screen_x - grab_dx_, screen_y - grab_dy_);
    const board_model::EditStatus status = board_.move(dragged_id_, p);
    if (status == board_model::EditStatus::NotFound) {
        app_log::logger()->debug("interaction: dragged item id={} vanished, drag dropped", dragged_id_);
        dragged_id_ = board_model::no_item;
        set_state(State::Idle);
    }
}

void InteractionController::pointer_move(const board_placement::PlotMapping& mapping,
    double screen_x, double screen_y)
{
    if (state_ != State::Dragging) return;
    drag_to(mapping, screen_x, screen_y);
}

void InteractionController::pointer_up(const board_placement::PlotMapping& mapping,
    double screen_x, double screen_y)
{
    if (state_ != State::Dragging) return;
    drag_to(mapping, screen_x, screen_y);
    if (state_ == State::Dragging) {
        if (const auto* item = board_.find(dragged_id_)) {
            app_log::logger()->debug("interaction: dropped id={} at ({}, {})",
                dragged_id_, item->position.x, item->position.y);
        }
    }
    dragged_id_ = board_model::no_item;
    set_state(State::Idle);
}

board_model::EditStatus InteractionController::confirm_placement(const std::string& label,
    board_model::ItemId* out_id)
{
    if (state_ != State::Placing) return board_model::EditStatus::NotFound;
    board_model::ItemId id = board_model::no_item;
    const board_model::EditStatus status = board_.add(label, pending_position_, id);
    if (status != board_model::EditStatus::Ok) {
        app_log::logger()->info("interaction: placement rejected: {}", board_model::to_string(status));
        return status;
    }
    if (out_id) *out_id = id;
    set_state(State::Idle);
    return status;
}

void InteractionController::cancel_placement() {
    if (state_ == State::Placing) set_state(State::Idle);
}

void InteractionController::reset() {
    dragged_id_ = board_model::no_item;
    set_state(State::Idle);
}

} // namespace interaction
