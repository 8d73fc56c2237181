#pragma once

#include <board_model/board.hpp>
#include <board_placement/layout_constants.hpp>
#include <board_placement/plot_mapping.hpp>
#include <board_placement/types.hpp>
#include <board_render/renderer.hpp>
#include <interaction/interaction_controller.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

struct ImVec2;

namespace canvas {

// Immediate-mode quadrant view of a Board. Draws into the current ImGui window
// and feeds mouse input through the interaction state machine.
class QuadrantCanvas {
public:
    explicit QuadrantCanvas(board_model::Board& board);
    ~QuadrantCanvas();

    QuadrantCanvas(const QuadrantCanvas&) = delete;
    QuadrantCanvas& operator=(const QuadrantCanvas&) = delete;

    void set_snap_step(double step) { controller_.set_snap_step(step); }
    double snap_step() const { return controller_.snap_step(); }
    void set_marker_radius(float radius);
    float marker_radius() const { return marker_radius_; }
    void set_margin(float margin);
    // Source of item pictures; without one, picture markers draw as empty frames.
    void set_image_lookup(board_render::ImageLookup images) { images_ = std::move(images); }

    board_model::ItemId selected_id() const { return selected_id_; }
    void set_selected_id(board_model::ItemId id) { selected_id_ = id; }
    interaction::State interaction_state() const { return controller_.state(); }

    // Overlay line shown in the plot's top-left corner for a few seconds.
    void show_message(const std::string& text, float seconds = 4.0f);

    bool update_and_draw(float region_width, float region_height);

private:
    void on_board_changed(const board_model::BoardChange& change);
    void refresh_placement(ImVec2 region_min, float region_width, float region_height);
    void handle_input(ImVec2 region_min, float region_width, float region_height);
    void draw_placement_prompt();
    void draw_message();

    board_model::Board& board_;
    std::size_t listener_handle_ = 0;
    interaction::InteractionController controller_;

    std::optional<board_placement::PlotMapping> mapping_;
    board_placement::PlacedBoard placed_;
    bool placement_dirty_ = true;
    board_placement::Rect last_region_;

    board_model::ItemId selected_id_ = board_model::no_item;
    board_model::ItemId hovered_id_ = board_model::no_item;
    float marker_radius_ = static_cast<float>(board_placement::layout::marker_radius);
    float margin_ = static_cast<float>(board_placement::layout::plot_margin);
    board_render::ImageLookup images_;

    bool open_prompt_ = false;
    char label_buffer_[128] = {};
    board_model::EditStatus prompt_status_ = board_model::EditStatus::Ok;

    std::string message_;
    float message_seconds_left_ = 0.0f;
};

} // namespace canvas
