#include <canvas/canvas.hpp>
#include <board_placement/placer.hpp>
#include <board_render/renderer.hpp>
#include <app_log/log.hpp>
#include "imgui.h"

namespace {

const char* const placement_popup_id = "New item";

bool same_rect(const board_placement::Rect& a, const board_placement::Rect& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

} // namespace

namespace canvas {

QuadrantCanvas::QuadrantCanvas(board_model::Board& board)
    : board_(board)
    , controller_(board)
{
    listener_handle_ = board_.add_listener(
        [this](const board_model::BoardChange& change) { on_board_changed(change); });
}

QuadrantCanvas::~QuadrantCanvas() {
    board_.remove_listener(listener_handle_);
}

void QuadrantCanvas::set_marker_radius(float radius) {
    marker_radius_ = radius;
    placement_dirty_ = true;
}

void QuadrantCanvas::set_margin(float margin) {
    margin_ = margin;
    placement_dirty_ = true;
}

void QuadrantCanvas::show_message(const std::string& text, float seconds) {
    message_ = text;
    message_seconds_left_ = seconds;
}

void QuadrantCanvas::on_board_changed(const board_model::BoardChange& change) {
    placement_dirty_ = true;
    switch (change.kind) {
    case board_model::BoardChange::Kind::ItemRemoved:
        if (change.item_id == selected_id_) selected_id_ = board_model::no_item;
        if (change.item_id == hovered_id_) hovered_id_ = board_model::no_item;
        break;
    case board_model::BoardChange::Kind::ItemsCleared:
    case board_model::BoardChange::Kind::Replaced:
        selected_id_ = board_model::no_item;
        hovered_id_ = board_model::no_item;
        controller_.reset();
        open_prompt_ = false;
        break;
    default:
        break;
    }
}

void QuadrantCanvas::refresh_placement(ImVec2 region_min, float region_width, float region_height) {
    board_placement::Rect region;
    region.x = region_min.x;
    region.y = region_min.y;
    region.width = region_width;
    region.height = region_height;
    if (!placement_dirty_ && mapping_ && same_rect(region, last_region_)) return;

    mapping_.emplace(board_.x_axis(), board_.y_axis(), region, margin_);
    placed_ = board_placement::place_board(board_, *mapping_, marker_radius_);
    last_region_ = region;
    placement_dirty_ = false;
}

void QuadrantCanvas::handle_input(ImVec2 region_min, float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    const ImVec2 mouse = io.MousePos;
    const bool in_region = mouse.x >= region_min.x && mouse.x <= region_min.x + region_width &&
                           mouse.y >= region_min.y && mouse.y <= region_min.y + region_height;
    const bool hovered = in_region && ImGui::IsWindowHovered();
    const double slop = board_placement::layout::hit_slop;

    hovered_id_ = board_model::no_item;
    if (hovered) {
        double cx = 0;
        double cy = 0;
        if (!board_placement::pick_marker_at(placed_, mouse.x, mouse.y, slop, hovered_id_, cx, cy))
            hovered_id_ = board_model::no_item;
    }

    if (ImGui::IsMouseClicked(ImGuiMouseButton_Left) && hovered) {
        controller_.pointer_down(placed_, *mapping_, mouse.x, mouse.y, slop);
        if (controller_.state() == interaction::State::Dragging) {
            selected_id_ = controller_.dragged_id();
        } else if (controller_.state() == interaction::State::Placing) {
            label_buffer_[0] = '\0';
            prompt_status_ = board_model::EditStatus::Ok;
            open_prompt_ = true;
        }
        return;
    }

    if (ImGui::IsMouseClicked(ImGuiMouseButton_Right) && hovered) {
        selected_id_ = hovered_id_;
    }

    if (controller_.state() != interaction::State::Dragging) return;

    if (ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
        controller_.pointer_up(*mapping_, mouse.x, mouse.y);
    } else if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f) {
        controller_.pointer_move(*mapping_, mouse.x, mouse.y);
    }
}

void QuadrantCanvas::draw_placement_prompt() {
    if (open_prompt_) {
        ImGui::OpenPopup(placement_popup_id);
        open_prompt_ = false;
    }
    if (!ImGui::BeginPopupModal(placement_popup_id, nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        // Closed by other means (board replaced, escape) while still pending.
        if (controller_.state() == interaction::State::Placing && !ImGui::IsPopupOpen(placement_popup_id))
            controller_.cancel_placement();
        return;
    }

    const board_model::Position p = controller_.pending_position();
    ImGui::Text("Position: (%.2f, %.2f)", p.x, p.y);
    if (ImGui::IsWindowAppearing()) ImGui::SetKeyboardFocusHere();
    const bool submitted = ImGui::InputText("Label", label_buffer_, sizeof(label_buffer_),
        ImGuiInputTextFlags_EnterReturnsTrue);
    if (prompt_status_ != board_model::EditStatus::Ok)
        ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.4f, 1.0f), "%s", board_model::describe(prompt_status_));

    bool close = false;
    if (ImGui::Button("Add") || submitted) {
        board_model::ItemId id = board_model::no_item;
        prompt_status_ = controller_.confirm_placement(label_buffer_, &id);
        if (prompt_status_ == board_model::EditStatus::Ok) {
            selected_id_ = id;
            close = true;
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Cancel") || ImGui::IsKeyPressed(ImGuiKey_Escape)) {
        controller_.cancel_placement();
        close = true;
    }
    if (close) ImGui::CloseCurrentPopup();
    ImGui::EndPopup();
}

void QuadrantCanvas::draw_message() {
    if (message_seconds_left_ <= 0.0f || message_.empty()) return;
    message_seconds_left_ -= ImGui::GetIO().DeltaTime;

    ImDrawList* dl = ImGui::GetWindowDrawList();
    const auto& p = placed_.plot_rect;
    const ImVec2 pos(static_cast<float>(p.x) + 8.0f, static_cast<float>(p.y) + 8.0f);
    const ImVec2 ts = ImGui::CalcTextSize(message_.c_str());
    dl->AddRectFilled(ImVec2(pos.x - 4.0f, pos.y - 2.0f), ImVec2(pos.x + ts.x + 4.0f, pos.y + ts.y + 2.0f),
        IM_COL32(120, 30, 30, 220), 4.0f);
    dl->AddText(pos, IM_COL32(255, 235, 235, 255), message_.c_str());
}

bool QuadrantCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    const ImVec2 region_min = ImGui::GetCursorScreenPos();
    refresh_placement(region_min, region_width, region_height);
    handle_input(region_min, region_width, region_height);
    // Input may have moved or added items.
    refresh_placement(region_min, region_width, region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    board_render::MarkerHighlight highlight;
    highlight.hovered = hovered_id_;
    highlight.dragged = controller_.dragged_id();
    highlight.selected = selected_id_;
    board_render::render_board(draw_list, board_, placed_, highlight, images_);

    if (controller_.state() == interaction::State::Placing) {
        double sx = 0;
        double sy = 0;
        mapping_->to_screen(controller_.pending_position(), sx, sy);
        board_render::render_pending_marker(draw_list, sx, sy, marker_radius_);
    }

    draw_message();
    ImGui::Dummy(ImVec2(region_width, region_height));
    draw_placement_prompt();
    return true;
}

} // namespace canvas
