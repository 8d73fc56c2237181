#include <panels/panels.hpp>
#include <app_log/log.hpp>
#include "imgui.h"
#include <cstring>

namespace panels {

namespace {

const ImVec4 error_color(1.0f, 0.45f, 0.4f, 1.0f);

void sync_form(const board_model::Axis& axis, AxisForm& form) {
    copy_to_buffer(axis.name, form.name, sizeof(form.name));
    copy_to_buffer(axis.min_label, form.min_label, sizeof(form.min_label));
    copy_to_buffer(axis.max_label, form.max_label, sizeof(form.max_label));
    form.min = axis.min;
    form.max = axis.max;
}

// Returns true if the board was changed.
bool draw_axis_form(board_model::Board& board, board_model::Orientation orientation, AxisForm& form) {
    const bool horizontal = orientation == board_model::Orientation::Horizontal;
    bool changed = false;

    ImGui::PushID(horizontal ? "x_axis" : "y_axis");
    ImGui::SeparatorText(horizontal ? "X axis" : "Y axis");

    if (ImGui::InputText("Name", form.name, sizeof(form.name))) {
        changed |= board.set_axis_name(orientation, form.name) == board_model::EditStatus::Ok;
    }
    const bool lo_edited = ImGui::InputText(horizontal ? "Left label" : "Bottom label",
        form.min_label, sizeof(form.min_label));
    const bool hi_edited = ImGui::InputText(horizontal ? "Right label" : "Top label",
        form.max_label, sizeof(form.max_label));
    if (lo_edited || hi_edited) {
        changed |= board.set_axis_side_labels(orientation, form.min_label, form.max_label)
            == board_model::EditStatus::Ok;
    }

    ImGui::InputDouble("Min", &form.min, 1.0, 10.0, "%.2f");
    ImGui::InputDouble("Max", &form.max, 1.0, 10.0, "%.2f");
    if (ImGui::Button("Apply range")) {
        form.range_status = board.set_axis_range(orientation, form.min, form.max);
        if (form.range_status == board_model::EditStatus::Ok) {
            changed = true;
            app_log::logger()->info("axis {} range set to [{}, {}]", horizontal ? "x" : "y", form.min, form.max);
        } else {
            app_log::logger()->info("axis {} range [{}, {}] rejected: {}", horizontal ? "x" : "y",
                form.min, form.max, board_model::to_string(form.range_status));
        }
    }
    if (form.range_status != board_model::EditStatus::Ok)
        ImGui::TextColored(error_color, "%s", board_model::describe(form.range_status));

    ImGui::PopID();
    return changed;
}

} // namespace

void copy_to_buffer(const std::string& text, char* buffer, std::size_t capacity) {
    if (capacity == 0) return;
    const std::size_t n = text.size() < capacity - 1 ? text.size() : capacity - 1;
    std::memcpy(buffer, text.data(), n);
    buffer[n] = '\0';
}

void draw_axis_panel(board_model::Board& board, AxisPanelState& state) {
    if (state.synced_revision != board.axes_revision()) {
        sync_form(board.x_axis(), state.x);
        sync_form(board.y_axis(), state.y);
        state.synced_revision = board.axes_revision();
    }

    if (!ImGui::CollapsingHeader("Axis settings", ImGuiTreeNodeFlags_DefaultOpen)) return;

    ImGui::TextWrapped("Changing a range rescales every item proportionally.");
    bool changed = draw_axis_form(board, board_model::Orientation::Horizontal, state.x);
    changed |= draw_axis_form(board, board_model::Orientation::Vertical, state.y);
    // Own edits must not re-copy the board into fields that are being typed in;
    // only the range fields need refreshing after a rescale.
    if (changed) {
        state.x.min = board.x_axis().min;
        state.x.max = board.x_axis().max;
        state.y.min = board.y_axis().min;
        state.y.max = board.y_axis().max;
        state.synced_revision = board.axes_revision();
    }
}

bool draw_board_panel(board_model::Board& board, BoardPanelState& state, const std::string& board_path,
    const std::string& last_save_error, bool autosave_held)
{
    if (!state.editing && state.synced_revision != board.revision()) {
        copy_to_buffer(board.name(), state.name, sizeof(state.name));
        state.synced_revision = board.revision();
    }

    ImGui::SeparatorText("Board");
    if (ImGui::InputText("Title", state.name, sizeof(state.name))) {
        board.set_name(state.name);
        state.synced_revision = board.revision();
    }
    state.editing = ImGui::IsItemActive();
    ImGui::TextDisabled("%s", board_path.c_str());
    const bool save = ImGui::Button("Save now");
    if (autosave_held)
        ImGui::TextColored(error_color, "Autosave paused: the file could not be loaded. \"Save now\" overwrites it.");
    if (!last_save_error.empty())
        ImGui::TextColored(error_color, "%s", last_save_error.c_str());
    return save;
}

} // namespace panels
