#include <panels/panels.hpp>
#include <board_loaders/image_store.hpp>
#include <app_log/log.hpp>
#include "imgui.h"
#include <cfloat>
#include <cstdio>
#include <string>

namespace panels {

namespace {

const char* const edit_popup_id = "Edit item";
const char* const delete_popup_id = "Delete item";
const ImVec4 error_color(1.0f, 0.45f, 0.4f, 1.0f);
const float list_icon_size = 20.0f;

// Copies source into the images directory and points the item at the copy.
// The previous picture file is deleted when it is replaced.
bool attach_image(board_model::Board& board, board_model::ItemId id, const std::string& source,
    const std::string& images_dir, std::string& error)
{
    const board_model::Item* item = board.find(id);
    if (!item) return false;
    const std::string previous = item->image_path;
    if (source == previous) return true;

    std::string imported;
    if (!source.empty()) {
        auto copy = board_loaders::import_item_image(source, images_dir, id, &error);
        if (!copy) return false;
        imported = *copy;
    }
    if (board.set_image(id, imported) != board_model::EditStatus::Ok) return false;
    if (!previous.empty() && previous != imported)
        (void)board_loaders::remove_item_image(previous, images_dir);
    return true;
}

void begin_edit(const board_model::Item& item, ItemPanelState& state) {
    state.editing_id = item.id;
    copy_to_buffer(item.label, state.edit_label, sizeof(state.edit_label));
    copy_to_buffer(item.image_path, state.edit_image, sizeof(state.edit_image));
    state.edit_x = item.position.x;
    state.edit_y = item.position.y;
    state.edit_status = board_model::EditStatus::Ok;
    state.edit_image_error.clear();
    state.open_edit = true;
}

void draw_add_form(board_model::Board& board, ItemPanelState& state, board_model::ItemId& selected_id) {
    ImGui::InputText("##new_label", state.new_label, sizeof(state.new_label));
    ImGui::InputTextWithHint("Image##new", "optional picture file", state.new_image, sizeof(state.new_image));
    ImGui::InputDouble("X##new", &state.new_x, 1.0, 10.0, "%.2f");
    ImGui::InputDouble("Y##new", &state.new_y, 1.0, 10.0, "%.2f");
    if (ImGui::Button("Add item")) {
        board_model::ItemId id = board_model::no_item;
        state.add_image_error.clear();
        state.add_status = board.add(state.new_label, board_model::Position{ state.new_x, state.new_y }, id);
        if (state.add_status == board_model::EditStatus::Ok) {
            selected_id = id;
            state.new_label[0] = '\0';
            if (state.new_image[0] != '\0') {
                if (attach_image(board, id, state.new_image, state.images_dir, state.add_image_error))
                    state.new_image[0] = '\0';
                else
                    app_log::logger()->info("add: item id={} kept without picture: {}", id, state.add_image_error);
            }
        } else {
            app_log::logger()->info("add rejected: {}", board_model::to_string(state.add_status));
        }
    }
    if (state.add_status != board_model::EditStatus::Ok)
        ImGui::TextColored(error_color, "%s", board_model::describe(state.add_status));
    if (!state.add_image_error.empty())
        ImGui::TextColored(error_color, "%s", state.add_image_error.c_str());
}

void draw_edit_popup(board_model::Board& board, ItemPanelState& state) {
    if (state.open_edit) {
        ImGui::OpenPopup(edit_popup_id);
        state.open_edit = false;
    }
    if (!ImGui::BeginPopupModal(edit_popup_id, nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    const auto& xa = board.x_axis();
    const auto& ya = board.y_axis();
    char x_caption[96];
    char y_caption[96];
    (void)std::snprintf(x_caption, sizeof(x_caption), "X (%g..%g)", xa.min, xa.max);
    (void)std::snprintf(y_caption, sizeof(y_caption), "Y (%g..%g)", ya.min, ya.max);

    ImGui::InputText("Name", state.edit_label, sizeof(state.edit_label));
    ImGui::InputTextWithHint("Image", "empty for a plain marker", state.edit_image, sizeof(state.edit_image));
    ImGui::InputDouble(x_caption, &state.edit_x, 1.0, 10.0, "%.2f");
    ImGui::InputDouble(y_caption, &state.edit_y, 1.0, 10.0, "%.2f");
    if (state.edit_status != board_model::EditStatus::Ok)
        ImGui::TextColored(error_color, "%s", board_model::describe(state.edit_status));
    if (!state.edit_image_error.empty())
        ImGui::TextColored(error_color, "%s", state.edit_image_error.c_str());

    bool close = false;
    if (ImGui::Button("Save")) {
        state.edit_image_error.clear();
        state.edit_status = board.update(state.editing_id, state.edit_label,
            board_model::Position{ state.edit_x, state.edit_y });
        if (state.edit_status == board_model::EditStatus::NotFound) {
            app_log::logger()->debug("edit: item id={} no longer exists", state.editing_id);
            close = true;
        } else if (state.edit_status == board_model::EditStatus::Ok) {
            // The dialog stays open on a bad picture so the path can be fixed.
            close = attach_image(board, state.editing_id, state.edit_image, state.images_dir,
                state.edit_image_error);
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Cancel")) close = true;
    if (close) {
        state.editing_id = board_model::no_item;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

void draw_delete_popup(board_model::Board& board, ItemPanelState& state) {
    if (state.open_delete) {
        ImGui::OpenPopup(delete_popup_id);
        state.open_delete = false;
    }
    if (!ImGui::BeginPopupModal(delete_popup_id, nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    const board_model::Item* item = board.find(state.pending_delete_id);
    ImGui::Text("Delete \"%s\"?", item ? item->label.c_str() : "?");
    bool close = false;
    if (ImGui::Button("Yes")) {
        const std::string image_path = item ? item->image_path : std::string();
        if (board.remove(state.pending_delete_id) == board_model::EditStatus::NotFound)
            app_log::logger()->debug("delete: item id={} already gone", state.pending_delete_id);
        else if (!image_path.empty())
            (void)board_loaders::remove_item_image(image_path, state.images_dir);
        close = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("No")) close = true;
    if (close) {
        state.pending_delete_id = board_model::no_item;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

// One list row. The id scope keeps rows apart whatever their text; the text is
// drawn unformatted so "##" in a label stays visible.
bool draw_item_row(const board_model::Item& item, bool selected, const board_render::ImageLookup& images) {
    char coords[64];
    (void)std::snprintf(coords, sizeof(coords), " (x=%.2f, y=%.2f)", item.position.x, item.position.y);
    const std::string text = item.label + coords;

    char id_text[24];
    (void)std::snprintf(id_text, sizeof(id_text), "%llu", static_cast<unsigned long long>(item.id));
    ImGui::PushID(id_text);
    const float row_height = list_icon_size > ImGui::GetTextLineHeight() ? list_icon_size : ImGui::GetTextLineHeight();
    const bool clicked = ImGui::Selectable("##row", selected,
        ImGuiSelectableFlags_AllowDoubleClick, ImVec2(0.0f, row_height));
    ImGui::PopID();

    ImDrawList* dl = ImGui::GetWindowDrawList();
    ImVec2 pos = ImGui::GetItemRectMin();
    const board_render::MarkerImage* icon = nullptr;
    if (images && !item.image_path.empty()) icon = images(item.image_path);
    if (icon) {
        board_render::draw_image_fitted(dl, *icon, pos.x, pos.y, list_icon_size);
        pos.x += list_icon_size + 4.0f;
    }
    const float text_y = pos.y + (row_height - ImGui::GetTextLineHeight()) * 0.5f;
    dl->AddText(ImVec2(pos.x, text_y), ImGui::GetColorU32(ImGuiCol_Text), text.c_str());
    return clicked;
}

} // namespace

void draw_item_panel(board_model::Board& board, ItemPanelState& state, board_model::ItemId& selected_id,
    const board_render::ImageLookup& images)
{
    if (ImGui::CollapsingHeader("Items", ImGuiTreeNodeFlags_DefaultOpen)) {
        draw_add_form(board, state, selected_id);
        ImGui::Separator();

        const float list_height = ImGui::GetTextLineHeightWithSpacing() * 10.0f;
        if (ImGui::BeginListBox("##items", ImVec2(-FLT_MIN, list_height))) {
            for (const auto& item : board.list()) {
                if (draw_item_row(item, item.id == selected_id, images)) {
                    selected_id = item.id;
                    if (ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left)) begin_edit(item, state);
                }
            }
            ImGui::EndListBox();
        }

        const board_model::Item* selected = board.find(selected_id);
        ImGui::BeginDisabled(selected == nullptr);
        if (ImGui::Button("Edit selected") && selected) begin_edit(*selected, state);
        ImGui::SameLine();
        if (ImGui::Button("Delete selected") && selected) {
            state.pending_delete_id = selected->id;
            state.open_delete = true;
        }
        ImGui::EndDisabled();
        ImGui::Text("%zu item(s)", board.size());
    }

    draw_edit_popup(board, state);
    draw_delete_popup(board, state);
}

} // namespace panels
