#pragma once

#include <board_model/board.hpp>
#include <board_render/renderer.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace panels {

constexpr std::size_t text_capacity = 128;
constexpr std::size_t path_capacity = 512;

struct ItemPanelState {
    // Pictures are copied here; see board_loaders::images_dir_for.
    std::string images_dir = "data/images";

    // "Add item" form.
    char new_label[text_capacity] = {};
    char new_image[path_capacity] = {};
    double new_x = 0;
    double new_y = 0;
    board_model::EditStatus add_status = board_model::EditStatus::Ok;
    std::string add_image_error;

    // Edit dialog.
    bool open_edit = false;
    board_model::ItemId editing_id = board_model::no_item;
    char edit_label[text_capacity] = {};
    char edit_image[path_capacity] = {};
    double edit_x = 0;
    double edit_y = 0;
    board_model::EditStatus edit_status = board_model::EditStatus::Ok;
    std::string edit_image_error;

    // Delete confirmation.
    bool open_delete = false;
    board_model::ItemId pending_delete_id = board_model::no_item;
};

struct AxisForm {
    char name[text_capacity] = {};
    char min_label[text_capacity] = {};
    char max_label[text_capacity] = {};
    double min = 0;
    double max = 0;
    board_model::EditStatus range_status = board_model::EditStatus::Ok;
};

struct AxisPanelState {
    AxisForm x;
    AxisForm y;
    // Board::axes_revision the form was last copied from. Item edits leave it
    // alone, so typed but unapplied ranges survive a drag.
    std::uint64_t synced_revision = std::numeric_limits<std::uint64_t>::max();
};

struct BoardPanelState {
    char name[text_capacity] = {};
    std::uint64_t synced_revision = std::numeric_limits<std::uint64_t>::max();
    // Title field had focus last frame; the board is not copied over it then.
    bool editing = false;
};

// Item list with add / edit / delete. selected_id is shared with the canvas.
// images supplies the list icons and may be empty.
void draw_item_panel(board_model::Board& board, ItemPanelState& state, board_model::ItemId& selected_id,
    const board_render::ImageLookup& images = {});

// Names, side labels and ranges of both axes.
void draw_axis_panel(board_model::Board& board, AxisPanelState& state);

// Board name, file path and the "Save now" button. Returns true when saving was requested.
// autosave_held shows that edits are not being written until the next "Save now".
bool draw_board_panel(board_model::Board& board, BoardPanelState& state, const std::string& board_path,
    const std::string& last_save_error, bool autosave_held);

// Copies text into a fixed buffer, truncating and always terminating.
void copy_to_buffer(const std::string& text, char* buffer, std::size_t capacity);

} // namespace panels
