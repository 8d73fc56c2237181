#pragma once

#include <board_model/types.hpp>
#include <board_placement/types.hpp>
#include <cstdint>
#include <functional>
#include <string>

struct ImDrawList;

namespace board_model {
class Board;
}

namespace board_render {

struct MarkerHighlight {
    board_model::ItemId hovered = board_model::no_item;
    board_model::ItemId dragged = board_model::no_item;
    board_model::ItemId selected = board_model::no_item;
};

// A picture uploaded to the GPU: the backend texture name and its size in pixels.
struct MarkerImage {
    std::uint64_t texture = 0;
    int width = 0;
    int height = 0;
};

// Returns nullptr when the picture at path is not available.
using ImageLookup = std::function<const MarkerImage*(const std::string& path)>;

// Quadrant tints, grid, axes with ticks, axis names, side labels, then markers.
// Markers with an image path are drawn as pictures, or as an empty frame when
// the picture cannot be found.
void render_board(ImDrawList* draw_list,
    const board_model::Board& board,
    const board_placement::PlacedBoard& placed,
    const MarkerHighlight& highlight = {},
    const ImageLookup& images = {});

// Draws the picture scaled to fit the box x box square at (x, y), keeping aspect.
void draw_image_fitted(ImDrawList* draw_list, const MarkerImage& image, float x, float y, float box);

// Ghost marker for a pending placement.
void render_pending_marker(ImDrawList* draw_list, double screen_x, double screen_y, double radius);

} // namespace board_render
