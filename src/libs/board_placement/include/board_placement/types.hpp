#pragma once

#include <board_model/types.hpp>
#include <array>
#include <string>
#include <vector>

namespace board_placement {

// Screen-space rectangle (pixels, y grows downwards).
struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

struct PlacedMarker {
    board_model::ItemId item_id = board_model::no_item;
    std::string label;
    double cx = 0;
    double cy = 0;
    double radius = 0; // half the box side for picture markers
    std::string image_path;
};

struct Tick {
    double value = 0;
    double screen = 0; // x for horizontal ticks, y for vertical ticks
    std::string text;
};

// Quadrants in the usual mathematical order: I top-right, II top-left,
// III bottom-left, IV bottom-right.
enum class Quadrant { I = 0, II = 1, III = 2, IV = 3 };

struct PlacedBoard {
    Rect plot_rect;
    double origin_x = 0;
    double origin_y = 0;
    std::array<Rect, 4> quadrants{};
    std::vector<Tick> x_ticks;
    std::vector<Tick> y_ticks;
    std::vector<PlacedMarker> markers; // in board list order, last drawn on top
};

} // namespace board_placement
