#pragma once

#include <cstdint>
#include <string>

namespace board_model {

using ItemId = std::uint64_t;

// Id 0 is never handed out; it marks "no item".
constexpr ItemId no_item = 0;

struct Position {
    double x = 0;
    double y = 0;
};

enum class Orientation { Horizontal, Vertical };

struct Axis {
    std::string name;
    double min = -100.0;
    double max = 100.0;
    Orientation orientation = Orientation::Horizontal;
    // Text drawn at the low / high end of the axis ("Weak" / "Strong").
    std::string min_label;
    std::string max_label;
};

struct Item {
    ItemId id = no_item;
    std::string label;
    Position position;
    // Picture drawn as the marker; empty for a plain round marker.
    std::string image_path;
};

Axis default_x_axis();
Axis default_y_axis();

} // namespace board_model
