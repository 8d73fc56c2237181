#include <board_placement/placer.hpp>
#include <board_placement/layout_constants.hpp>
#include <board_placement/ticks.hpp>

namespace board_placement {

namespace {

Rect rect_from_corners(double x1, double y1, double x2, double y2) {
    Rect r;
    r.x = x1 < x2 ? x1 : x2;
    r.y = y1 < y2 ? y1 : y2;
    r.width = x1 < x2 ? x2 - x1 : x1 - x2;
    r.height = y1 < y2 ? y2 - y1 : y1 - y2;
    return r;
}

} // namespace

PlacedBoard place_board(const board_model::Board& board, const PlotMapping& mapping,
    double marker_radius, double image_marker_size)
{
    PlacedBoard out;
    out.plot_rect = mapping.plot_rect();
    mapping.to_screen(mapping.origin(), out.origin_x, out.origin_y);

    const Rect& p = out.plot_rect;
    const double left = p.x;
    const double top = p.y;
    const double right = p.x + p.width;
    const double bottom = p.y + p.height;
    out.quadrants[static_cast<int>(Quadrant::I)] = rect_from_corners(out.origin_x, top, right, out.origin_y);
    out.quadrants[static_cast<int>(Quadrant::II)] = rect_from_corners(left, top, out.origin_x, out.origin_y);
    out.quadrants[static_cast<int>(Quadrant::III)] = rect_from_corners(left, out.origin_y, out.origin_x, bottom);
    out.quadrants[static_cast<int>(Quadrant::IV)] = rect_from_corners(out.origin_x, out.origin_y, right, bottom);

    const auto& xa = board.x_axis();
    const auto& ya = board.y_axis();
    const TickSet xt = compute_nice_ticks(xa.min, xa.max, layout::target_tick_count);
    for (double v : xt.values)
        out.x_ticks.push_back(Tick{ v, mapping.x_to_screen(v), format_tick(v, xt.step) });
    const TickSet yt = compute_nice_ticks(ya.min, ya.max, layout::target_tick_count);
    for (double v : yt.values)
        out.y_ticks.push_back(Tick{ v, mapping.y_to_screen(v), format_tick(v, yt.step) });

    out.markers.reserve(board.size());
    for (const auto& item : board.list()) {
        PlacedMarker m;
        m.item_id = item.id;
        m.label = item.label;
        m.radius = item.image_path.empty() ? marker_radius : image_marker_size * 0.5;
        m.image_path = item.image_path;
        mapping.to_screen(item.position, m.cx, m.cy);
        out.markers.push_back(std::move(m));
    }
    return out;
}

bool pick_marker_at(const PlacedBoard& placed, double screen_x, double screen_y, double slop,
    board_model::ItemId& out_id, double& out_cx, double& out_cy)
{
    for (auto it = placed.markers.rbegin(); it != placed.markers.rend(); ++it) {
        const auto& m = *it;
        const double dx = screen_x - m.cx;
        const double dy = screen_y - m.cy;
        const double r = m.radius + slop;
        if (dx * dx + dy * dy <= r * r) {
            out_id = m.item_id;
            out_cx = m.cx;
            out_cy = m.cy;
            return true;
        }
    }
    return false;
}

} // namespace board_placement
