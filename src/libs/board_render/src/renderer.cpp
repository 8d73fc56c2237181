#include <board_render/renderer.hpp>
#include <board_model/board.hpp>
#include <board_placement/layout_constants.hpp>
#include "imgui.h"
#include <cstdint>

namespace board_render {

namespace {

using namespace board_placement::layout;

const unsigned int quadrant_fill[4] = {
    IM_COL32(46, 74, 58, 255),  // I   green
    IM_COL32(46, 58, 82, 255),  // II  blue
    IM_COL32(78, 50, 50, 255),  // III red
    IM_COL32(78, 70, 44, 255),  // IV  amber
};
const unsigned int border_color = IM_COL32(100, 100, 105, 255);
const unsigned int grid_color = IM_COL32(255, 255, 255, 18);
const unsigned int axis_color = IM_COL32(210, 210, 215, 255);
const unsigned int text_color = IM_COL32(220, 220, 220, 255);
const unsigned int muted_text_color = IM_COL32(160, 160, 165, 255);
const unsigned int marker_fill = IM_COL32(235, 235, 240, 255);
const unsigned int marker_border = IM_COL32(20, 20, 24, 255);
const unsigned int hover_color = IM_COL32(255, 210, 90, 255);
const unsigned int drag_color = IM_COL32(255, 160, 60, 255);
const unsigned int selected_color = IM_COL32(90, 170, 255, 255);
const unsigned int label_bg = IM_COL32(20, 20, 24, 170);

ImVec2 to_im(double x, double y) {
    return ImVec2(static_cast<float>(x), static_cast<float>(y));
}

ImTextureID texture_id(const MarkerImage& image) {
    return (ImTextureID)(std::intptr_t)image.texture;
}

ImVec2 fit_size(const MarkerImage& image, float box) {
    if (image.width <= 0 || image.height <= 0) return ImVec2(box, box);
    const float w = static_cast<float>(image.width);
    const float h = static_cast<float>(image.height);
    const float scale = w > h ? box / w : box / h;
    return ImVec2(w * scale, h * scale);
}

void draw_text(ImDrawList* dl, float x, float y, unsigned int color, const std::string& text) {
    if (text.empty()) return;
    dl->AddText(ImVec2(x, y), color, text.c_str());
}

void draw_axes(ImDrawList* dl, const board_model::Board& board, const board_placement::PlacedBoard& placed) {
    const auto& p = placed.plot_rect;
    const float left = static_cast<float>(p.x);
    const float top = static_cast<float>(p.y);
    const float right = static_cast<float>(p.x + p.width);
    const float bottom = static_cast<float>(p.y + p.height);
    const float ox = static_cast<float>(placed.origin_x);
    const float oy = static_cast<float>(placed.origin_y);
    const float tl = static_cast<float>(tick_length);
    const float line_h = ImGui::GetTextLineHeight();

    for (const auto& t : placed.x_ticks) {
        const float sx = static_cast<float>(t.screen);
        dl->AddLine(ImVec2(sx, top), ImVec2(sx, bottom), grid_color, 1.0f);
        dl->AddLine(ImVec2(sx, oy - tl), ImVec2(sx, oy + tl), axis_color, 1.0f);
        const ImVec2 ts = ImGui::CalcTextSize(t.text.c_str());
        draw_text(dl, sx - ts.x * 0.5f, bottom + 2.0f, muted_text_color, t.text);
    }
    for (const auto& t : placed.y_ticks) {
        const float sy = static_cast<float>(t.screen);
        dl->AddLine(ImVec2(left, sy), ImVec2(right, sy), grid_color, 1.0f);
        dl->AddLine(ImVec2(ox - tl, sy), ImVec2(ox + tl, sy), axis_color, 1.0f);
        const ImVec2 ts = ImGui::CalcTextSize(t.text.c_str());
        draw_text(dl, left - ts.x - 4.0f, sy - ts.y * 0.5f, muted_text_color, t.text);
    }

    dl->AddLine(ImVec2(left, oy), ImVec2(right, oy), axis_color, 2.0f);
    dl->AddLine(ImVec2(ox, top), ImVec2(ox, bottom), axis_color, 2.0f);

    const auto& xa = board.x_axis();
    const auto& ya = board.y_axis();

    // Side labels sit just inside the plot at the ends of each axis.
    draw_text(dl, left + 4.0f, oy - line_h - 2.0f, text_color, xa.min_label);
    if (!xa.max_label.empty()) {
        const ImVec2 ts = ImGui::CalcTextSize(xa.max_label.c_str());
        draw_text(dl, right - ts.x - 4.0f, oy - line_h - 2.0f, text_color, xa.max_label);
    }
    draw_text(dl, ox + 6.0f, top + 2.0f, text_color, ya.max_label);
    draw_text(dl, ox + 6.0f, bottom - line_h - 2.0f, text_color, ya.min_label);

    // Axis names in the margins: X centred under the tick labels, Y above the plot.
    if (!xa.name.empty()) {
        const ImVec2 ts = ImGui::CalcTextSize(xa.name.c_str());
        draw_text(dl, (left + right - ts.x) * 0.5f, bottom + line_h + 2.0f, axis_color, xa.name);
    }
    if (!ya.name.empty()) {
        const ImVec2 ts = ImGui::CalcTextSize(ya.name.c_str());
        draw_text(dl, ox - ts.x * 0.5f, top - line_h - 4.0f, axis_color, ya.name);
    }
}

void draw_marker(ImDrawList* dl, const board_placement::PlacedMarker& m, const MarkerHighlight& hl,
    const ImageLookup& images)
{
    const ImVec2 center = to_im(m.cx, m.cy);
    const float r = static_cast<float>(m.radius);

    unsigned int ring = marker_border;
    float ring_thickness = 1.5f;
    if (m.item_id == hl.dragged) {
        ring = drag_color;
        ring_thickness = 3.0f;
    } else if (m.item_id == hl.selected) {
        ring = selected_color;
        ring_thickness = 2.5f;
    } else if (m.item_id == hl.hovered) {
        ring = hover_color;
        ring_thickness = 2.5f;
    }

    float half_width = r;
    if (m.image_path.empty()) {
        dl->AddCircleFilled(center, r, marker_fill);
        dl->AddCircle(center, r, ring, 0, ring_thickness);
    } else {
        const MarkerImage* image = images ? images(m.image_path) : nullptr;
        if (image) {
            const ImVec2 size = fit_size(*image, r * 2.0f);
            const ImVec2 p_min(center.x - size.x * 0.5f, center.y - size.y * 0.5f);
            const ImVec2 p_max(center.x + size.x * 0.5f, center.y + size.y * 0.5f);
            dl->AddImage(texture_id(*image), p_min, p_max);
            dl->AddRect(p_min, p_max, ring, 2.0f, 0, ring_thickness);
            half_width = size.x * 0.5f;
        } else {
            const ImVec2 p_min(center.x - r, center.y - r);
            const ImVec2 p_max(center.x + r, center.y + r);
            dl->AddRectFilled(p_min, p_max, label_bg, 2.0f);
            dl->AddLine(p_min, p_max, muted_text_color, 1.0f);
            dl->AddLine(ImVec2(p_min.x, p_max.y), ImVec2(p_max.x, p_min.y), muted_text_color, 1.0f);
            dl->AddRect(p_min, p_max, ring, 2.0f, 0, ring_thickness);
        }
    }

    if (m.label.empty()) return;
    const ImVec2 ts = ImGui::CalcTextSize(m.label.c_str());
    const float tx = center.x + half_width + static_cast<float>(label_gap);
    const float ty = center.y - ts.y * 0.5f;
    dl->AddRectFilled(ImVec2(tx - 2.0f, ty), ImVec2(tx + ts.x + 2.0f, ty + ts.y), label_bg, 3.0f);
    dl->AddText(ImVec2(tx, ty), text_color, m.label.c_str());
}

} // namespace

void render_board(ImDrawList* draw_list,
    const board_model::Board& board,
    const board_placement::PlacedBoard& placed,
    const MarkerHighlight& highlight,
    const ImageLookup& images)
{
    if (!draw_list) return;

    for (int q = 0; q < 4; ++q) {
        const auto& r = placed.quadrants[q];
        if (r.width <= 0 || r.height <= 0) continue;
        draw_list->AddRectFilled(to_im(r.x, r.y), to_im(r.x + r.width, r.y + r.height), quadrant_fill[q]);
    }
    const auto& p = placed.plot_rect;
    draw_list->AddRect(to_im(p.x, p.y), to_im(p.x + p.width, p.y + p.height), border_color, 0.0f, 0, 1.0f);

    draw_axes(draw_list, board, placed);

    // Dragged marker last so it stays on top while moving.
    const board_placement::PlacedMarker* dragged = nullptr;
    for (const auto& m : placed.markers) {
        if (m.item_id == highlight.dragged) {
            dragged = &m;
            continue;
        }
        draw_marker(draw_list, m, highlight, images);
    }
    if (dragged) draw_marker(draw_list, *dragged, highlight, images);
}

void draw_image_fitted(ImDrawList* draw_list, const MarkerImage& image, float x, float y, float box) {
    if (!draw_list) return;
    const ImVec2 size = fit_size(image, box);
    const ImVec2 p_min(x + (box - size.x) * 0.5f, y + (box - size.y) * 0.5f);
    draw_list->AddImage(texture_id(image), p_min, ImVec2(p_min.x + size.x, p_min.y + size.y));
}

void render_pending_marker(ImDrawList* draw_list, double screen_x, double screen_y, double radius) {
    if (!draw_list) return;
    const ImVec2 center = to_im(screen_x, screen_y);
    const float r = static_cast<float>(radius);
    draw_list->AddCircle(center, r, hover_color, 0, 2.0f);
    draw_list->AddLine(ImVec2(center.x - r, center.y), ImVec2(center.x + r, center.y), hover_color, 1.0f);
    draw_list->AddLine(ImVec2(center.x, center.y - r), ImVec2(center.x, center.y + r), hover_color, 1.0f);
}

} // namespace board_render
