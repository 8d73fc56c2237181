#include <board_model/board.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace board_model {

namespace {

bool is_finite(Position p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

double clamp_to(double value, const Axis& axis) {
    return std::clamp(value, axis.min, axis.max);
}

} // namespace

Axis default_x_axis() {
    Axis a;
    a.name = "X Axis";
    a.orientation = Orientation::Horizontal;
    a.min_label = "Left";
    a.max_label = "Right";
    return a;
}

Axis default_y_axis() {
    Axis a;
    a.name = "Y Axis";
    a.orientation = Orientation::Vertical;
    a.min_label = "Bottom";
    a.max_label = "Top";
    return a;
}

std::string trim_label(const std::string& text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(text.begin(), text.end(), is_space);
    auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (first >= last) return {};
    return std::string(first, last);
}

double rescale_value(double value, double from_min, double from_max, double to_min, double to_max) {
    const double t = (value - from_min) / (from_max - from_min);
    return to_min + t * (to_max - to_min);
}

Board::Board()
    : x_axis_(default_x_axis())
    , y_axis_(default_y_axis())
{
}

void Board::set_name(const std::string& name) {
    std::string trimmed = trim_label(name);
    if (trimmed == name_) return;
    name_ = std::move(trimmed);
    notify(BoardChange::Kind::NameChanged);
}

const Axis& Board::axis(Orientation orientation) const {
    return orientation == Orientation::Horizontal ? x_axis_ : y_axis_;
}

Axis& Board::axis_ref(Orientation orientation) {
    return orientation == Orientation::Horizontal ? x_axis_ : y_axis_;
}

EditStatus Board::set_axis_name(Orientation orientation, const std::string& name) {
    Axis& a = axis_ref(orientation);
    std::string trimmed = trim_label(name);
    if (trimmed == a.name) return EditStatus::Ok;
    a.name = std::move(trimmed);
    notify(BoardChange::Kind::AxisChanged, no_item, orientation);
    return EditStatus::Ok;
}

EditStatus Board::set_axis_side_labels(Orientation orientation,
    const std::string& min_label, const std::string& max_label)
{
    Axis& a = axis_ref(orientation);
    std::string lo = trim_label(min_label);
    std::string hi = trim_label(max_label);
    if (lo == a.min_label && hi == a.max_label) return EditStatus::Ok;
    a.min_label = std::move(lo);
    a.max_label = std::move(hi);
    notify(BoardChange::Kind::AxisChanged, no_item, orientation);
    return EditStatus::Ok;
}

EditStatus Board::set_axis_range(Orientation orientation, double min, double max) {
    if (!std::isfinite(min) || !std::isfinite(max)) return EditStatus::InvalidNumber;
    if (!(min < max)) return EditStatus::DegenerateRange;
    // A span that overflows (or underflows to a denormal) cannot be rescaled
    // or mapped to pixels.
    if (!std::isnormal(max - min)) return EditStatus::DegenerateRange;

    Axis& a = axis_ref(orientation);
    if (a.min == min && a.max == max) return EditStatus::Ok;

    const double old_min = a.min;
    const double old_max = a.max;
    a.min = min;
    a.max = max;

    // Proportional rescale keeps relative order along the axis; the clamp only
    // absorbs floating point drift at the ends.
    for (auto& item : items_) {
        double& v = orientation == Orientation::Horizontal ? item.position.x : item.position.y;
        v = clamp_to(rescale_value(v, old_min, old_max, min, max), a);
    }
    notify(BoardChange::Kind::AxisChanged, no_item, orientation);
    return EditStatus::Ok;
}

Position Board::clamp(Position position) const {
    return Position{ clamp_to(position.x, x_axis_), clamp_to(position.y, y_axis_) };
}

EditStatus Board::add(const std::string& label, Position position, ItemId& out_id) {
    std::string trimmed = trim_label(label);
    if (trimmed.empty()) return EditStatus::EmptyLabel;
    if (!is_finite(position)) return EditStatus::InvalidNumber;

    Item item;
    item.id = next_id_++;
    item.label = std::move(trimmed);
    item.position = clamp(position);
    out_id = item.id;
    items_.push_back(std::move(item));
    notify(BoardChange::Kind::ItemAdded, out_id);
    return EditStatus::Ok;
}

EditStatus Board::rename(ItemId id, const std::string& label) {
    Item* item = find_mutable(id);
    if (!item) return EditStatus::NotFound;
    std::string trimmed = trim_label(label);
    if (trimmed.empty()) return EditStatus::EmptyLabel;
    if (trimmed == item->label) return EditStatus::Ok;
    item->label = std::move(trimmed);
    notify(BoardChange::Kind::ItemRenamed, id);
    return EditStatus::Ok;
}

EditStatus Board::move(ItemId id, Position position) {
    Item* item = find_mutable(id);
    if (!item) return EditStatus::NotFound;
    if (!is_finite(position)) return EditStatus::InvalidNumber;
    const Position clamped = clamp(position);
    if (clamped.x == item->position.x && clamped.y == item->position.y) return EditStatus::Ok;
    item->position = clamped;
    notify(BoardChange::Kind::ItemMoved, id);
    return EditStatus::Ok;
}

EditStatus Board::update(ItemId id, const std::string& label, Position position) {
    Item* item = find_mutable(id);
    if (!item) return EditStatus::NotFound;
    std::string trimmed = trim_label(label);
    if (trimmed.empty()) return EditStatus::EmptyLabel;
    if (!is_finite(position)) return EditStatus::InvalidNumber;
    item->label = std::move(trimmed);
    item->position = clamp(position);
    notify(BoardChange::Kind::ItemUpdated, id);
    return EditStatus::Ok;
}

EditStatus Board::set_image(ItemId id, const std::string& image_path) {
    Item* item = find_mutable(id);
    if (!item) return EditStatus::NotFound;
    if (item->image_path == image_path) return EditStatus::Ok;
    item->image_path = image_path;
    notify(BoardChange::Kind::ItemUpdated, id);
    return EditStatus::Ok;
}

EditStatus Board::remove(ItemId id) {
    auto it = std::find_if(items_.begin(), items_.end(),
        [id](const Item& item) { return item.id == id; });
    if (it == items_.end()) return EditStatus::NotFound;
    items_.erase(it);
    notify(BoardChange::Kind::ItemRemoved, id);
    return EditStatus::Ok;
}

void Board::clear() {
    if (items_.empty()) return;
    items_.clear();
    notify(BoardChange::Kind::ItemsCleared);
}

const Item* Board::find(ItemId id) const {
    for (const auto& item : items_)
        if (item.id == id) return &item;
    return nullptr;
}

Item* Board::find_mutable(ItemId id) {
    for (auto& item : items_)
        if (item.id == id) return &item;
    return nullptr;
}

EditStatus Board::restore_item(const Item& item) {
    if (item.id == no_item) return EditStatus::NotFound;
    if (find(item.id)) return EditStatus::DuplicateId;
    std::string trimmed = trim_label(item.label);
    if (trimmed.empty()) return EditStatus::EmptyLabel;
    if (!is_finite(item.position)) return EditStatus::InvalidNumber;

    Item restored;
    restored.id = item.id;
    restored.label = std::move(trimmed);
    restored.position = clamp(item.position);
    restored.image_path = item.image_path;
    items_.push_back(std::move(restored));
    if (item.id >= next_id_) next_id_ = item.id + 1;
    notify(BoardChange::Kind::ItemAdded, item.id);
    return EditStatus::Ok;
}

void Board::set_next_id(ItemId id) {
    ItemId floor_id = 1;
    for (const auto& item : items_)
        floor_id = std::max(floor_id, item.id + 1);
    next_id_ = std::max(id, floor_id);
}

void Board::replace_with(Board&& other) {
    name_ = std::move(other.name_);
    x_axis_ = std::move(other.x_axis_);
    y_axis_ = std::move(other.y_axis_);
    items_ = std::move(other.items_);
    next_id_ = other.next_id_;
    notify(BoardChange::Kind::Replaced);
}

std::size_t Board::add_listener(BoardListener listener) {
    const std::size_t handle = next_listener_handle_++;
    listeners_.emplace_back(handle, std::move(listener));
    return handle;
}

void Board::remove_listener(std::size_t handle) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
        [handle](const auto& entry) { return entry.first == handle; }), listeners_.end());
}

void Board::notify(BoardChange::Kind kind, ItemId item_id, Orientation axis) {
    ++revision_;
    if (kind == BoardChange::Kind::AxisChanged || kind == BoardChange::Kind::Replaced)
        ++axes_revision_;
    BoardChange change;
    change.kind = kind;
    change.item_id = item_id;
    change.axis = axis;
    // Copy so a listener may unsubscribe while being called.
    const auto listeners = listeners_;
    for (const auto& [handle, listener] : listeners) {
        (void)handle;
        if (listener) listener(change);
    }
}

} // namespace board_model
