#pragma once

#include <board_model/edit_status.hpp>
#include <board_model/types.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace board_model {

struct BoardChange {
    enum class Kind {
        ItemAdded,
        ItemRenamed,
        ItemMoved,
        ItemUpdated,
        ItemRemoved,
        ItemsCleared,
        AxisChanged,
        NameChanged,
        Replaced,
    };
    Kind kind = Kind::Replaced;
    ItemId item_id = no_item;              // set for Item* kinds
    Orientation axis = Orientation::Horizontal; // set for AxisChanged
};

using BoardListener = std::function<void(const BoardChange&)>;

// Two axes plus the ordered items placed on them.
//
// Positions are kept inside the axis ranges at all times: add/move/update clamp,
// and a range change rescales every item proportionally onto the new range.
// Listeners are notified synchronously after each successful mutation.
class Board {
public:
    Board();

    const std::string& name() const { return name_; }
    void set_name(const std::string& name);

    const Axis& axis(Orientation orientation) const;
    const Axis& x_axis() const { return x_axis_; }
    const Axis& y_axis() const { return y_axis_; }

    EditStatus set_axis_name(Orientation orientation, const std::string& name);
    EditStatus set_axis_side_labels(Orientation orientation,
        const std::string& min_label, const std::string& max_label);
    EditStatus set_axis_range(Orientation orientation, double min, double max);

    EditStatus add(const std::string& label, Position position, ItemId& out_id);
    EditStatus rename(ItemId id, const std::string& label);
    EditStatus move(ItemId id, Position position);
    EditStatus update(ItemId id, const std::string& label, Position position);
    // Empty path clears the image. The file itself is managed by the caller.
    EditStatus set_image(ItemId id, const std::string& image_path);
    EditStatus remove(ItemId id);
    void clear();

    const std::vector<Item>& list() const { return items_; }
    const Item* find(ItemId id) const;
    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    Position clamp(Position position) const;

    // Used by loaders: inserts an item keeping its id. Ids stay unique and the
    // id counter is advanced past it.
    EditStatus restore_item(const Item& item);
    ItemId next_id() const { return next_id_; }
    void set_next_id(ItemId id);

    // Takes over axes, items and ids of other; keeps this board's listeners.
    void replace_with(Board&& other);

    std::size_t add_listener(BoardListener listener);
    void remove_listener(std::size_t handle);

    // Incremented by every successful mutation.
    std::uint64_t revision() const { return revision_; }
    // Incremented only when an axis changes or the board is replaced.
    std::uint64_t axes_revision() const { return axes_revision_; }

private:
    Axis& axis_ref(Orientation orientation);
    Item* find_mutable(ItemId id);
    void notify(BoardChange::Kind kind, ItemId item_id = no_item,
        Orientation axis = Orientation::Horizontal);

    std::string name_;
    Axis x_axis_;
    Axis y_axis_;
    std::vector<Item> items_;
    ItemId next_id_ = 1;
    std::uint64_t revision_ = 0;
    std::uint64_t axes_revision_ = 0;
    std::vector<std::pair<std::size_t, BoardListener>> listeners_;
    std::size_t next_listener_handle_ = 1;
};

// Trims surrounding white space. Labels and axis texts pass through this.
std::string trim_label(const std::string& text);

// Linear map of value from [from_min, from_max] onto [to_min, to_max].
double rescale_value(double value, double from_min, double from_max, double to_min, double to_max);

} // namespace board_model
