#include <board_loaders/json_loader.hpp>
#include <app_log/log.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace board_loaders {

namespace {

const char* const format_tag = "quadrant-board";
constexpr int format_version = 1;

void set_error(std::string* error, const std::string& message) {
    if (error) *error = message;
}

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

bool parse_axis(const nlohmann::json& j, board_model::Orientation orientation,
    board_model::Board& board, std::string* error)
{
    const char* which = orientation == board_model::Orientation::Horizontal ? "x" : "y";
    if (!j.is_object()) {
        set_error(error, std::string("axis '") + which + "' must be an object");
        return false;
    }
    const board_model::Axis& defaults = board.axis(orientation);

    double min = defaults.min;
    double max = defaults.max;
    if (j.contains("min")) {
        if (!j["min"].is_number()) {
            set_error(error, std::string("axis '") + which + "' min is not a number");
            return false;
        }
        min = j["min"].get<double>();
    }
    if (j.contains("max")) {
        if (!j["max"].is_number()) {
            set_error(error, std::string("axis '") + which + "' max is not a number");
            return false;
        }
        max = j["max"].get<double>();
    }
    const board_model::EditStatus range_status = board.set_axis_range(orientation, min, max);
    if (range_status != board_model::EditStatus::Ok) {
        set_error(error, std::string("axis '") + which + "': " + board_model::describe(range_status));
        return false;
    }

    (void)board.set_axis_name(orientation, string_or(j, "name", defaults.name));
    const std::string min_label = string_or(j, "min_label", defaults.min_label);
    const std::string max_label = string_or(j, "max_label", defaults.max_label);
    (void)board.set_axis_side_labels(orientation, min_label, max_label);
    return true;
}

std::optional<board_model::Board> parse_board_json(const nlohmann::json& j, std::string* error) {
    if (!j.is_object()) {
        set_error(error, "document is not a JSON object");
        return std::nullopt;
    }
    if (j.contains("format") && (!j["format"].is_string() || j["format"].get<std::string>() != format_tag)) {
        set_error(error, "not a quadrant board file");
        return std::nullopt;
    }
    if (j.contains("version") && (!j["version"].is_number_integer() || j["version"].get<int>() > format_version)) {
        set_error(error, "unsupported board file version");
        return std::nullopt;
    }
    if (!j.contains("axes") || !j["axes"].is_object()) {
        set_error(error, "missing 'axes' object");
        return std::nullopt;
    }
    if (!j.contains("items") || !j["items"].is_array()) {
        set_error(error, "missing 'items' array");
        return std::nullopt;
    }

    board_model::Board board;
    const auto& axes = j["axes"];
    if (axes.contains("x") && !parse_axis(axes["x"], board_model::Orientation::Horizontal, board, error))
        return std::nullopt;
    if (axes.contains("y") && !parse_axis(axes["y"], board_model::Orientation::Vertical, board, error))
        return std::nullopt;

    std::size_t index = 0;
    for (const auto& it : j["items"]) {
        const std::string where = "item #" + std::to_string(index++);
        if (!it.is_object()) {
            set_error(error, where + " is not an object");
            return std::nullopt;
        }
        if (!it.contains("id") || !it["id"].is_number_unsigned()
            || it["id"].get<board_model::ItemId>() == board_model::no_item) {
            set_error(error, where + " has no valid 'id'");
            return std::nullopt;
        }
        if (!it.contains("label") || !it["label"].is_string()) {
            set_error(error, where + " has no 'label'");
            return std::nullopt;
        }
        board_model::Item item;
        item.id = it["id"].get<board_model::ItemId>();
        item.label = it["label"].get<std::string>();
        for (const char* key : {"x", "y"}) {
            if (it.contains(key) && !it[key].is_number()) {
                set_error(error, where + " coordinate '" + key + "' is not a number");
                return std::nullopt;
            }
        }
        item.position.x = it.contains("x") ? it["x"].get<double>() : 0.0;
        item.position.y = it.contains("y") ? it["y"].get<double>() : 0.0;
        if (it.contains("image")) {
            if (!it["image"].is_string()) {
                set_error(error, where + " 'image' is not a string");
                return std::nullopt;
            }
            item.image_path = it["image"].get<std::string>();
            std::error_code ec;
            if (!item.image_path.empty() && !std::filesystem::exists(item.image_path, ec)) {
                app_log::logger()->warn("load: item id={} image {} is missing, drawn as a plain marker",
                    item.id, item.image_path);
            }
        }

        const board_model::EditStatus status = board.restore_item(item);
        if (status != board_model::EditStatus::Ok) {
            set_error(error, where + ": " + board_model::describe(status));
            return std::nullopt;
        }
        const board_model::Item* restored = board.find(item.id);
        if (restored && (restored->position.x != item.position.x || restored->position.y != item.position.y)) {
            app_log::logger()->warn("load: item id={} '{}' clamped from ({}, {}) to ({}, {})",
                item.id, restored->label, item.position.x, item.position.y,
                restored->position.x, restored->position.y);
        }
    }

    if (j.contains("next_id") && j["next_id"].is_number_unsigned())
        board.set_next_id(j["next_id"].get<board_model::ItemId>());
    board.set_name(string_or(j, "name", ""));
    return board;
}

nlohmann::json axis_to_json(const board_model::Axis& a) {
    return nlohmann::json{
        {"name", a.name},
        {"min", a.min},
        {"max", a.max},
        {"min_label", a.min_label},
        {"max_label", a.max_label},
    };
}

} // namespace

std::optional<board_model::Board> load_board_from_json(std::istream& in, std::string* error) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_board_json(j, error);
    } catch (const nlohmann::json::exception& ex) {
        app_log::logger()->warn("load: JSON error: {}", ex.what());
        set_error(error, std::string("invalid JSON: ") + ex.what());
        return std::nullopt;
    }
}

std::optional<board_model::Board> load_board_from_json_file(const std::string& path, std::string* error) {
    std::ifstream f(path);
    if (!f) {
        set_error(error, "cannot open " + path);
        return std::nullopt;
    }
    std::string reason;
    auto board = load_board_from_json(f, &reason);
    if (board) {
        app_log::logger()->info("load: {} items from {}", board->size(), path);
    } else {
        app_log::logger()->error("load failed: {}: {}", path, reason);
        set_error(error, path + ": " + reason);
    }
    return board;
}

void write_board_json(const board_model::Board& board, std::ostream& out) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : board.list()) {
        nlohmann::json entry{
            {"id", item.id},
            {"label", item.label},
            {"x", item.position.x},
            {"y", item.position.y},
        };
        if (!item.image_path.empty()) entry["image"] = item.image_path;
        items.push_back(std::move(entry));
    }
    nlohmann::json j = {
        {"format", format_tag},
        {"version", format_version},
        {"name", board.name()},
        {"next_id", board.next_id()},
        {"axes", {{"x", axis_to_json(board.x_axis())}, {"y", axis_to_json(board.y_axis())}}},
        {"items", std::move(items)},
    };
    out << j.dump(2) << '\n';
}

bool save_board_to_json_file(const board_model::Board& board, const std::string& path, std::string* error) {
    const std::filesystem::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            set_error(error, "cannot create " + target.parent_path().string() + ": " + ec.message());
            app_log::logger()->error("save failed: {}", ec.message());
            return false;
        }
    }

    const std::filesystem::path tmp = target.string() + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) {
            set_error(error, "cannot write " + tmp.string());
            app_log::logger()->error("save failed: cannot open {}", tmp.string());
            return false;
        }
        write_board_json(board, f);
        f.flush();
        if (!f) {
            set_error(error, "write error on " + tmp.string());
            app_log::logger()->error("save failed: write error on {}", tmp.string());
            return false;
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        set_error(error, "cannot replace " + path + ": " + ec.message());
        app_log::logger()->error("save failed: rename {} -> {}: {}", tmp.string(), path, ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    app_log::logger()->debug("save: {} items to {}", board.size(), path);
    return true;
}

} // namespace board_loaders
