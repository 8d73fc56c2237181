#include <board_loaders/board_saver.hpp>
#include <board_loaders/json_loader.hpp>
#include <app_log/log.hpp>
#include <utility>

namespace board_loaders {

BoardSaver::BoardSaver(board_model::Board& board, std::string path, bool autosave)
    : board_(board)
    , path_(std::move(path))
    , autosave_(autosave)
{
    listener_handle_ = board_.add_listener([this](const board_model::BoardChange&) { dirty_ = true; });
}

BoardSaver::~BoardSaver() {
    board_.remove_listener(listener_handle_);
}

bool BoardSaver::save_now() {
    if (held_) {
        app_log::logger()->info("save: autosave resumed for {}", path_);
        held_ = false;
    }
    std::string error;
    if (!save_board_to_json_file(board_, path_, &error)) {
        last_error_ = "Save failed: " + error;
        return false;
    }
    last_error_.clear();
    dirty_ = false;
    return true;
}

bool BoardSaver::autosave_if_dirty() {
    if (!dirty_ || !autosave_ || held_) return true;
    std::string error;
    if (!save_board_to_json_file(board_, path_, &error)) {
        last_error_ = "Save failed: " + error;
        // Retried on the next change, not every frame.
        dirty_ = false;
        return false;
    }
    last_error_.clear();
    dirty_ = false;
    return true;
}

} // namespace board_loaders
