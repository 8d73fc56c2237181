#pragma once

#include <board_model/board.hpp>
#include <cstddef>
#include <string>

namespace board_loaders {

// Keeps one Board in sync with its JSON file.
//
// Every board change marks the saver dirty; autosave_if_dirty() writes at most
// once per call, so the frame loop calls it once per frame. After a failed load
// the file on disk is kept: hold_autosave() stops autosaving until the user
// saves explicitly with save_now().
class BoardSaver {
public:
    BoardSaver(board_model::Board& board, std::string path, bool autosave);
    ~BoardSaver();

    BoardSaver(const BoardSaver&) = delete;
    BoardSaver& operator=(const BoardSaver&) = delete;

    const std::string& path() const { return path_; }
    bool autosave_enabled() const { return autosave_; }
    bool dirty() const { return dirty_; }

    void hold_autosave() { held_ = true; }
    bool autosave_held() const { return held_; }

    // Explicit save. Releases a hold even if the write fails.
    bool save_now();

    // Returns false only when a save was attempted and failed.
    bool autosave_if_dirty();

    const std::string& last_error() const { return last_error_; }

private:
    board_model::Board& board_;
    std::string path_;
    bool autosave_ = true;
    bool held_ = false;
    bool dirty_ = false;
    std::string last_error_;
    std::size_t listener_handle_ = 0;
};

} // namespace board_loaders
