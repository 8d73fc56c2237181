#pragma once

#include <board_model/board.hpp>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace board_loaders {

// On failure error (when given) receives a one-line reason.
std::optional<board_model::Board> load_board_from_json(std::istream& in, std::string* error = nullptr);
std::optional<board_model::Board> load_board_from_json_file(const std::string& path, std::string* error = nullptr);

void write_board_json(const board_model::Board& board, std::ostream& out);

// Writes to "<path>.tmp" and renames it over path. Creates the parent directory.
bool save_board_to_json_file(const board_model::Board& board, const std::string& path,
    std::string* error = nullptr);

} // namespace board_loaders
