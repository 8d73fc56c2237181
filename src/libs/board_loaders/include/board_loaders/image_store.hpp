#pragma once

#include <board_model/types.hpp>
#include <optional>
#include <string>

namespace board_loaders {

// "images" next to the board file: "data/board.json" -> "data/images".
std::string images_dir_for(const std::string& board_path);

// Copies source into images_dir as "<id>_<file name>", creating the directory,
// and returns the copy's path. An existing copy of the same name is replaced.
std::optional<std::string> import_item_image(const std::string& source, const std::string& images_dir,
    board_model::ItemId id, std::string* error = nullptr);

// Deletes an image previously imported into images_dir. Paths outside
// images_dir are left alone and reported as not removed.
bool remove_item_image(const std::string& image_path, const std::string& images_dir);

} // namespace board_loaders
