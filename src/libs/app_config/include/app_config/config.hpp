#pragma once

#include <istream>
#include <string>
#include <vector>

namespace app_config {

struct AppConfig {
    std::string board_path = "data/board.json";
    std::string config_path;
    std::string log_file = "logs/quadrant_latest.log";
    std::string log_level = "info";
    double snap_step = 0.0; // 0 = continuous positions
    bool autosave = true;
    // 0 = two thirds of the usable display bounds.
    int window_width = 0;
    int window_height = 0;
    float font_size = 19.0f;
    float marker_radius = 7.0f;
};

// Overrides fields present in a JSON settings object. Bad values are reported
// in warnings and leave the field unchanged. Returns false if the document
// cannot be parsed at all.
bool apply_config_json(std::istream& in, AppConfig& config, std::vector<std::string>& warnings);
bool load_config_file(const std::string& path, AppConfig& config, std::vector<std::string>& warnings);

// Defaults, then the --config file (if any), then the remaining flags.
AppConfig resolve_config(int argc, char* argv[], std::vector<std::string>& warnings);

std::string usage();

} // namespace app_config
