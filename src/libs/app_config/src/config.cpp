#include <app_config/config.hpp>
#include <app_log/log.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <type_traits>

namespace app_config {

namespace {

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool valid_level(const std::string& text) {
    spdlog::level::level_enum level;
    return app_log::parse_level(text, level);
}

void read_string(const nlohmann::json& j, const char* key, std::string& field,
    std::vector<std::string>& warnings)
{
    if (!j.contains(key)) return;
    if (!j[key].is_string() || j[key].get<std::string>().empty()) {
        warnings.push_back(std::string("config: '") + key + "' must be a non-empty string");
        return;
    }
    field = j[key].get<std::string>();
}

template <typename T>
void read_number(const nlohmann::json& j, const char* key, T& field, T min_value,
    std::vector<std::string>& warnings)
{
    if (!j.contains(key)) return;
    const nlohmann::json& v = j[key];
    bool ok = v.is_number();
    if constexpr (std::is_integral_v<T>) ok = ok && v.is_number_integer();
    // Compared as double so that out-of-range values are rejected before any
    // narrowing conversion to T.
    ok = ok && v.get<double>() >= static_cast<double>(min_value)
        && v.get<double>() <= static_cast<double>(std::numeric_limits<T>::max());
    if (!ok) {
        warnings.push_back(std::string("config: '") + key + "' must be "
            + (std::is_integral_v<T> ? "an integer" : "a number") + " in ["
            + std::to_string(min_value) + ", " + std::to_string(std::numeric_limits<T>::max()) + "]");
        return;
    }
    field = v.get<T>();
}

} // namespace

bool apply_config_json(std::istream& in, AppConfig& config, std::vector<std::string>& warnings) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
        warnings.push_back(std::string("config: ") + ex.what());
        return false;
    }
    if (!j.is_object()) {
        warnings.push_back("config: settings must be a JSON object");
        return false;
    }

    read_string(j, "board_path", config.board_path, warnings);
    read_string(j, "log_file", config.log_file, warnings);
    if (j.contains("log_level")) {
        if (j["log_level"].is_string() && valid_level(j["log_level"].get<std::string>()))
            config.log_level = j["log_level"].get<std::string>();
        else
            warnings.push_back("config: unknown 'log_level'");
    }
    read_number(j, "snap_step", config.snap_step, 0.0, warnings);
    if (j.contains("autosave")) {
        if (j["autosave"].is_boolean())
            config.autosave = j["autosave"].get<bool>();
        else
            warnings.push_back("config: 'autosave' must be true or false");
    }
    read_number(j, "window_width", config.window_width, 0, warnings);
    read_number(j, "window_height", config.window_height, 0, warnings);
    read_number(j, "font_size", config.font_size, 6.0f, warnings);
    read_number(j, "marker_radius", config.marker_radius, 2.0f, warnings);
    return true;
}

bool load_config_file(const std::string& path, AppConfig& config, std::vector<std::string>& warnings) {
    std::ifstream f(path);
    if (!f) {
        warnings.push_back("config: cannot open " + path);
        return false;
    }
    return apply_config_json(f, config, warnings);
}

AppConfig resolve_config(int argc, char* argv[], std::vector<std::string>& warnings) {
    AppConfig config;

    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config.config_path = argv[i + 1];
            break;
        }
    }
    if (!config.config_path.empty() && !load_config_file(config.config_path, config, warnings))
        warnings.push_back("config: settings file ignored, using defaults");

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--no-autosave") {
            config.autosave = false;
        } else if (arg == "--config" || arg == "--board" || arg == "--log-file"
            || arg == "--log-level" || arg == "--snap")
        {
            if (!has_value) {
                warnings.push_back(arg + " needs a value");
                continue;
            }
            const std::string value = argv[++i];
            if (arg == "--board") {
                config.board_path = value;
            } else if (arg == "--log-file") {
                config.log_file = value;
            } else if (arg == "--log-level") {
                if (valid_level(value)) config.log_level = value;
                else warnings.push_back("unknown log level '" + value + "'");
            } else if (arg == "--snap") {
                double step = 0;
                if (parse_double(value, step) && step >= 0.0) config.snap_step = step;
                else warnings.push_back("--snap expects a number >= 0, got '" + value + "'");
            }
        } else {
            warnings.push_back("unknown argument '" + arg + "'");
        }
    }
    return config;
}

std::string usage() {
    return "usage: quadrant_board [--board <path>] [--config <path>] [--log-file <path>]\n"
           "                      [--log-level <trace|debug|info|warn|error>] [--snap <step>]\n"
           "                      [--no-autosave]\n";
}

} // namespace app_config
