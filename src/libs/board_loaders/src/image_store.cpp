#include <board_loaders/image_store.hpp>
#include <app_log/log.hpp>
#include <filesystem>
#include <system_error>

namespace board_loaders {

namespace {

void set_error(std::string* error, const std::string& message) {
    if (error) *error = message;
}

bool is_inside(const std::filesystem::path& file, const std::filesystem::path& dir) {
    std::error_code ec;
    const auto f = std::filesystem::weakly_canonical(file, ec);
    if (ec) return false;
    const auto d = std::filesystem::weakly_canonical(dir, ec);
    if (ec) return false;
    auto fi = f.begin();
    for (auto di = d.begin(); di != d.end(); ++di, ++fi) {
        if (di->empty()) continue; // trailing separator
        if (fi == f.end() || *fi != *di) return false;
    }
    return fi != f.end();
}

} // namespace

std::string images_dir_for(const std::string& board_path) {
    return (std::filesystem::path(board_path).parent_path() / "images").string();
}

std::optional<std::string> import_item_image(const std::string& source, const std::string& images_dir,
    board_model::ItemId id, std::string* error)
{
    const std::filesystem::path src(source);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(src, ec)) {
        set_error(error, "no image file at " + source);
        return std::nullopt;
    }

    const std::filesystem::path dir(images_dir);
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        set_error(error, "cannot create " + images_dir + ": " + ec.message());
        app_log::logger()->error("image import failed: {}", ec.message());
        return std::nullopt;
    }

    const std::filesystem::path dest = dir / (std::to_string(id) + "_" + src.filename().string());
    if (std::filesystem::equivalent(src, dest, ec)) return dest.string();
    std::filesystem::copy_file(src, dest, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        set_error(error, "cannot copy " + source + ": " + ec.message());
        app_log::logger()->error("image import failed: {} -> {}: {}", source, dest.string(), ec.message());
        return std::nullopt;
    }
    app_log::logger()->info("image: {} imported as {}", source, dest.string());
    return dest.string();
}

bool remove_item_image(const std::string& image_path, const std::string& images_dir) {
    if (image_path.empty() || !is_inside(image_path, images_dir)) return false;
    std::error_code ec;
    const bool removed = std::filesystem::remove(image_path, ec);
    if (ec) {
        app_log::logger()->warn("image: cannot remove {}: {}", image_path, ec.message());
        return false;
    }
    return removed;
}

} // namespace board_loaders
