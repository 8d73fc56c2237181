#pragma once

#include <board_render/renderer.hpp>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace item_images {

// Item pictures decoded with SDL3_image and uploaded as OpenGL textures,
// keyed by file path. A file that changes on disk is reloaded; one that fails
// to load is not retried until it changes. Needs a current GL context for its
// whole lifetime.
class TextureCache {
public:
    TextureCache() = default;
    ~TextureCache();

    TextureCache(const TextureCache&) = delete;
    TextureCache& operator=(const TextureCache&) = delete;

    const board_render::MarkerImage* find(const std::string& path);
    void clear();

    board_render::ImageLookup lookup() {
        return [this](const std::string& path) { return find(path); };
    }

private:
    struct Entry {
        board_render::MarkerImage image;
        std::filesystem::file_time_type stamp{};
        bool ok = false;
    };

    bool load(const std::string& path, Entry& entry);
    void release(Entry& entry);

    std::unordered_map<std::string, Entry> entries_;
};

} // namespace item_images
