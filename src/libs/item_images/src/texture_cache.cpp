#include <item_images/texture_cache.hpp>
#include <app_log/log.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_opengl.h>
#include <SDL3_image/SDL_image.h>
#include <system_error>

namespace item_images {

TextureCache::~TextureCache() {
    clear();
}

const board_render::MarkerImage* TextureCache::find(const std::string& path) {
    if (path.empty()) return nullptr;

    std::error_code ec;
    const auto stamp = std::filesystem::last_write_time(path, ec);
    auto it = entries_.find(path);
    if (it != entries_.end() && !ec && it->second.stamp == stamp)
        return it->second.ok ? &it->second.image : nullptr;

    if (ec) {
        // Missing file: remember the failure once.
        if (it == entries_.end()) {
            app_log::logger()->warn("image: cannot read {}: {}", path, ec.message());
            entries_.emplace(path, Entry{});
        } else if (it->second.ok) {
            release(it->second);
        }
        return nullptr;
    }

    Entry& entry = entries_[path];
    release(entry);
    entry.stamp = stamp;
    entry.ok = load(path, entry);
    return entry.ok ? &entry.image : nullptr;
}

bool TextureCache::load(const std::string& path, Entry& entry) {
    SDL_Surface* loaded = IMG_Load(path.c_str());
    if (!loaded) {
        app_log::logger()->warn("image: cannot decode {}: {}", path, SDL_GetError());
        return false;
    }
    SDL_Surface* rgba = SDL_ConvertSurface(loaded, SDL_PIXELFORMAT_RGBA32);
    SDL_DestroySurface(loaded);
    if (!rgba) {
        app_log::logger()->warn("image: cannot convert {}: {}", path, SDL_GetError());
        return false;
    }

    GLuint texture = 0;
    glGenTextures(1, &texture);
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, rgba->pitch / 4);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, rgba->w, rgba->h, 0, GL_RGBA, GL_UNSIGNED_BYTE, rgba->pixels);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);
    glBindTexture(GL_TEXTURE_2D, 0);

    entry.image.texture = texture;
    entry.image.width = rgba->w;
    entry.image.height = rgba->h;
    SDL_DestroySurface(rgba);
    app_log::logger()->debug("image: loaded {} ({}x{})", path, entry.image.width, entry.image.height);
    return true;
}

void TextureCache::release(Entry& entry) {
    if (entry.image.texture != 0) {
        const GLuint texture = static_cast<GLuint>(entry.image.texture);
        glDeleteTextures(1, &texture);
    }
    entry.image = board_render::MarkerImage{};
    entry.ok = false;
}

void TextureCache::clear() {
    for (auto& [path, entry] : entries_) {
        (void)path;
        release(entry);
    }
    entries_.clear();
}

} // namespace item_images
