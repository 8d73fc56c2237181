// Quadrant board editor: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <app_config/config.hpp>
#include <app_log/log.hpp>
#include <board_loaders/board_saver.hpp>
#include <board_loaders/image_store.hpp>
#include <board_loaders/json_loader.hpp>
#include <board_model/board.hpp>
#include <canvas/canvas.hpp>
#include <item_images/texture_cache.hpp>
#include <panels/panels.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace {

const float side_panel_width = 340.0f;

void load_font(float font_size_px) {
    ImGuiIO& io = ImGui::GetIO();
    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
#ifdef _WIN32
    const char* font_paths[] = {
        "C:\\Windows\\Fonts\\segoeui.ttf",
        "C:\\Windows\\Fonts\\arial.ttf",
    };
#else
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
#endif
    for (const char* path : font_paths) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr) return;
    }
    app_log::logger()->info("no system TTF font found, using the ImGui default font");
}

// Empty board when the file does not exist yet; empty board plus a message when
// it exists but cannot be loaded.
std::string load_initial_board(const std::string& path, board_model::Board& board) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        app_log::logger()->info("no board at {}, starting a new one", path);
        return {};
    }
    std::string error;
    auto loaded = board_loaders::load_board_from_json_file(path, &error);
    if (!loaded) return "Could not load board: " + error;
    board.replace_with(std::move(*loaded));
    return {};
}

} // namespace

int main(int argc, char* argv[])
{
    std::vector<std::string> config_warnings;
    const app_config::AppConfig config = app_config::resolve_config(argc, argv, config_warnings);

    spdlog::level::level_enum level = spdlog::level::info;
    if (!app_log::parse_level(config.log_level, level)) level = spdlog::level::info;
    auto logger = app_log::init(config.log_file, level);
    for (const auto& w : config_warnings) {
        logger->warn("{}", w);
        (void)fprintf(stderr, "%s\n", w.c_str());
    }
    if (!config_warnings.empty()) (void)fprintf(stderr, "%s", app_config::usage().c_str());

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        logger->critical("SDL_Init failed: {}", SDL_GetError());
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    int window_width = config.window_width > 0 ? config.window_width : 1000;
    int window_height = config.window_height > 0 ? config.window_height : 700;
    if (config.window_width <= 0 || config.window_height <= 0) {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Quadrant Ranking", window_width, window_height, window_flags);
    if (!window) {
        logger->critical("SDL_CreateWindow failed: {}", SDL_GetError());
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        logger->critical("SDL_GL_CreateContext failed: {}", SDL_GetError());
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();
    load_font(config.font_size);

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    board_model::Board board;
    const std::string load_error = load_initial_board(config.board_path, board);

    canvas::QuadrantCanvas quadrant_canvas(board);
    quadrant_canvas.set_snap_step(config.snap_step);
    quadrant_canvas.set_marker_radius(config.marker_radius);
    if (!load_error.empty())
        quadrant_canvas.show_message(load_error + " (autosave paused until \"Save now\")", 8.0f);

    // A file that failed to load is only overwritten by an explicit "Save now".
    board_loaders::BoardSaver saver(board, config.board_path, config.autosave);
    if (!load_error.empty()) saver.hold_autosave();

    item_images::TextureCache textures;
    quadrant_canvas.set_image_lookup(textures.lookup());

    panels::ItemPanelState item_panel;
    item_panel.images_dir = board_loaders::images_dir_for(config.board_path);
    panels::AxisPanelState axis_panel;
    panels::BoardPanelState board_panel;

    bool running = true;
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Quadrant", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

        ImGui::BeginChild("side_panel", ImVec2(side_panel_width, 0), true);
        board_model::ItemId selected = quadrant_canvas.selected_id();
        if (panels::draw_board_panel(board, board_panel, config.board_path, saver.last_error(),
                saver.autosave_held())
            && !saver.save_now())
            quadrant_canvas.show_message(saver.last_error());
        panels::draw_item_panel(board, item_panel, selected, textures.lookup());
        quadrant_canvas.set_selected_id(selected);
        panels::draw_axis_panel(board, axis_panel);
        ImGui::EndChild();

        ImGui::SameLine();
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoMove);
            quadrant_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        ImGui::End();

        if (!saver.autosave_if_dirty())
            quadrant_canvas.show_message(saver.last_error());

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        // HiDPI: use framebuffer size in pixels, not logical DisplaySize
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    if (!saver.autosave_if_dirty())
        logger->error("{}", saver.last_error());

    textures.clear();
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    logger->info("exit");
    return 0;
}
