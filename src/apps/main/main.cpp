// Linked scroll viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <linked_scroll/linked_scroll_group.hpp>
#include <linked_scroll/linked_scroll_position.hpp>
#include <scroll_canvas/scroll_pane.hpp>
#include <scroll_host/log.hpp>
#include <scroll_loaders/default_viewer_config.hpp>
#include <scroll_loaders/json_loader.hpp>
#include <scroll_physics/fling_simulation.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

void init_logging(const std::string& level) {
    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "linked_scroll_latest.log";
        auto logger = spdlog::basic_logger_mt("linked_scroll_viewer", log_file.string(), true);
        logger->set_level(spdlog::level::from_str(level));
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        scroll_host::install_scroll_logger(logger);
        logger->info("Logger initialized. file={} level={}", log_file.string(), level);
    } catch (const spdlog::spdlog_ex& ex) {
        (void)fprintf(stderr, "log file unavailable: %s\n", ex.what());
    }
}

scroll_model::ViewerConfig load_config(const std::optional<std::string>& explicit_path) {
    if (explicit_path) {
        auto loaded = scroll_loaders::load_viewer_config_from_json_file(*explicit_path);
        if (loaded) return std::move(*loaded);
        (void)fprintf(stderr, "could not load %s, using built-in config\n", explicit_path->c_str());
        return scroll_loaders::default_viewer_config();
    }
    const char* config_paths[] = { "data/linked_views.json", "linked_views.json" };
    for (const char* path : config_paths) {
        auto loaded = scroll_loaders::load_viewer_config_from_json_file(path);
        if (loaded) return std::move(*loaded);
    }
    return scroll_loaders::default_viewer_config();
}

scroll_physics::FlingSettings fling_settings(const scroll_model::FlingConfig& config) {
    scroll_physics::FlingSettings settings;
    settings.linear_damping = static_cast<float>(config.linear_damping);
    settings.min_fling_velocity = config.min_fling_velocity;
    settings.stop_velocity = config.stop_velocity;
    return settings;
}

// Number of attached panes whose offset differs from the driver's, after the
// pane's own clamping.
std::size_t count_out_of_sync(const std::vector<std::unique_ptr<scroll_canvas::ScrollPane>>& panes,
    const linked_scroll::LinkedScrollPosition& driver)
{
    std::size_t mismatches = 0;
    for (const auto& pane : panes) {
        if (!pane->enabled()) continue;
        const auto& position = pane->position();
        const double expected = position.extent().clamp(driver.pixels());
        if (std::abs(position.pixels() - expected) > 1e-6) {
            scroll_host::scroll_logger()->error("out_of_sync pane={} offset={} expected={}",
                pane->config().id, position.pixels(), expected);
            ++mismatches;
        }
    }
    return mismatches;
}

void present_frame(SDL_Window* window, SDL_GLContext gl_context, const ImGuiIO& io) {
    ImGui::Render();
    SDL_GL_MakeCurrent(window, gl_context);
    glViewport(0, 0, static_cast<int>(io.DisplaySize.x * io.DisplayFramebufferScale.x),
        static_cast<int>(io.DisplaySize.y * io.DisplayFramebufferScale.y));
    glClearColor(0.08f, 0.09f, 0.11f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    SDL_GL_SwapWindow(window);
}

} // namespace

int main(int argc, char* argv[])
{
    bool auto_sync_test = false;
    std::optional<std::string> config_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--auto-sync-test") {
            auto_sync_test = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
    }

    const scroll_model::ViewerConfig config = load_config(config_path);
    init_logging(config.log_level);

    SDL_SetMainReady();
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    // One column of roughly 320 px per pane.
    const int window_width = std::max(640, 320 * static_cast<int>(config.panes.size()));
    const int window_height = 720;
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    const std::string title = config.name.empty() ? std::string("Linked scroll") : config.name;
    SDL_Window* window = SDL_CreateWindow(title.c_str(), window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    auto simulations = std::make_shared<scroll_physics::FlingSimulationFactory>(fling_settings(config.fling));
    scroll_model::ScrollExtent group_extent;
    group_extent.min = 0.0;
    {
        linked_scroll::LinkedScrollGroup group(group_extent, simulations);
        // Declared after the group: panes are destroyed before the positions they use.
        std::vector<std::unique_ptr<scroll_canvas::ScrollPane>> panes;
        for (const auto& pane_config : config.panes) {
            auto& position = group.create_position();
            position.attach();
            panes.push_back(std::make_unique<scroll_canvas::ScrollPane>(position, pane_config));
        }
        scroll_host::scroll_logger()->info("viewer_started panes={}", panes.size());

        bool running = true;
        int frame = 0;
        const int drag_start_frame = 10;
        const int drag_end_frame = 40;
        const float drag_step_px = -15.0f;
        const double fling_velocity = 1800.0;
        const int max_test_frames = 1200;
        int settled_frames = 0;
        int test_exit_code = 0;
        scroll_host::DragHandle scripted_drag;

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
            ImGui::Begin("Linked views", nullptr,
                ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
                | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

            if (ImGui::Button("Reset"))
                group.reset_scroll();
            for (auto& pane : panes) {
                ImGui::SameLine();
                bool enabled = pane->enabled();
                if (ImGui::Checkbox(pane->config().label.c_str(), &enabled))
                    pane->set_enabled(enabled);
            }
            ImGui::SameLine();
            ImGui::Text("offset %.1f  attached %zu/%zu", group.offset(), group.attached_count(), group.size());

            ImVec2 avail = ImGui::GetContentRegionAvail();
            if (!panes.empty() && avail.x > 0 && avail.y > 0) {
                const float spacing = ImGui::GetStyle().ItemSpacing.x;
                const float column_width = (avail.x - spacing * static_cast<float>(panes.size() - 1))
                    / static_cast<float>(panes.size());
                for (std::size_t i = 0; i < panes.size(); ++i) {
                    if (i > 0) ImGui::SameLine();
                    ImGui::BeginChild(panes[i]->config().id.c_str(), ImVec2(column_width, avail.y), true,
                        ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
                    ImVec2 region = ImGui::GetContentRegionAvail();
                    panes[i]->update_and_draw(region.x, region.y);
                    ImGui::EndChild();
                }
            }
            ImGui::End();

            group.tick(io.DeltaTime);

            if (auto_sync_test && !panes.empty()) {
                auto& driver = panes.front()->position();
                if (frame == drag_start_frame) {
                    scripted_drag = driver.drag();
                } else if (frame > drag_start_frame && frame < drag_end_frame) {
                    scripted_drag.update(drag_step_px, 1.0f / 60.0f);
                } else if (frame == drag_end_frame) {
                    scripted_drag.end(fling_velocity);
                }

                const bool settled = frame > drag_end_frame && group.is_idle();
                settled_frames = settled ? settled_frames + 1 : 0;

                if (settled_frames >= 30 || frame >= max_test_frames) {
                    const std::size_t mismatches = count_out_of_sync(panes, driver);
                    (void)fprintf(stderr,
                        "[auto-sync-test] finished frame=%d settled=%d offset=%.2f fan_outs=%zu mismatches=%zu\n",
                        frame, settled ? 1 : 0, driver.pixels(), group.counters().fan_outs, mismatches);
                    test_exit_code = mismatches == 0 && settled ? 0 : 2;
                    running = false;
                }
            }

            present_frame(window, gl_context, io);
            ++frame;
        }

        scripted_drag.cancel();
        for (auto& pane : panes) {
            auto& position = pane->position();
            pane.reset();
            group.remove_position(position);
        }
        panes.clear();

        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();

        SDL_GL_DestroyContext(gl_context);
        SDL_DestroyWindow(window);
        SDL_Quit();
        if (auto_sync_test) {
            return test_exit_code;
        }
    }
    return 0;
}
