// Dot viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <canvas/canvas.hpp>
#include <xdot_loaders/layout_engine.hpp>
#include <xdot_loaders/viewer_config.hpp>
#include <xdot_parser/diagnostics.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> input;
    bool xdot_input = false;
};

void print_usage(const char* argv0) {
    (void)fprintf(stderr, "usage: %s [--config FILE] [--xdot] [--log-level LEVEL] [FILE|-]\n", argv0);
}

// Returns nullopt on a usage error.
std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--xdot") {
            cmd.xdot_input = true;
        } else if (arg == "--config" || arg == "--log-level") {
            if (i + 1 >= argc) return std::nullopt;
            (arg == "--config" ? cmd.config_path : cmd.log_level) = std::string(argv[++i]);
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            return std::nullopt;
        } else {
            if (cmd.input) return std::nullopt;
            cmd.input = arg;
        }
    }
    return cmd;
}

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

void setup_logging(const xdot_loaders::ViewerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (config.log_to_file) {
        try {
            const std::filesystem::path logs_dir = find_project_root() / "logs";
            std::filesystem::create_directories(logs_dir);
            const std::filesystem::path log_file = logs_dir / "xdotview_latest.log";
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true));
        } catch (const spdlog::spdlog_ex& e) {
            (void)fprintf(stderr, "log file unavailable: %s\n", e.what());
        } catch (const std::filesystem::filesystem_error& e) {
            (void)fprintf(stderr, "log file unavailable: %s\n", e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("xdotview", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    xdot_parser::set_diagnostics(logger);
}

std::optional<std::string> read_source(const std::string& path) {
    if (path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return ss.str();
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string display_name(const std::string& path) {
    if (path == "-") return "<stdin>";
    return std::filesystem::path(path).filename().string();
}

void load_fonts(ImGuiIO& io, const std::string& configured_path) {
    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 19.0f;

    if (!configured_path.empty() &&
        io.Fonts->AddFontFromFileTTF(configured_path.c_str(), font_size_px, &font_cfg) != nullptr)
        return;

    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr)
            break;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    const std::optional<CommandLine> cmd = parse_command_line(argc, argv);
    if (!cmd) {
        print_usage(argv[0]);
        return 2;
    }

    xdot_loaders::ViewerConfig config;
    if (cmd->config_path) {
        auto loaded = xdot_loaders::load_viewer_config_from_json_file(*cmd->config_path);
        if (!loaded) {
            (void)fprintf(stderr, "could not read config %s\n", cmd->config_path->c_str());
            return 1;
        }
        config = std::move(*loaded);
    }
    if (cmd->log_level) config.log_level = *cmd->log_level;
    setup_logging(config);

    SDL_SetMainReady();
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        spdlog::critical("SDL_Init failed: {}", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Dot Viewer", config.window_width, config.window_height, window_flags);
    if (!window) {
        spdlog::critical("SDL_CreateWindow failed: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        spdlog::critical("SDL_GL_CreateContext failed: {}", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;
    ImGui::StyleColorsLight();
    load_fonts(io, config.font_path);

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    auto engine = std::make_shared<xdot_loaders::DotProcessEngine>(config.layout_program, config.layout_format);
    xdot_loaders::AsyncLayout layout(engine);
    canvas::GraphCanvas graph_canvas;
    std::string last_url;
    graph_canvas.controller().set_clicked_handler(
        [&last_url](const std::string& url, const interaction::PointerEvent&) { last_url = url; });

    std::string error_message;
    bool open_error_popup = false;

    auto open_source = [&](const std::string& path) {
        auto text = read_source(path);
        if (!text) {
            spdlog::error("cannot open {}", path);
            error_message = "Could not open " + path;
            open_error_popup = true;
            return;
        }
        spdlog::info("loading {}", display_name(path));
        layout.submit(std::move(*text), path, cmd->xdot_input);
    };

    if (cmd->input) open_source(*cmd->input);

    char path_buffer[1024] = {};
    if (cmd->input && *cmd->input != "-")
        (void)snprintf(path_buffer, sizeof(path_buffer), "%s", cmd->input->c_str());

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

        if (auto done = layout.poll()) {
            if (auto* graph = std::get_if<xdot_model::Graph>(&done->result)) {
                graph_canvas.set_graph(std::move(*graph));
                const std::string title = display_name(done->source_name) + " - Dot Viewer";
                SDL_SetWindowTitle(window, title.c_str());
            } else {
                const auto& err = std::get<xdot_loaders::LoadError>(done->result);
                spdlog::error("{}: {}: {}", done->source_name, xdot_loaders::to_string(err.kind), err.message);
                error_message = "Could not parse " + display_name(done->source_name) + ", is it a valid dot file?";
                open_error_popup = true;
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Dot Viewer", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

        auto& controller = graph_canvas.controller();
        ImGui::SetNextItemWidth(260.0f);
        const bool submitted = ImGui::InputText("##path", path_buffer, sizeof(path_buffer),
            ImGuiInputTextFlags_EnterReturnsTrue);
        ImGui::SameLine();
        if ((ImGui::Button("Open") || submitted) && path_buffer[0] != '\0')
            open_source(path_buffer);
        ImGui::SameLine();
        if (ImGui::Button("Zoom In")) controller.zoom_in();
        ImGui::SameLine();
        if (ImGui::Button("Zoom Out")) controller.zoom_out();
        ImGui::SameLine();
        if (ImGui::Button("Zoom Fit")) controller.zoom_to_fit();
        ImGui::SameLine();
        if (ImGui::Button("100%")) controller.zoom_100();
        if (layout.busy()) {
            ImGui::SameLine();
            ImGui::TextUnformatted("laying out...");
        } else if (!last_url.empty()) {
            ImGui::SameLine();
            ImGui::Text("%s", last_url.c_str());
        }

        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
            graph_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }

        if (open_error_popup) {
            ImGui::OpenPopup("Dot Viewer##error");
            open_error_popup = false;
        }
        if (ImGui::BeginPopupModal("Dot Viewer##error", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
            ImGui::TextUnformatted(error_message.c_str());
            if (ImGui::Button("OK"))
                ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
        }
        ImGui::End();

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    layout.cancel();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
