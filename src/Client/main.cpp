// =============================================================================
// VOXSTREAM - ENTRY POINT
// Integrated single-player session: server thread + rendering client
// =============================================================================

#include "Shared/Types.hpp"
#include "Shared/Channel.hpp"
#include "Shared/Logger.hpp"
#include "Shared/Settings.hpp"
#include "Server/GameDataLoader.hpp"
#include "Server/IntegratedServer.hpp"
#include "Server/WorldGenerator.hpp"
#include "Client/Camera.hpp"
#include "Client/ClientSettings.hpp"
#include "Client/FpsCounter.hpp"
#include "Client/ImGuiDebugOverlay.hpp"
#include "Client/Player.hpp"
#include "Client/Renderer.hpp"
#include "Client/UpdateScheduler.hpp"
#include "Client/Window.hpp"

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <thread>

using namespace voxstream;
using namespace voxstream::client;

namespace {

constexpr std::chrono::seconds GAME_DATA_TIMEOUT{10};
constexpr double MAX_FRAME_TIME = 0.1;   // seconds, clamps movement after a stall

// =============================================================================
// APPLICATION STATE
// =============================================================================
struct AppState {
    ClientSettings settings;

    Player player;
    YawPitch view;
    PlayerController controller;
    bool flying = true;

    Camera camera;
    FpsCounter fps;
    ImGuiDebugOverlay debug_overlay;

    double last_time = 0.0;
    double delta_time = 0.0;
};

// =============================================================================
// INPUT PROCESSING
// =============================================================================
PlayerInput process_input(AppState& app, Window& window, const FrameInput& frame) {
    if (frame.toggle_capture) {
        window.set_mouse_captured(!window.mouse_captured());
    }
    if (frame.toggle_overlay) {
        app.debug_overlay.toggle_visibility();
    }
    if (frame.toggle_flying) {
        app.flying = !app.flying;
        LOG("Input", "Flying ", app.flying ? "on" : "off");
    }

    PlayerInput player_input;
    player_input.flying = app.flying;

    // Movement and look only while the game owns the mouse
    if (frame.mouse_captured) {
        app.view.update_cursor(frame.mouse_dx, frame.mouse_dy,
                               static_cast<double>(app.settings.mouse_sensitivity),
                               app.settings.invert_mouse);

        player_input.key_move_forward = frame.forward;
        player_input.key_move_left = frame.left;
        player_input.key_move_backward = frame.backward;
        player_input.key_move_right = frame.right;
        player_input.key_move_up = frame.up;
        player_input.key_move_down = frame.down;
    }

    player_input.yaw = app.view.yaw;
    player_input.pitch = app.view.pitch;
    return player_input;
}

DebugOverlayData collect_debug_data(const AppState& app, const UpdateScheduler& scheduler,
                                    const Renderer& renderer) {
    DebugOverlayData data;

    data.fps = static_cast<float>(app.fps.fps());
    data.frame_time_ms = static_cast<float>(app.delta_time * 1000.0);

    data.player_x = app.player.x();
    data.player_y = app.player.y();
    data.player_z = app.player.z();

    const ChunkPosition chunk = app.player.chunk_position();
    data.chunk_x = chunk.x;
    data.chunk_y = chunk.y;
    data.chunk_z = chunk.z;

    data.yaw = static_cast<float>(app.view.yaw);
    data.pitch = static_cast<float>(app.view.pitch);
    data.flying = app.flying;
    data.on_ground = app.controller.on_ground();

    data.chunks_loaded = scheduler.world().chunk_count();
    data.chunks_received = scheduler.total_chunks_received();
    data.meshes_built = scheduler.total_meshes_built();
    data.meshes_uploaded = renderer.uploaded_chunk_count();
    data.vertices = renderer.total_vertices();
    data.draw_calls = renderer.draw_calls_last_frame();
    return data;
}

} // namespace

// =============================================================================
// MAIN
// =============================================================================
int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    Logger::instance().open("voxstream.log");
    LOG_SEP();

    std::printf("=== VOXSTREAM ===\n");
    std::printf("Chunk size:      %u^3 blocks (%zu KiB)\n", CHUNK_SIZE, Chunk::DATA_SIZE_BYTES / 1024);
    std::printf("ChunkVertex:     %zu bytes\n", sizeof(ChunkVertex));
    std::printf("=================\n\n");

    AppState app;

    Settings settings;
    settings.load_first("settings.toml");
    app.settings = ClientSettings::from(settings);
    app.controller.set_speed(static_cast<double>(app.settings.player_speed));

    // =========================================================================
    // INTEGRATED SERVER
    // =========================================================================
    GameDataPtr server_data = server::load_game_data();
    if (!server_data) {
        std::fprintf(stderr, "Failed to load game data\n");
        return 1;
    }

    std::string error;
    auto flat = server::SuperflatConfig::from_names(server_data->blocks,
                                                    server::SuperflatConfig::default_layer_names(), error);
    if (!flat) {
        std::fprintf(stderr, "[Server] %s\n", error.c_str());
        return 1;
    }

    server::ServerConfig server_config;
    for (std::size_t i = 0; i < server_config.render_distance.size(); ++i) {
        server_config.render_distance[i] = static_cast<std::uint32_t>(app.settings.render_distance[i]);
    }

    ChannelPair channel = create_in_process_channel();
    std::unique_ptr<Client> client = std::move(channel.first);
    std::unique_ptr<Server> server_endpoint = std::move(channel.second);

    std::atomic<bool> stop_server{false};
    std::thread server_thread([&stop_server, &server_data, &flat, &server_config,
                               endpoint = std::move(server_endpoint)]() {
        Logger::set_thread_name("server");
        server::IntegratedServer integrated(*endpoint, server_data,
                                            std::make_unique<server::SuperflatGenerator>(*flat), server_config);
        integrated.run(stop_server);
    });

    auto shutdown_server = [&]() {
        stop_server.store(true, std::memory_order_release);
        client.reset();
        if (server_thread.joinable()) {
            server_thread.join();
        }
    };

    // =========================================================================
    // WINDOW + UI
    // =========================================================================
    GlfwLibrary glfw;
    Window window;
    if (!glfw.ok() || !window.open(app.settings, "voxstream")) {
        std::fprintf(stderr, "Failed to create window\n");
        shutdown_server();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window.handle(), true);
    ImGui_ImplOpenGL3_Init("#version 450");

    int exit_code = 0;
    {
        // =====================================================================
        // SESSION
        // =====================================================================
        GameDataPtr game_data = wait_for_game_data(*client, GAME_DATA_TIMEOUT);

        Renderer renderer;
        if (!game_data) {
            std::fprintf(stderr, "No game data from server\n");
            exit_code = 1;
        } else if (!renderer.initialize(game_data->texture_atlas)) {
            std::fprintf(stderr, "Failed to initialize renderer\n");
            exit_code = 1;
        }

        if (exit_code == 0) {
            UpdateScheduler scheduler(*client, game_data, renderer);

            app.camera.set_lens(app.settings.fov, window.aspect_ratio());
            LOG_MAT4("Camera", "Projection", app.camera.projection().ptr());
            window.set_mouse_captured(true);

            std::printf("\n--- Controls ---\n");
            std::printf("WASD:     Move\n");
            std::printf("Space:    Up / Jump\n");
            std::printf("Shift:    Down\n");
            std::printf("Mouse:    Look\n");
            std::printf("F:        Toggle flying\n");
            std::printf("ESC:      Toggle mouse capture\n");
            std::printf("F3:       Debug overlay\n");
            std::printf("----------------\n\n");

            app.last_time = Window::time();

            while (!window.should_close()) {
                const double current_time = Window::time();
                app.delta_time = std::min(current_time - app.last_time, MAX_FRAME_TIME);
                app.last_time = current_time;

                const FrameInput frame = window.poll();
                const PlayerInput input = process_input(app, window, frame);

                const Displacement requested = app.controller.requested_displacement(input, app.delta_time);
                const TickResult result = scheduler.tick(app.player, requested);
                if (result.status != SessionStatus::RUNNING) {
                    std::fprintf(stderr, "[Session] %s\n", result.error.c_str());
                    LOG("Session", "Ended: ", result.error);
                    exit_code = 1;
                    break;
                }
                app.controller.on_resolved(requested, result.applied);

                // Camera follows the player's eye
                app.camera.follow(app.player, app.view);
                if (app.camera.rebase()) {
                    LOG("Camera", "Render origin moved to ", app.camera.render_origin().x, ", ",
                        app.camera.render_origin().y, ", ", app.camera.render_origin().z);
                }
                app.camera.set_lens(app.settings.fov, window.aspect_ratio());

                app.fps.add_frame();

                renderer.begin_frame();
                renderer.set_camera(app.camera);
                renderer.render_chunks();

                ImGui_ImplOpenGL3_NewFrame();
                ImGui_ImplGlfw_NewFrame();
                app.debug_overlay.begin_frame();
                app.debug_overlay.render(collect_debug_data(app, scheduler, renderer));
                app.debug_overlay.end_frame();
                ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

                window.present();
            }
        }

        renderer.shutdown();
    }

    // Cleanup
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    window.close();

    shutdown_server();
    Logger::instance().close();

    std::printf("\n=== SHUTDOWN COMPLETE ===\n");
    return exit_code;
}
