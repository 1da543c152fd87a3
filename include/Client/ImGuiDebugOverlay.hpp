// =============================================================================
// VOXSTREAM - DEBUG OVERLAY
// F3 window with frame timing, player state and streaming counters
// =============================================================================
#pragma once

#include <imgui.h>

#include <cstdint>

namespace voxstream::client {

struct DebugOverlayData {
    float fps = 0.0f;
    float frame_time_ms = 0.0f;

    double player_x = 0.0;
    double player_y = 0.0;
    double player_z = 0.0;
    std::int64_t chunk_x = 0;
    std::int64_t chunk_y = 0;
    std::int64_t chunk_z = 0;
    float yaw = 0.0f;
    float pitch = 0.0f;
    bool flying = true;
    bool on_ground = false;

    std::uint64_t chunks_loaded = 0;
    std::uint64_t chunks_received = 0;
    std::uint64_t meshes_built = 0;
    std::uint64_t meshes_uploaded = 0;
    std::uint64_t vertices = 0;
    std::uint64_t draw_calls = 0;
};

class ImGuiDebugOverlay {
public:
    void begin_frame() { ImGui::NewFrame(); }
    void end_frame() { ImGui::Render(); }

    void toggle_visibility() { m_visible = !m_visible; }
    [[nodiscard]] bool is_visible() const noexcept { return m_visible; }

    void render(const DebugOverlayData& d) {
        if (!m_visible) return;

        constexpr ImGuiWindowFlags flags = ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                                           ImGuiWindowFlags_AlwaysAutoResize;
        ImGui::SetNextWindowPos(ImVec2(8.0f, 8.0f), ImGuiCond_Always);
        ImGui::SetNextWindowBgAlpha(0.75f);

        if (ImGui::Begin("voxstream", &m_visible, flags)) {
            heading("Frame");
            ImGui::Text("%.0f fps  %.2f ms  %llu draws", static_cast<double>(d.fps),
                        static_cast<double>(d.frame_time_ms), as_ull(d.draw_calls));

            heading("Player");
            ImGui::Text("xyz   %.2f / %.2f / %.2f", d.player_x, d.player_y, d.player_z);
            ImGui::Text("chunk %lld / %lld / %lld", static_cast<long long>(d.chunk_x),
                        static_cast<long long>(d.chunk_y), static_cast<long long>(d.chunk_z));
            ImGui::Text("look  %.1f yaw  %.1f pitch", static_cast<double>(d.yaw), static_cast<double>(d.pitch));
            ImGui::Text("%s%s", d.flying ? "flying" : "walking", d.on_ground ? ", on ground" : "");

            heading("Streaming");
            ImGui::Text("stored   %llu chunks (%llu received)", as_ull(d.chunks_loaded), as_ull(d.chunks_received));
            ImGui::Text("meshed   %llu", as_ull(d.meshes_built));
            ImGui::Text("on GPU   %llu meshes, %llu vertices", as_ull(d.meshes_uploaded), as_ull(d.vertices));
        }
        ImGui::End();
    }

private:
    static void heading(const char* label) {
        ImGui::Spacing();
        ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.4f, 1.0f), "%s", label);
        ImGui::Separator();
    }

    static unsigned long long as_ull(std::uint64_t v) { return static_cast<unsigned long long>(v); }

    bool m_visible = false;
};

} // namespace voxstream::client
