// =============================================================================
// VOXSTREAM - UPDATE SCHEDULER
// Per-frame session step: apply server events, move the player, remesh
// =============================================================================
#pragma once

#include "Client/ChunkMesh.hpp"
#include "Client/MeshGenerator.hpp"
#include "Client/OcclusionSnapshot.hpp"
#include "Client/Player.hpp"
#include "Shared/Channel.hpp"
#include "Shared/Collision.hpp"
#include "Shared/GameData.hpp"
#include "Shared/World.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace voxstream::client {

// =============================================================================
// MESH SINK
// Receives every rebuilt chunk mesh. The mesh is only valid during the call.
// =============================================================================
class MeshSink {
public:
    virtual ~MeshSink() = default;
    virtual void update_chunk_mesh(const ChunkPosition& pos, const ChunkMesh& mesh) = 0;
};

enum class SessionStatus : std::uint8_t {
    RUNNING,
    DISCONNECTED,   // server went away (terminal)
    DESYNC          // server sent data the client cannot interpret (terminal)
};

struct TickResult {
    SessionStatus status = SessionStatus::RUNNING;
    std::string error;
    std::uint32_t chunks_received = 0;
    std::uint32_t meshes_built = 0;
    Displacement applied{};
};

// =============================================================================
// SESSION BOOTSTRAP
// Polls until the server's GameData arrives. Returns nullptr on disconnect,
// on a chunk arriving before GameData, or after `timeout`.
// =============================================================================
[[nodiscard]] GameDataPtr wait_for_game_data(
    Client& client,
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(5)
);

// =============================================================================
// UPDATE SCHEDULER
// Owns the client chunk store. Steps, once per tick:
//   1. drain channel events (chunks replace by position, last arrival wins)
//   2. resolve the player's movement against the store and report it
//   3. remesh each chunk dirtied this tick once, including the neighbours of
//      every received chunk
// DISCONNECTED and DESYNC are terminal; later ticks do nothing.
// =============================================================================
class UpdateScheduler {
public:
    UpdateScheduler(Client& client, GameDataPtr game_data, MeshSink& sink);
    ~UpdateScheduler() = default;

    UpdateScheduler(const UpdateScheduler&) = delete;
    UpdateScheduler& operator=(const UpdateScheduler&) = delete;

    TickResult tick(Player& player, const Displacement& requested);

    [[nodiscard]] SessionStatus status() const noexcept { return m_status; }
    [[nodiscard]] const std::string& error() const noexcept { return m_error; }
    [[nodiscard]] const World& world() const noexcept { return m_world; }
    [[nodiscard]] const GameData& game_data() const noexcept { return *m_game_data; }

    // Totals over the session
    [[nodiscard]] std::uint64_t total_chunks_received() const noexcept { return m_total_chunks; }
    [[nodiscard]] std::uint64_t total_meshes_built() const noexcept { return m_total_meshes; }

private:
    // Returns false once the session became terminal
    bool drain_events(TickResult& result);
    bool apply_chunk(std::unique_ptr<Chunk> chunk, TickResult& result);
    void mark_dirty_with_neighbours(const ChunkPosition& pos);
    void rebuild_dirty(TickResult& result);
    void fail(SessionStatus status, std::string message, TickResult& result);

private:
    Client& m_client;
    GameDataPtr m_game_data;
    MeshSink& m_sink;

    World m_world;
    MeshGenerator m_mesh_gen;
    OcclusionSnapshot m_occlusion;
    ChunkMesh m_scratch;

    std::unordered_set<ChunkPosition> m_dirty;

    SessionStatus m_status = SessionStatus::RUNNING;
    std::string m_error;

    std::uint64_t m_total_chunks = 0;
    std::uint64_t m_total_meshes = 0;
};

} // namespace voxstream::client
