// =============================================================================
// VOXSTREAM - UPDATE SCHEDULER IMPLEMENTATION
// =============================================================================

#include "Client/UpdateScheduler.hpp"
#include "Shared/Logger.hpp"

#include <cstdio>
#include <thread>
#include <utility>
#include <variant>

namespace voxstream::client {

// =============================================================================
// SESSION BOOTSTRAP
// =============================================================================

GameDataPtr wait_for_game_data(
    Client& client,
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds poll_interval
) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        ClientEvent event = client.receive_event();

        if (std::holds_alternative<client_event::NoEvent>(event)) {
            if (std::chrono::steady_clock::now() >= deadline) {
                std::fprintf(stderr, "[Session] Timed out waiting for game data\n");
                return nullptr;
            }
            std::this_thread::sleep_for(poll_interval);
            continue;
        }

        if (std::holds_alternative<client_event::Connected>(event)) {
            LOG("Session", "Connected, waiting for game data");
            continue;
        }

        if (std::holds_alternative<client_event::Disconnected>(event)) {
            std::fprintf(stderr, "[Session] Disconnected before game data arrived\n");
            return nullptr;
        }

        auto& message = std::get<client_event::ServerMessage>(event).message;
        if (auto* data = std::get_if<GameDataMessage>(&message)) {
            if (!data->data) {
                std::fprintf(stderr, "[Session] Server sent empty game data\n");
                return nullptr;
            }
            LOG("Session", "Game data received: ", data->data->blocks.size(), " blocks, ",
                data->data->items.size(), " items");
            return data->data;
        }

        std::fprintf(stderr, "[Session] Chunk received before game data\n");
        return nullptr;
    }
}

// =============================================================================
// CONSTRUCTION
// =============================================================================

UpdateScheduler::UpdateScheduler(Client& client, GameDataPtr game_data, MeshSink& sink)
    : m_client(client)
    , m_game_data(std::move(game_data))
    , m_sink(sink)
{
    m_scratch.reserve(MeshGenerator::SIZE_SQ);
}

// =============================================================================
// TICK
// =============================================================================

TickResult UpdateScheduler::tick(Player& player, const Displacement& requested) {
    TickResult result;

    if (m_status != SessionStatus::RUNNING) {
        result.status = m_status;
        result.error = m_error;
        return result;
    }

    if (!drain_events(result)) {
        return result;
    }

    // Movement against the store as it is after this tick's updates
    result.applied = CollisionResolver::resolve(player.bounding_box(), requested,
                                                m_world, m_game_data->meshes);
    player.move(result.applied);
    m_client.send(SetPosMessage{player.x(), player.y(), player.z()});

    rebuild_dirty(result);
    return result;
}

// =============================================================================
// EVENT HANDLING
// =============================================================================

bool UpdateScheduler::drain_events(TickResult& result) {
    while (true) {
        ClientEvent event = m_client.receive_event();

        if (std::holds_alternative<client_event::NoEvent>(event)) {
            return true;
        }

        if (std::holds_alternative<client_event::Connected>(event)) {
            continue;
        }

        if (std::holds_alternative<client_event::Disconnected>(event)) {
            fail(SessionStatus::DISCONNECTED, "Disconnected from server", result);
            return false;
        }

        auto& message = std::get<client_event::ServerMessage>(event).message;
        if (auto* chunk_msg = std::get_if<ChunkMessage>(&message)) {
            if (!apply_chunk(std::move(chunk_msg->chunk), result)) {
                return false;
            }
            continue;
        }

        // GameData is fixed for the session
        LOG("Session", "Ignoring repeated game data");
    }
}

bool UpdateScheduler::apply_chunk(std::unique_ptr<Chunk> chunk, TickResult& result) {
    if (!chunk) {
        fail(SessionStatus::DESYNC, "Server sent an empty chunk message", result);
        return false;
    }

    const ChunkPosition pos = chunk->position();
    const BlockId max_id = chunk->max_block_id();
    if (!m_game_data->is_registered(max_id)) {
        fail(SessionStatus::DESYNC,
             "Chunk (" + std::to_string(pos.x) + ", " + std::to_string(pos.y) + ", " +
             std::to_string(pos.z) + ") contains unregistered block id " + std::to_string(max_id) +
             " (registry has " + std::to_string(m_game_data->meshes.size()) + " blocks)",
             result);
        return false;
    }

    m_world.set_chunk(std::move(chunk));
    mark_dirty_with_neighbours(pos);

    ++result.chunks_received;
    ++m_total_chunks;
    return true;
}

void UpdateScheduler::mark_dirty_with_neighbours(const ChunkPosition& pos) {
    for (ChunkCoord dx = -1; dx <= 1; ++dx) {
        for (ChunkCoord dy = -1; dy <= 1; ++dy) {
            for (ChunkCoord dz = -1; dz <= 1; ++dz) {
                m_dirty.insert(pos.offset(dx, dy, dz));
            }
        }
    }
}

void UpdateScheduler::fail(SessionStatus status, std::string message, TickResult& result) {
    m_status = status;
    m_error = std::move(message);
    result.status = m_status;
    result.error = m_error;

    LOG("Session", "Session ended: ", m_error);
    std::fprintf(stderr, "[Session] %s\n", m_error.c_str());
}

// =============================================================================
// MESHING
// =============================================================================

void UpdateScheduler::rebuild_dirty(TickResult& result) {
    for (const ChunkPosition& pos : m_dirty) {
        const Chunk* chunk = m_world.get_chunk(pos);
        if (!chunk) {
            continue;
        }

        m_occlusion.build(m_world, m_game_data->meshes, pos);
        m_mesh_gen.generate(*chunk, m_game_data->meshes, m_occlusion, m_scratch);
        m_sink.update_chunk_mesh(pos, m_scratch);

        ++result.meshes_built;
        ++m_total_meshes;
    }
    m_dirty.clear();
}

} // namespace voxstream::client
