// =============================================================================
// VOXSTREAM - INTEGRATED SERVER IMPLEMENTATION
// =============================================================================

#include "Server/IntegratedServer.hpp"
#include "Shared/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <thread>
#include <variant>

namespace voxstream::server {

IntegratedServer::IntegratedServer(Server& channel, GameDataPtr game_data,
                                   std::unique_ptr<WorldGenerator> generator, ServerConfig config)
    : m_channel(channel)
    , m_game_data(std::move(game_data))
    , m_generator(std::move(generator))
    , m_config(config)
{}

// =============================================================================
// TICK
// =============================================================================

void IntegratedServer::tick() {
    handle_events();
    stream_chunks();
    ++m_stats.ticks;
}

void IntegratedServer::run(const std::atomic<bool>& stop) {
    TickManager ticks(TickConfig{m_config.target_tps, 10});
    ticks.start();

    std::printf("[Server] Running at %u TPS, generator: %.*s\n", m_config.target_tps,
                static_cast<int>(m_generator->type_name().size()), m_generator->type_name().data());

    while (!stop.load(std::memory_order_acquire) && !all_players_left()) {
        ticks.update([this](double, std::uint64_t) { tick(); });
        std::this_thread::sleep_for(ticks.time_until_next_tick());
    }

    ticks.stop();
    std::printf("[Server] Stopped after %llu ticks, %llu chunks sent\n",
                static_cast<unsigned long long>(m_stats.ticks),
                static_cast<unsigned long long>(m_stats.chunks_sent));
}

// =============================================================================
// EVENTS
// =============================================================================

void IntegratedServer::handle_events() {
    while (true) {
        ServerEvent event = m_channel.receive_event();

        if (std::holds_alternative<server_event::NoEvent>(event)) {
            return;
        }

        if (auto* connected = std::get_if<server_event::ClientConnected>(&event)) {
            m_players[connected->id] = PlayerState{};
            m_had_players = true;
            m_channel.send(connected->id, GameDataMessage{m_game_data});
            LOG("Server", "Player ", connected->id, " connected, game data sent");
            continue;
        }

        if (auto* disconnected = std::get_if<server_event::ClientDisconnected>(&event)) {
            m_players.erase(disconnected->id);
            LOG("Server", "Player ", disconnected->id, " disconnected");
            continue;
        }

        auto& client_message = std::get<server_event::ClientMessage>(event);
        auto it = m_players.find(client_message.id);
        if (it == m_players.end()) {
            LOG("Server", "Message from unknown player ", client_message.id);
            continue;
        }

        if (auto* pos = std::get_if<SetPosMessage>(&client_message.message)) {
            it->second.x = pos->x;
            it->second.y = pos->y;
            it->second.z = pos->z;
            ++m_stats.positions_received;
        }
    }
}

// =============================================================================
// CHUNK STREAMING
// =============================================================================

ChunkPosition IntegratedServer::chunk_of(const PlayerState& player) noexcept {
    return BlockPosition{
        static_cast<BlockCoord>(std::floor(player.x)),
        static_cast<BlockCoord>(std::floor(player.y)),
        static_cast<BlockCoord>(std::floor(player.z))
    }.chunk();
}

std::vector<ChunkPosition> IntegratedServer::chunks_in_range(const ChunkPosition& center) const {
    const auto& rd = m_config.render_distance;
    std::vector<ChunkPosition> positions;

    for (ChunkCoord x = center.x - rd[0]; x <= center.x + static_cast<ChunkCoord>(rd[1]); ++x) {
        for (ChunkCoord y = center.y - rd[2]; y <= center.y + static_cast<ChunkCoord>(rd[3]); ++y) {
            for (ChunkCoord z = center.z - rd[4]; z <= center.z + static_cast<ChunkCoord>(rd[5]); ++z) {
                positions.emplace_back(x, y, z);
            }
        }
    }

    // Nearest first, ties broken by coordinates so the order is stable
    std::sort(positions.begin(), positions.end(), [&](const ChunkPosition& a, const ChunkPosition& b) {
        const auto da = a.distance_sq(center);
        const auto db = b.distance_sq(center);
        if (da != db) return da < db;
        if (a.x != b.x) return a.x < b.x;
        if (a.y != b.y) return a.y < b.y;
        return a.z < b.z;
    });
    return positions;
}

void IntegratedServer::stream_chunks() {
    std::uint32_t budget = m_config.max_chunks_per_tick;

    for (auto& [id, player] : m_players) {
        if (budget == 0) {
            return;
        }

        for (const ChunkPosition& pos : chunks_in_range(chunk_of(player))) {
            if (budget == 0) {
                break;
            }
            if (!player.sent.insert(pos).second) {
                continue;
            }

            if (!m_generator->should_generate(pos)) {
                ++m_stats.chunks_skipped;
                continue;
            }

            m_channel.send(id, ChunkMessage{m_generator->generate(pos)});
            ++m_stats.chunks_sent;
            --budget;
        }
    }
}

} // namespace voxstream::server
