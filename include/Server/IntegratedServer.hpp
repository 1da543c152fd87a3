// =============================================================================
// VOXSTREAM - INTEGRATED SERVER
// Single-player server: sends game data, tracks positions, streams chunks
// =============================================================================
#pragma once

#include "Shared/Channel.hpp"
#include "Shared/GameData.hpp"
#include "Server/TickManager.hpp"
#include "Server/WorldGenerator.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace voxstream::server {

struct ServerConfig {
    // Chunks around the player: x-, x+, y-, y+, z-, z+
    std::array<std::uint32_t, 6> render_distance{4, 4, 2, 2, 4, 4};

    // Chunks sent per server tick, across all players
    std::uint32_t max_chunks_per_tick = 16;

    std::uint32_t target_tps = 20;
};

struct ServerStats {
    std::uint64_t ticks = 0;
    std::uint64_t chunks_sent = 0;
    std::uint64_t chunks_skipped = 0;   // all-air positions never sent
    std::uint64_t positions_received = 0;
};

class IntegratedServer {
public:
    // Eye position assumed until the first SetPos
    static constexpr double SPAWN_X = 0.4;
    static constexpr double SPAWN_Y = 1.6;
    static constexpr double SPAWN_Z = 0.4;

    IntegratedServer(Server& channel, GameDataPtr game_data,
                     std::unique_ptr<WorldGenerator> generator, ServerConfig config = {});

    IntegratedServer(const IntegratedServer&) = delete;
    IntegratedServer& operator=(const IntegratedServer&) = delete;

    // One server step: drain events, then stream chunks within the tick budget
    void tick();

    // Fixed-timestep loop until `stop` is set or the last player disconnects
    void run(const std::atomic<bool>& stop);

    [[nodiscard]] std::size_t player_count() const noexcept { return m_players.size(); }
    [[nodiscard]] bool all_players_left() const noexcept { return m_had_players && m_players.empty(); }
    [[nodiscard]] const ServerStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] const ServerConfig& config() const noexcept { return m_config; }

    // Chunk positions a player at `center` should have, nearest first
    [[nodiscard]] std::vector<ChunkPosition> chunks_in_range(const ChunkPosition& center) const;

private:
    struct PlayerState {
        double x = SPAWN_X;
        double y = SPAWN_Y;
        double z = SPAWN_Z;
        std::unordered_set<ChunkPosition> sent;
    };

    void handle_events();
    void stream_chunks();
    [[nodiscard]] static ChunkPosition chunk_of(const PlayerState& player) noexcept;

private:
    Server& m_channel;
    GameDataPtr m_game_data;
    std::unique_ptr<WorldGenerator> m_generator;
    ServerConfig m_config;

    std::unordered_map<PlayerId, PlayerState> m_players;
    bool m_had_players = false;

    ServerStats m_stats;
};

} // namespace voxstream::server
