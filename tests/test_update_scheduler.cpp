/**
 * @file test_update_scheduler.cpp
 * @brief Session bootstrap, chunk application, movement and remeshing per tick
 */

#include "test_utils.hpp"

#include "Client/UpdateScheduler.hpp"
#include "Shared/Channel.hpp"

#include <optional>
#include <variant>

using namespace voxstream;
using namespace voxstream::client;

namespace {

struct MeshUpdate {
    ChunkPosition pos;
    std::uint32_t quads = 0;
    TextureRect first_texture{};
};

class RecordingSink final : public MeshSink {
public:
    void update_chunk_mesh(const ChunkPosition& pos, const ChunkMesh& mesh) override {
        MeshUpdate update{pos, mesh.quad_count, {}};
        if (!mesh.vertices.empty()) {
            update.first_texture = mesh.vertices.front().texture;
        }
        updates.push_back(update);
    }

    [[nodiscard]] std::size_t count_for(const ChunkPosition& pos) const {
        std::size_t n = 0;
        for (const auto& u : updates) {
            if (u.pos == pos) ++n;
        }
        return n;
    }

    [[nodiscard]] const MeshUpdate* last_for(const ChunkPosition& pos) const {
        for (auto it = updates.rbegin(); it != updates.rend(); ++it) {
            if (it->pos == pos) return &*it;
        }
        return nullptr;
    }

    std::vector<MeshUpdate> updates;
};

// Scheduler wired to the client end of a fresh channel
struct Session {
    ChannelPair channel = create_in_process_channel();
    GameDataPtr data = fixtures::make_game_data(2);
    RecordingSink sink;
    std::unique_ptr<UpdateScheduler> scheduler =
        std::make_unique<UpdateScheduler>(*channel.first, data, sink);
    Player player;

    Server& server() { return *channel.second; }

    void send_chunk(std::unique_ptr<Chunk> chunk) {
        server().send(0, ChunkMessage{std::move(chunk)});
    }

    TickResult tick(const Displacement& requested = {}) {
        return scheduler->tick(player, requested);
    }

    // Last SetPos the server saw, skipping connection events
    std::optional<SetPosMessage> last_position() {
        std::optional<SetPosMessage> last;
        while (true) {
            ServerEvent event = server().receive_event();
            if (std::holds_alternative<server_event::NoEvent>(event)) break;
            if (auto* msg = std::get_if<server_event::ClientMessage>(&event)) {
                last = std::get<SetPosMessage>(msg->message);
            }
        }
        return last;
    }
};

} // namespace

// ============================================================
// Bootstrap
// ============================================================

TEST(bootstrap_returns_game_data) {
    auto [client, server] = create_in_process_channel();
    GameDataPtr data = fixtures::make_game_data(1);
    server->send(0, GameDataMessage{data});

    GameDataPtr received = wait_for_game_data(*client, std::chrono::milliseconds(100));
    ASSERT_TRUE(received == data);
}

TEST(bootstrap_times_out) {
    auto [client, server] = create_in_process_channel();
    const auto start = std::chrono::steady_clock::now();
    GameDataPtr received = wait_for_game_data(*client, std::chrono::milliseconds(20),
                                              std::chrono::milliseconds(1));
    ASSERT_NULL(received);
    ASSERT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

TEST(bootstrap_rejects_chunk_before_game_data) {
    auto [client, server] = create_in_process_channel();
    server->send(0, ChunkMessage{Chunk::filled({0, 0, 0}, AIR_BLOCK)});
    server->send(0, GameDataMessage{fixtures::make_game_data(1)});

    ASSERT_NULL(wait_for_game_data(*client, std::chrono::milliseconds(100)));
}

TEST(bootstrap_fails_on_disconnect) {
    auto [client, server] = create_in_process_channel();
    server.reset();
    ASSERT_NULL(wait_for_game_data(*client, std::chrono::milliseconds(100)));
}

// ============================================================
// Chunk application
// ============================================================

TEST(received_chunk_is_stored_and_meshed) {
    Session s;
    s.send_chunk(Chunk::filled({0, 0, 0}, 1));

    TickResult result = s.tick();
    ASSERT_TRUE(result.status == SessionStatus::RUNNING);
    ASSERT_EQ(result.chunks_received, 1u);
    ASSERT_EQ(result.meshes_built, 1u);
    ASSERT_TRUE(s.scheduler->world().has_chunk({0, 0, 0}));
    ASSERT_EQ(s.sink.count_for({0, 0, 0}), 1u);
    ASSERT_EQ(s.sink.last_for({0, 0, 0})->quads, 6u);

    // Nothing new: nothing remeshed
    TickResult idle = s.tick();
    ASSERT_EQ(idle.chunks_received, 0u);
    ASSERT_EQ(idle.meshes_built, 0u);
    ASSERT_EQ(s.scheduler->total_chunks_received(), 1u);
    ASSERT_EQ(s.scheduler->total_meshes_built(), 1u);
}

TEST(neighbour_arrival_remeshes_existing_chunk) {
    Session s;
    s.send_chunk(Chunk::filled({0, 0, 0}, 1));
    (void)s.tick();

    s.send_chunk(Chunk::filled({1, 0, 0}, 1));
    TickResult result = s.tick();
    ASSERT_EQ(result.meshes_built, 2u);
    ASSERT_EQ(s.sink.count_for({0, 0, 0}), 2u);
    ASSERT_EQ(s.sink.count_for({1, 0, 0}), 1u);

    // The shared face is now hidden on both sides
    ASSERT_EQ(s.sink.last_for({0, 0, 0})->quads, 5u);
    ASSERT_EQ(s.sink.last_for({1, 0, 0})->quads, 5u);
}

TEST(each_dirty_chunk_meshed_once_per_tick) {
    Session s;
    s.send_chunk(Chunk::filled({0, 0, 0}, 1));
    s.send_chunk(Chunk::filled({1, 0, 0}, 1));
    s.send_chunk(Chunk::filled({0, 1, 0}, 1));

    TickResult result = s.tick();
    ASSERT_EQ(result.chunks_received, 3u);
    ASSERT_EQ(result.meshes_built, 3u);
    ASSERT_EQ(s.sink.count_for({0, 0, 0}), 1u);
    ASSERT_EQ(s.sink.count_for({1, 0, 0}), 1u);
    ASSERT_EQ(s.sink.count_for({0, 1, 0}), 1u);
    ASSERT_EQ(s.sink.last_for({0, 0, 0})->quads, 4u);
}

TEST(later_chunk_at_same_position_wins) {
    Session s;
    s.send_chunk(Chunk::filled({0, 0, 0}, 1));
    s.send_chunk(Chunk::filled({0, 0, 0}, 2));

    TickResult result = s.tick();
    ASSERT_EQ(result.chunks_received, 2u);
    ASSERT_EQ(result.meshes_built, 1u);
    ASSERT_EQ(s.scheduler->world().chunk_count(), 1u);
    ASSERT_EQ(s.scheduler->world().get_block(3, 3, 3), BlockId{2});

    const MeshUpdate* update = s.sink.last_for({0, 0, 0});
    ASSERT_NOT_NULL(update);
    ASSERT_EQ(update->first_texture.y, fixtures::rect_for(2, 0).y);
}

TEST(solid_chunk_after_air_in_same_tick_meshes_once) {
    Session s;
    s.send_chunk(Chunk::filled({0, 0, 0}, AIR_BLOCK));
    s.send_chunk(Chunk::filled({0, 0, 0}, 1));

    TickResult result = s.tick();
    ASSERT_EQ(result.chunks_received, 2u);
    ASSERT_EQ(result.meshes_built, 1u);
    ASSERT_EQ(s.scheduler->world().get_block(0, 0, 0), BlockId{1});
    ASSERT_EQ(s.sink.count_for({0, 0, 0}), 1u);
    ASSERT_EQ(s.sink.last_for({0, 0, 0})->quads, 6u);
}

TEST(air_chunk_replaces_solid_chunk) {
    Session s;
    s.send_chunk(Chunk::filled({0, 0, 0}, 1));
    (void)s.tick();

    s.send_chunk(Chunk::filled({0, 0, 0}, AIR_BLOCK));
    (void)s.tick();
    ASSERT_EQ(s.scheduler->world().get_block(0, 0, 0), AIR_BLOCK);
    ASSERT_EQ(s.sink.last_for({0, 0, 0})->quads, 0u);
}

TEST(repeated_game_data_is_ignored) {
    Session s;
    s.server().send(0, GameDataMessage{fixtures::make_game_data(7)});
    s.send_chunk(Chunk::filled({0, 0, 0}, 1));

    TickResult result = s.tick();
    ASSERT_TRUE(result.status == SessionStatus::RUNNING);
    ASSERT_EQ(result.chunks_received, 1u);
    ASSERT_EQ(s.scheduler->game_data().meshes.size(), 3u);
}

// ============================================================
// Terminal states
// ============================================================

TEST(unregistered_block_id_is_a_desync) {
    Session s;
    s.send_chunk(fixtures::single_block_chunk({0, 0, 0}, 1, 1, 1, 3));
    s.send_chunk(Chunk::filled({1, 0, 0}, 1));

    TickResult result = s.tick({1.0, 0.0, 0.0});
    ASSERT_TRUE(result.status == SessionStatus::DESYNC);
    ASSERT_FALSE(result.error.empty());
    ASSERT_TRUE(result.error.find("3") != std::string::npos);
    ASSERT_FALSE(s.scheduler->world().has_chunk({0, 0, 0}));
    ASSERT_EQ(s.sink.updates.size(), 0u);

    // Terminal: later ticks neither apply chunks nor move the player
    const double x = s.player.x();
    TickResult later = s.tick({1.0, 0.0, 0.0});
    ASSERT_TRUE(later.status == SessionStatus::DESYNC);
    ASSERT_EQ(later.error, result.error);
    ASSERT_EQ(later.chunks_received, 0u);
    ASSERT_FALSE(s.scheduler->world().has_chunk({1, 0, 0}));
    ASSERT_EQ(s.player.x(), x);
    ASSERT_TRUE(s.scheduler->status() == SessionStatus::DESYNC);
}

TEST(server_drop_is_a_disconnect) {
    Session s;
    s.send_chunk(Chunk::filled({0, 0, 0}, 1));
    s.channel.second.reset();

    TickResult result = s.tick();
    ASSERT_TRUE(result.status == SessionStatus::DISCONNECTED);
    // Chunks sent before the drop are still applied
    ASSERT_TRUE(s.scheduler->world().has_chunk({0, 0, 0}));

    ASSERT_TRUE(s.tick().status == SessionStatus::DISCONNECTED);
    ASSERT_FALSE(s.scheduler->error().empty());
}

// ============================================================
// Movement
// ============================================================

TEST(movement_reports_position_to_server) {
    Session s;
    TickResult result = s.tick({0.5, 0.0, -0.25});
    ASSERT_NEAR(result.applied.x, 0.5, 1e-9);
    ASSERT_NEAR(result.applied.z, -0.25, 1e-9);

    auto pos = s.last_position();
    ASSERT_TRUE(pos.has_value());
    ASSERT_NEAR(pos->x, Player::SPAWN_X + 0.5, 1e-9);
    ASSERT_NEAR(pos->y, Player::SPAWN_Y, 1e-9);
    ASSERT_NEAR(pos->z, Player::SPAWN_Z - 0.25, 1e-9);
}

TEST(movement_collides_with_chunks_from_same_tick) {
    Session s;
    // Ground directly below the spawn point
    s.send_chunk(Chunk::filled({0, -1, 0}, 1));

    TickResult result = s.tick({0.0, -2.0, 0.0});
    ASSERT_NEAR(result.applied.y, 0.0, 1e-9);
    ASSERT_NEAR(s.player.y(), Player::SPAWN_Y, 1e-9);
}

int main() {
    return run_all_tests();
}
