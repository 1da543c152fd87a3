/**
 * @file test_integrated_server.cpp
 * @brief Chunk streaming, superflat terrain and the fixed-rate tick loop
 */

#include "test_utils.hpp"

#include "Server/IntegratedServer.hpp"
#include "Server/TickManager.hpp"
#include "Server/WorldGenerator.hpp"
#include "Shared/Channel.hpp"

#include <atomic>
#include <unordered_set>
#include <variant>

using namespace voxstream;
using namespace voxstream::server;

namespace {

// Every position holds a solid chunk
class SolidGenerator final : public WorldGenerator {
public:
    std::unique_ptr<Chunk> generate(ChunkPosition pos) const override {
        return Chunk::filled(pos, 1);
    }
    std::string_view type_name() const noexcept override { return "solid"; }
};

ServerConfig small_config(std::uint32_t budget) {
    ServerConfig config;
    config.render_distance = {1, 1, 1, 1, 1, 1};
    config.max_chunks_per_tick = budget;
    return config;
}

SuperflatConfig test_layers() {
    SuperflatConfig config;
    config.layers = {{1, 4}, {2, 3}, {3, 1}};
    return config;
}

// What the client end has received so far
struct Received {
    std::size_t game_data = 0;
    GameDataPtr data;
    std::vector<ChunkPosition> chunks;
    bool disconnected = false;
};

Received drain(Client& client) {
    Received out;
    while (true) {
        ClientEvent event = client.receive_event();
        if (std::holds_alternative<client_event::NoEvent>(event)) break;
        if (std::holds_alternative<client_event::Disconnected>(event)) {
            out.disconnected = true;
            continue;
        }
        auto* msg = std::get_if<client_event::ServerMessage>(&event);
        if (!msg) continue;

        if (auto* data = std::get_if<GameDataMessage>(&msg->message)) {
            // Game data must precede every chunk
            if (out.chunks.empty()) {
                ++out.game_data;
                out.data = data->data;
            }
        } else if (auto* chunk = std::get_if<ChunkMessage>(&msg->message)) {
            out.chunks.push_back(chunk->chunk->position());
        }
    }
    return out;
}

} // namespace

// ============================================================
// Streaming
// ============================================================

TEST(connect_sends_game_data_before_chunks) {
    auto [client, channel] = create_in_process_channel();
    GameDataPtr data = fixtures::make_game_data(3);
    IntegratedServer integrated(*channel, data, std::make_unique<SolidGenerator>(), small_config(100));

    integrated.tick();
    ASSERT_EQ(integrated.player_count(), 1u);

    Received got = drain(*client);
    ASSERT_EQ(got.game_data, 1u);
    ASSERT_TRUE(got.data == data);
    ASSERT_EQ(got.chunks.size(), 27u);
}

TEST(chunks_stream_nearest_first) {
    auto [client, channel] = create_in_process_channel();
    IntegratedServer integrated(*channel, fixtures::make_game_data(1), std::make_unique<SolidGenerator>(),
                            small_config(100));
    integrated.tick();

    Received got = drain(*client);
    ASSERT_EQ(got.chunks.size(), 27u);
    ASSERT_EQ(got.chunks.front(), ChunkPosition(0, 0, 0));

    const ChunkPosition center(0, 0, 0);
    for (std::size_t i = 1; i < got.chunks.size(); ++i) {
        ASSERT_LE(got.chunks[i - 1].distance_sq(center), got.chunks[i].distance_sq(center));
    }

    // Ties broken by x, then y, then z
    ASSERT_EQ(got.chunks[1], ChunkPosition(-1, 0, 0));
    ASSERT_EQ(got.chunks[2], ChunkPosition(0, -1, 0));
    ASSERT_EQ(got.chunks[3], ChunkPosition(0, 0, -1));
    ASSERT_EQ(got.chunks.back(), ChunkPosition(1, 1, 1));
}

TEST(budget_limits_chunks_per_tick_without_duplicates) {
    auto [client, channel] = create_in_process_channel();
    IntegratedServer integrated(*channel, fixtures::make_game_data(1), std::make_unique<SolidGenerator>(),
                            small_config(5));

    std::unordered_set<ChunkPosition> seen;
    for (int t = 0; t < 5; ++t) {
        integrated.tick();
        Received got = drain(*client);
        ASSERT_EQ(got.chunks.size(), 5u);
        for (const auto& pos : got.chunks) {
            ASSERT_TRUE(seen.insert(pos).second);
        }
    }

    integrated.tick();
    ASSERT_EQ(drain(*client).chunks.size(), 2u);

    // Everything in range has been sent once
    integrated.tick();
    ASSERT_EQ(drain(*client).chunks.size(), 0u);
    ASSERT_EQ(integrated.stats().chunks_sent, 27u);
    ASSERT_EQ(integrated.stats().ticks, 7u);
}

TEST(position_updates_move_the_streaming_center) {
    auto [client, channel] = create_in_process_channel();
    IntegratedServer integrated(*channel, fixtures::make_game_data(1), std::make_unique<SolidGenerator>(),
                            small_config(100));
    integrated.tick();
    (void)drain(*client);

    client->send(SetPosMessage{100.5, 10.0, -0.5});
    integrated.tick();
    ASSERT_EQ(integrated.stats().positions_received, 1u);

    Received got = drain(*client);
    ASSERT_EQ(got.chunks.size(), 27u);
    ASSERT_EQ(got.chunks.front(), ChunkPosition(3, 0, -1));

    // Returning to the origin sends nothing new
    client->send(SetPosMessage{0.4, 1.6, 0.4});
    integrated.tick();
    ASSERT_EQ(drain(*client).chunks.size(), 0u);
}

TEST(superflat_skips_all_air_positions) {
    auto [client, channel] = create_in_process_channel();
    IntegratedServer integrated(*channel, fixtures::make_game_data(3),
                            std::make_unique<SuperflatGenerator>(test_layers()), small_config(100));
    integrated.tick();

    Received got = drain(*client);
    ASSERT_EQ(got.chunks.size(), 9u);
    for (const auto& pos : got.chunks) {
        ASSERT_EQ(pos.y, -1);
    }
    ASSERT_EQ(integrated.stats().chunks_skipped, 18u);

    // Skipped positions are not revisited
    integrated.tick();
    ASSERT_EQ(drain(*client).chunks.size(), 0u);
    ASSERT_EQ(integrated.stats().chunks_skipped, 18u);
}

TEST(range_respects_asymmetric_render_distance) {
    auto [client, channel] = create_in_process_channel();
    ServerConfig config;
    config.render_distance = {0, 2, 1, 0, 0, 0};
    IntegratedServer integrated(*channel, fixtures::make_game_data(1), std::make_unique<SolidGenerator>(), config);

    auto positions = integrated.chunks_in_range({5, 5, 5});
    ASSERT_EQ(positions.size(), 6u);
    for (const auto& pos : positions) {
        ASSERT_GE(pos.x, 5);
        ASSERT_LE(pos.x, 7);
        ASSERT_GE(pos.y, 4);
        ASSERT_LE(pos.y, 5);
        ASSERT_EQ(pos.z, 5);
    }
}

TEST(disconnect_removes_player_and_ends_run) {
    auto [client, channel] = create_in_process_channel();
    IntegratedServer integrated(*channel, fixtures::make_game_data(1), std::make_unique<SolidGenerator>(),
                            small_config(1));
    client.reset();

    std::atomic<bool> stop{false};
    integrated.run(stop);

    ASSERT_EQ(integrated.player_count(), 0u);
    ASSERT_TRUE(integrated.all_players_left());
}

TEST(run_returns_when_stopped) {
    auto [client, channel] = create_in_process_channel();
    IntegratedServer integrated(*channel, fixtures::make_game_data(1), std::make_unique<SolidGenerator>(),
                            small_config(1));

    std::atomic<bool> stop{true};
    integrated.run(stop);
    ASSERT_EQ(integrated.stats().ticks, 0u);
    ASSERT_FALSE(integrated.all_players_left());
}

// ============================================================
// Superflat terrain
// ============================================================

TEST(superflat_layers_stack_below_surface) {
    SuperflatGenerator gen(test_layers());
    ASSERT_EQ(gen.config().total_height(), 8u);
    ASSERT_EQ(gen.config().bottom_y(), -8);

    ASSERT_EQ(gen.block_at(-9), AIR_BLOCK);
    ASSERT_EQ(gen.block_at(-8), BlockId{1});
    ASSERT_EQ(gen.block_at(-5), BlockId{1});
    ASSERT_EQ(gen.block_at(-4), BlockId{2});
    ASSERT_EQ(gen.block_at(-2), BlockId{2});
    ASSERT_EQ(gen.block_at(-1), BlockId{3});
    ASSERT_EQ(gen.block_at(0), AIR_BLOCK);

    ASSERT_TRUE(gen.should_generate({0, -1, 0}));
    ASSERT_TRUE(gen.should_generate({-7, -1, 12}));
    ASSERT_FALSE(gen.should_generate({0, 0, 0}));
    ASSERT_FALSE(gen.should_generate({0, -2, 0}));
}

TEST(superflat_chunk_columns_match_layers) {
    SuperflatGenerator gen(test_layers());
    auto chunk = gen.generate({4, -1, -3});
    ASSERT_EQ(chunk->position(), ChunkPosition(4, -1, -3));

    for (LocalCoord x : {0, 17, 31}) {
        for (LocalCoord z : {0, 9, 31}) {
            ASSERT_EQ(chunk->get(x, 31, z), BlockId{3});
            ASSERT_EQ(chunk->get(x, 28, z), BlockId{2});
            ASSERT_EQ(chunk->get(x, 24, z), BlockId{1});
            ASSERT_EQ(chunk->get(x, 23, z), AIR_BLOCK);
        }
    }
    ASSERT_EQ(chunk->count_solid(), 8u * 32u * 32u);
}

TEST(superflat_config_resolves_block_names) {
    auto data = fixtures::make_game_data(3);
    std::string error;

    auto config = SuperflatConfig::from_names(data->blocks, {{"block3", 2}, {"block1", 1}}, error);
    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->layers.size(), 2u);
    ASSERT_EQ(config->layers[0].block, BlockId{3});
    ASSERT_EQ(config->layers[0].thickness, 2u);

    ASSERT_FALSE(SuperflatConfig::from_names(data->blocks, {{"bedrock", 1}}, error).has_value());
    ASSERT_TRUE(error.find("bedrock") != std::string::npos);
}

// ============================================================
// Tick manager
// ============================================================

TEST(tick_manager_runs_fixed_steps) {
    TickManager ticks(TickConfig{20, 10});
    std::uint32_t calls = 0;
    double last_dt = 0.0;
    auto on_tick = [&](double dt, std::uint64_t) { ++calls; last_dt = dt; };

    ASSERT_EQ(ticks.advance(Clock::now(), on_tick), 0u);

    ticks.start();
    const TimePoint t0 = Clock::now() + std::chrono::milliseconds(160);
    ASSERT_EQ(ticks.advance(t0, on_tick), 3u);
    ASSERT_EQ(calls, 3u);
    ASSERT_NEAR(last_dt, 0.05, 1e-12);
    ASSERT_EQ(ticks.stats().total_ticks, 3u);
    ASSERT_FALSE(ticks.stats().is_lagging);
    ASSERT_LE(ticks.time_until_next_tick(), std::chrono::milliseconds(40));

    // A long stall is clamped to max_ticks_per_update
    ASSERT_EQ(ticks.advance(t0 + std::chrono::seconds(10), on_tick), 10u);
    ASSERT_TRUE(ticks.stats().is_lagging);

    ticks.stop();
    ASSERT_FALSE(ticks.is_running());
    ASSERT_EQ(ticks.advance(t0 + std::chrono::seconds(20), on_tick), 0u);
}

int main() {
    return run_all_tests();
}
