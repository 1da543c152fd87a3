/**
 * @file test_channel.cpp
 * @brief In-process channel delivery order and disconnect semantics
 */

#include "test_utils.hpp"

#include "Shared/Channel.hpp"

#include <thread>

using namespace voxstream;

namespace {

ToClient chunk_message(ChunkPosition pos) {
    return ChunkMessage{Chunk::filled(pos, AIR_BLOCK)};
}

template<typename T, typename Event>
bool holds(const Event& event) {
    return std::holds_alternative<T>(event);
}

} // namespace

TEST(creation_queues_connect_events) {
    auto [client, server] = create_in_process_channel();

    ClientEvent ce = client->receive_event();
    ASSERT_TRUE(holds<client_event::Connected>(ce));
    ASSERT_TRUE(holds<client_event::NoEvent>(client->receive_event()));

    ServerEvent se = server->receive_event();
    ASSERT_TRUE(holds<server_event::ClientConnected>(se));
    ASSERT_EQ(std::get<server_event::ClientConnected>(se).id, 0u);
    ASSERT_TRUE(holds<server_event::NoEvent>(server->receive_event()));
}

TEST(server_messages_arrive_in_send_order) {
    auto [client, server] = create_in_process_channel();
    (void)client->receive_event();

    for (ChunkCoord i = 0; i < 10; ++i) {
        server->send(0, chunk_message({i, 0, 0}));
    }

    for (ChunkCoord i = 0; i < 10; ++i) {
        ClientEvent event = client->receive_event();
        ASSERT_TRUE(holds<client_event::ServerMessage>(event));
        auto& message = std::get<client_event::ServerMessage>(event).message;
        ASSERT_TRUE(holds<ChunkMessage>(message));
        ASSERT_EQ(std::get<ChunkMessage>(message).chunk->position(), ChunkPosition(i, 0, 0));
    }
    ASSERT_TRUE(holds<client_event::NoEvent>(client->receive_event()));
}

TEST(client_messages_carry_player_id) {
    auto [client, server] = create_in_process_channel();
    (void)server->receive_event();

    client->send(SetPosMessage{1.0, 2.0, 3.0});
    client->send(SetPosMessage{4.0, 5.0, 6.0});

    ServerEvent first = server->receive_event();
    ASSERT_TRUE(holds<server_event::ClientMessage>(first));
    const auto& msg = std::get<server_event::ClientMessage>(first);
    ASSERT_EQ(msg.id, 0u);
    ASSERT_NEAR(std::get<SetPosMessage>(msg.message).x, 1.0, 1e-12);

    ServerEvent second = server->receive_event();
    ASSERT_NEAR(std::get<SetPosMessage>(std::get<server_event::ClientMessage>(second).message).z, 6.0, 1e-12);
}

TEST(server_drop_disconnects_after_pending_messages) {
    auto [client, server] = create_in_process_channel();
    (void)client->receive_event();

    server->send(0, chunk_message({1, 2, 3}));
    server.reset();

    ASSERT_TRUE(holds<client_event::ServerMessage>(client->receive_event()));
    ASSERT_TRUE(holds<client_event::Disconnected>(client->receive_event()));
    ASSERT_TRUE(holds<client_event::NoEvent>(client->receive_event()));

    // Sending to a gone server is silently dropped
    client->send(SetPosMessage{});
}

TEST(client_drop_disconnects_server_side) {
    auto [client, server] = create_in_process_channel();
    (void)server->receive_event();

    client->send(SetPosMessage{7.0, 0.0, 0.0});
    client.reset();

    ASSERT_TRUE(holds<server_event::ClientMessage>(server->receive_event()));
    ServerEvent event = server->receive_event();
    ASSERT_TRUE(holds<server_event::ClientDisconnected>(event));
    ASSERT_EQ(std::get<server_event::ClientDisconnected>(event).id, 0u);

    server->send(0, chunk_message({0, 0, 0}));
    ASSERT_TRUE(holds<server_event::NoEvent>(server->receive_event()));
}

TEST(unknown_player_is_ignored) {
    auto [client, server] = create_in_process_channel();
    (void)client->receive_event();

    server->send(42, chunk_message({0, 0, 0}));
    ASSERT_TRUE(holds<client_event::NoEvent>(client->receive_event()));
}

TEST(order_preserved_across_threads) {
    auto [client, server] = create_in_process_channel();
    (void)client->receive_event();

    constexpr ChunkCoord COUNT = 200;
    std::thread producer([&server = server]() {
        for (ChunkCoord i = 0; i < COUNT; ++i) {
            server->send(0, chunk_message({i, 0, 0}));
        }
    });

    std::vector<ChunkCoord> received;
    while (received.size() < static_cast<std::size_t>(COUNT)) {
        ClientEvent event = client->receive_event();
        if (holds<client_event::NoEvent>(event)) {
            std::this_thread::yield();
            continue;
        }
        auto* message = std::get_if<client_event::ServerMessage>(&event);
        auto* chunk = message ? std::get_if<ChunkMessage>(&message->message) : nullptr;
        received.push_back(chunk ? chunk->chunk->position().x : -1);
    }
    producer.join();

    for (ChunkCoord i = 0; i < COUNT; ++i) {
        ASSERT_EQ(received[static_cast<std::size_t>(i)], i);
    }
}

int main() {
    return run_all_tests();
}
