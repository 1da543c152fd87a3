// =============================================================================
// VOXSTREAM - SYNCHRONIZATION CHANNEL
// Duplex client/server event streams with FIFO delivery per direction
// =============================================================================
#pragma once

#include "Shared/Chunk.hpp"
#include "Shared/GameData.hpp"

#include <cstdint>
#include <memory>
#include <utility>
#include <variant>

namespace voxstream {

using PlayerId = std::uint32_t;

// =============================================================================
// SERVER -> CLIENT MESSAGES
// =============================================================================
struct GameDataMessage {
    GameDataPtr data;
};

struct ChunkMessage {
    std::unique_ptr<Chunk> chunk;
};

using ToClient = std::variant<GameDataMessage, ChunkMessage>;

// =============================================================================
// CLIENT -> SERVER MESSAGES
// =============================================================================
struct SetPosMessage {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

using ToServer = std::variant<SetPosMessage>;

// =============================================================================
// CLIENT-SIDE EVENTS
// =============================================================================
namespace client_event {
    struct NoEvent {};
    struct Connected {};
    struct Disconnected {};
    struct ServerMessage {
        ToClient message;
    };
}

using ClientEvent = std::variant<
    client_event::NoEvent,
    client_event::Connected,
    client_event::Disconnected,
    client_event::ServerMessage>;

// =============================================================================
// SERVER-SIDE EVENTS
// =============================================================================
namespace server_event {
    struct NoEvent {};
    struct ClientConnected {
        PlayerId id;
    };
    struct ClientDisconnected {
        PlayerId id;
    };
    struct ClientMessage {
        PlayerId id;
        ToServer message;
    };
}

using ServerEvent = std::variant<
    server_event::NoEvent,
    server_event::ClientConnected,
    server_event::ClientDisconnected,
    server_event::ClientMessage>;

// =============================================================================
// ENDPOINT INTERFACES
// receive_event() never blocks; NoEvent means the queue is currently empty
// =============================================================================
class Client {
public:
    virtual ~Client() = default;

    [[nodiscard]] virtual ClientEvent receive_event() = 0;
    virtual void send(ToServer message) = 0;
};

class Server {
public:
    virtual ~Server() = default;

    [[nodiscard]] virtual ServerEvent receive_event() = 0;
    virtual void send(PlayerId player, ToClient message) = 0;
};

// =============================================================================
// IN-PROCESS CHANNEL
// Connected endpoint pair sharing two mutex-guarded queues. Destroying either
// endpoint delivers a disconnect event to the other after its pending messages.
// =============================================================================
using ChannelPair = std::pair<std::unique_ptr<Client>, std::unique_ptr<Server>>;

[[nodiscard]] ChannelPair create_in_process_channel();

} // namespace voxstream
