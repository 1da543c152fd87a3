// =============================================================================
// VOXSTREAM - IN-PROCESS CHANNEL
// =============================================================================

#include "Shared/Channel.hpp"
#include "Shared/Logger.hpp"

#include <deque>
#include <mutex>

namespace voxstream {

namespace {

// The only player an in-process channel ever carries
constexpr PlayerId LOCAL_PLAYER = 0;

struct ChannelState {
    std::mutex mutex;
    std::deque<ClientEvent> to_client;
    std::deque<ServerEvent> to_server;
    bool client_alive = true;
    bool server_alive = true;
};

class InProcessClient final : public Client {
public:
    explicit InProcessClient(std::shared_ptr<ChannelState> state)
        : m_state(std::move(state)) {}

    ~InProcessClient() override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->client_alive = false;
        if (m_state->server_alive) {
            m_state->to_server.emplace_back(server_event::ClientDisconnected{LOCAL_PLAYER});
        }
    }

    InProcessClient(const InProcessClient&) = delete;
    InProcessClient& operator=(const InProcessClient&) = delete;

    ClientEvent receive_event() override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->to_client.empty()) {
            return client_event::NoEvent{};
        }
        ClientEvent event = std::move(m_state->to_client.front());
        m_state->to_client.pop_front();
        return event;
    }

    void send(ToServer message) override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (!m_state->server_alive) {
            return;
        }
        m_state->to_server.emplace_back(server_event::ClientMessage{LOCAL_PLAYER, std::move(message)});
    }

private:
    std::shared_ptr<ChannelState> m_state;
};

class InProcessServer final : public Server {
public:
    explicit InProcessServer(std::shared_ptr<ChannelState> state)
        : m_state(std::move(state)) {}

    ~InProcessServer() override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->server_alive = false;
        if (m_state->client_alive) {
            m_state->to_client.emplace_back(client_event::Disconnected{});
        }
    }

    InProcessServer(const InProcessServer&) = delete;
    InProcessServer& operator=(const InProcessServer&) = delete;

    ServerEvent receive_event() override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->to_server.empty()) {
            return server_event::NoEvent{};
        }
        ServerEvent event = std::move(m_state->to_server.front());
        m_state->to_server.pop_front();
        return event;
    }

    void send(PlayerId player, ToClient message) override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (player != LOCAL_PLAYER || !m_state->client_alive) {
            return;
        }
        m_state->to_client.emplace_back(client_event::ServerMessage{std::move(message)});
    }

private:
    std::shared_ptr<ChannelState> m_state;
};

} // namespace

ChannelPair create_in_process_channel() {
    auto state = std::make_shared<ChannelState>();
    state->to_client.emplace_back(client_event::Connected{});
    state->to_server.emplace_back(server_event::ClientConnected{LOCAL_PLAYER});

    LOG("Channel", "In-process channel created");

    return ChannelPair{
        std::make_unique<InProcessClient>(state),
        std::make_unique<InProcessServer>(state)
    };
}

} // namespace voxstream
