#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <SFML/Network.hpp>

#include "broadcast_hub.h"
#include "command_router.h"
#include "conflict_engine.h"
#include "event_outbox.h"
#include "game_config.h"

// TCP endpoint for observers. One thread multiplexes the listener and every
// client through an sf::SocketSelector, reads hello/command packets and drains
// each connection's outbox with non-blocking sends.
//
// Handshake: the first packet must be "hello" carrying name (registers a new
// player) or, with server.trustPlayerIdHello, player_id. Anything else closes
// the connection.
//
// The server does not authenticate. A player_id hello is taken at its word,
// so it is only accepted when an external front-end has already
// authenticated the client.
class ObserverServer {
public:
    ObserverServer(ConflictEngine& engine, BroadcastHub& hub, const GameConfig& config);
    ~ObserverServer();

    ObserverServer(const ObserverServer&) = delete;
    ObserverServer& operator=(const ObserverServer&) = delete;

    // port 0 picks a free port; see port().
    bool start(unsigned short port, std::string* errorMessage = nullptr);
    void stop();
    bool isRunning() const { return m_running.load(); }
    unsigned short port() const { return m_port; }
    std::size_t clientCount() const { return m_clientCount.load(); }

private:
    struct Client {
        std::unique_ptr<sf::TcpSocket> socket;
        std::shared_ptr<EventOutbox> outbox;
        ConnectionId connection = 0;
        EntityId playerId = kNoEntity;
        std::deque<sf::Packet> unsent;   // handshake errors before the hub knows the client
        sf::Packet inFlight;             // partially sent packet, resent until Done
        bool hasInFlight = false;
        bool closing = false;
    };

    void run();
    void acceptClients();
    void receiveFrom(Client& client);
    void handlePacket(Client& client, const GameEvent& message);
    void handleHello(Client& client, const GameEvent& hello);
    // Returns false once the peer is gone.
    bool flush(Client& client);
    void dropClient(Client& client);

    ConflictEngine& m_engine;
    BroadcastHub& m_hub;
    const GameConfig& m_config;
    CommandRouter m_router;

    sf::TcpListener m_listener;
    sf::SocketSelector m_selector;
    std::vector<std::unique_ptr<Client>> m_clients;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<std::size_t> m_clientCount{0};
    unsigned short m_port = 0;
};
