#include "observer_server.h"

#include <algorithm>

#include "log.h"
#include "packet_codec.h"

namespace {

constexpr int kSelectorWaitMs = 20;
constexpr int kMaxSendsPerPass = 64;

} // namespace

ObserverServer::ObserverServer(ConflictEngine& engine, BroadcastHub& hub, const GameConfig& config)
    : m_engine(engine), m_hub(hub), m_config(config), m_router(engine) {}

ObserverServer::~ObserverServer() {
    stop();
}

bool ObserverServer::start(unsigned short port, std::string* errorMessage) {
    if (m_running.load()) return true;

    if (m_listener.listen(port) != sf::Socket::Done) {
        if (errorMessage) *errorMessage = "Cannot listen on port " + std::to_string(port);
        return false;
    }
    m_listener.setBlocking(false);
    m_selector.add(m_listener);
    m_port = m_listener.getLocalPort();

    m_running.store(true);
    m_thread = std::thread([this]() { run(); });
    logging::info("Server", "Observer endpoint listening on port " + std::to_string(m_port) + ".");
    return true;
}

void ObserverServer::stop() {
    if (!m_running.exchange(false)) return;
    if (m_thread.joinable()) m_thread.join();

    for (auto& client : m_clients) {
        dropClient(*client);
    }
    m_clients.clear();
    m_clientCount.store(0);
    m_selector.clear();
    m_listener.close();
    logging::info("Server", "Observer endpoint stopped.");
}

void ObserverServer::run() {
    while (m_running.load()) {
        if (m_selector.wait(sf::milliseconds(kSelectorWaitMs))) {
            if (m_selector.isReady(m_listener)) {
                acceptClients();
            }
            for (auto& client : m_clients) {
                if (!client->closing && m_selector.isReady(*client->socket)) {
                    receiveFrom(*client);
                }
            }
        }

        for (auto& client : m_clients) {
            const bool alive = flush(*client);
            if (!alive) {
                client->closing = true;
                client->hasInFlight = false;
                client->unsent.clear();
            }
        }

        auto finished = std::stable_partition(m_clients.begin(), m_clients.end(), [](const std::unique_ptr<Client>& c) {
            return !(c->closing && !c->hasInFlight && c->unsent.empty());
        });
        for (auto it = finished; it != m_clients.end(); ++it) {
            dropClient(**it);
        }
        m_clients.erase(finished, m_clients.end());
        m_clientCount.store(m_clients.size());
    }
}

void ObserverServer::acceptClients() {
    auto socket = std::make_unique<sf::TcpSocket>();
    if (m_listener.accept(*socket) != sf::Socket::Done) {
        return;
    }
    socket->setBlocking(false);
    m_selector.add(*socket);

    auto client = std::make_unique<Client>();
    client->socket = std::move(socket);
    logging::debug("Server", "Accepted " + client->socket->getRemoteAddress().toString() + ".");
    m_clients.push_back(std::move(client));
}

void ObserverServer::receiveFrom(Client& client) {
    sf::Packet packet;
    const sf::Socket::Status status = client.socket->receive(packet);
    if (status == sf::Socket::Done) {
        GameEvent message;
        if (!decodeEvent(packet, message)) {
            logging::warn("Server", "Malformed packet from player " + std::to_string(client.playerId) +
                                    "; closing connection.");
            client.closing = true;
            return;
        }
        handlePacket(client, message);
    } else if (status == sf::Socket::Disconnected || status == sf::Socket::Error) {
        client.closing = true;
    }
}

void ObserverServer::handlePacket(Client& client, const GameEvent& message) {
    const TimestampMs now = m_engine.clock().nowMs();
    if (client.connection == 0) {
        handleHello(client, message);
        return;
    }
    if (message.type == "hello") {
        OpError error;
        fail(&error, ErrorKind::Conflict, "Connection is already established");
        m_hub.sendTo(client.connection, CommandRouter::makeError("hello", error, now));
        return;
    }
    m_hub.sendTo(client.connection, m_router.handle(client.playerId, message));
}

void ObserverServer::handleHello(Client& client, const GameEvent& hello) {
    const TimestampMs now = m_engine.clock().nowMs();
    OpError error;
    auto reject = [&](const OpError& e) {
        sf::Packet packet;
        encodeEvent(CommandRouter::makeError("hello", e, now), packet);
        client.unsent.push_back(packet);
        client.closing = true;
    };

    if (hello.type != "hello") {
        fail(&error, ErrorKind::InvalidState, "Expected hello as the first packet");
        reject(error);
        return;
    }

    EntityId playerId = hello.getInt("player_id", kNoEntity);
    if (playerId != kNoEntity && !m_config.server.trustPlayerIdHello) {
        fail(&error, ErrorKind::Forbidden, "Hello by player_id needs an authenticating front-end");
        reject(error);
        return;
    }
    if (playerId == kNoEntity && hello.has("name")) {
        playerId = m_engine.registerPlayer(hello.getString("name"), &error);
        if (playerId == kNoEntity) {
            reject(error);
            return;
        }
    }
    Player player;
    if (!m_engine.world().getPlayer(playerId, player)) {
        fail(&error, ErrorKind::NotFound, "Player not found");
        reject(error);
        return;
    }

    client.outbox = std::make_shared<EventOutbox>(static_cast<std::size_t>(m_config.server.maxOutboxEvents));
    client.connection = m_hub.connect(playerId, client.outbox);
    if (client.connection == 0) {
        fail(&error, ErrorKind::InvalidState, "Server is shutting down");
        reject(error);
        return;
    }
    client.playerId = playerId;
    if (player.hasCountry()) {
        m_hub.joinRoom(client.connection, player.getCountryId());
    }

    long long resources = 0;
    m_engine.ledger().balance(AccountKey::player(playerId), resources);

    GameEvent established(events::kConnectionEstablished, now);
    established.setInt("connection_id", static_cast<long long>(client.connection))
               .setInt("player_id", playerId)
               .setString("player_name", player.getName())
               .setInt("country_id", player.getCountryId())
               .setInt("resources", resources)
               .setInt("server_time", now);
    m_hub.sendTo(client.connection, established);
    logging::info("Server", player.getName() + " connected (connection " + std::to_string(client.connection) + ").");
}

bool ObserverServer::flush(Client& client) {
    for (int sent = 0; sent < kMaxSendsPerPass; ++sent) {
        if (!client.hasInFlight) {
            client.inFlight.clear();
            if (!client.unsent.empty()) {
                client.inFlight = client.unsent.front();
                client.unsent.pop_front();
            } else if (client.outbox) {
                std::vector<GameEvent> next = client.outbox->take(1);
                if (next.empty()) return true;
                encodeEvent(next.front(), client.inFlight);
            } else {
                return true;
            }
            client.hasInFlight = true;
        }

        switch (client.socket->send(client.inFlight)) {
            case sf::Socket::Done:
                client.hasInFlight = false;
                break;
            case sf::Socket::Partial:
            case sf::Socket::NotReady:
                return true;
            default:
                return false;
        }
    }
    return true;
}

void ObserverServer::dropClient(Client& client) {
    if (client.connection != 0) {
        m_hub.disconnect(client.connection, m_engine.clock().nowMs());
        logging::info("Server", "Player " + std::to_string(client.playerId) + " disconnected.");
        client.connection = 0;
    }
    if (client.socket) {
        m_selector.remove(*client.socket);
        client.socket->disconnect();
    }
}
