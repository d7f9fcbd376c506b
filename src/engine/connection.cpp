#include "connection.hpp"

namespace nd::engine {

Connection make_connection(const ConnectionConfig &config) {
    switch (config.role) {
    case Role::Client:
        return std::make_unique<ClientConnection>(config.host, config.port);
    case Role::Server:
        return std::make_unique<ServerConnection>(config.port);
    case Role::Proxy:
        return std::make_unique<ProxyConnection>(config.port, config.remoteHost.value_or(QString()),
                                                 config.remotePort.value_or(0));
    }
    return std::make_unique<ClientConnection>(config.host, config.port);
}

ConnectionEvents *events_of(const Connection &connection) {
    return std::visit([](const auto &alternative) -> ConnectionEvents * { return alternative.get(); }, connection);
}

Role role_of(const Connection &connection) {
    switch (connection.index()) {
    case 0:
        return Role::Client;
    case 1:
        return Role::Server;
    default:
        return Role::Proxy;
    }
}

bool start(Connection &connection) {
    return std::visit([](auto &alternative) { return alternative->start(); }, connection);
}

void stop(Connection &connection) {
    std::visit([](auto &alternative) { alternative->stop(); }, connection);
}

SendResult send(Connection &connection, const Transaction &tx) {
    return std::visit([&tx](auto &alternative) { return alternative->send(tx); }, connection);
}

quint16 local_port(const Connection &connection) {
    return std::visit([](const auto &alternative) { return alternative->localPort(); }, connection);
}

}  // namespace nd::engine
