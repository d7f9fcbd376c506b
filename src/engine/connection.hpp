#pragma once

#include "client_connection.hpp"
#include "connection_config.hpp"
#include "connection_events.hpp"
#include "proxy_connection.hpp"
#include "server_connection.hpp"

#include <memory>
#include <variant>

namespace nd::engine {

// One socket lifecycle in one of the three roles. Every alternative exposes
// start/stop/send/localPort and the ConnectionEvents notifications.
using Connection = std::variant<std::unique_ptr<ClientConnection>,
                                std::unique_ptr<ServerConnection>,
                                std::unique_ptr<ProxyConnection>>;

Connection make_connection(const ConnectionConfig &config);

ConnectionEvents *events_of(const Connection &connection);
Role role_of(const Connection &connection);

bool start(Connection &connection);
void stop(Connection &connection);
SendResult send(Connection &connection, const Transaction &tx);
quint16 local_port(const Connection &connection);

}  // namespace nd::engine
