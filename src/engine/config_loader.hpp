#pragma once

#include "connection_config.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace nd::engine {

// Reads the persisted document { "Connections": [ {...}, ... ] }. Keys are
// matched case-insensitively; enum fields accept their integer value or name.
std::optional<QVector<ConnectionConfig>> load_connections(const QByteArray &json, ConfigError *error = nullptr,
                                                          QString *message = nullptr);

std::optional<QVector<ConnectionConfig>> load_connections_file(const QString &path, ConfigError *error = nullptr,
                                                               QString *message = nullptr);

QByteArray save_connections(const QVector<ConnectionConfig> &configs);

}  // namespace nd::engine
