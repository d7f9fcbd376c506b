#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtNetwork/QHostAddress>

#include <optional>

namespace nd::probe {

// Blocking lookups; a failed resolution yields an empty list / nullopt.
QList<QHostAddress> resolve_host(const QString &hostName);
std::optional<QString> reverse_lookup(const QString &address);

}  // namespace nd::probe
