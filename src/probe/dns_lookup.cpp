#include "dns_lookup.hpp"

#include "common/logger.hpp"

#include <QtNetwork/QHostInfo>

namespace nd::probe {

QList<QHostAddress> resolve_host(const QString &hostName) {
    const QHostInfo info = QHostInfo::fromName(hostName);
    if (info.error() != QHostInfo::NoError) {
        common::Logger::instance().warn(QStringLiteral("dns"),
                                        QStringLiteral("Lookup of %1 failed: %2").arg(hostName, info.errorString()));
        return {};
    }
    return info.addresses();
}

std::optional<QString> reverse_lookup(const QString &address) {
    QHostAddress parsed;
    if (!parsed.setAddress(address)) {
        common::Logger::instance().warn(QStringLiteral("dns"), QStringLiteral("'%1' is not an IP address").arg(address));
        return std::nullopt;
    }
    const QHostInfo info = QHostInfo::fromName(parsed.toString());
    if (info.error() != QHostInfo::NoError || info.hostName().isEmpty() || info.hostName() == parsed.toString()) {
        return std::nullopt;
    }
    return info.hostName();
}

}  // namespace nd::probe
