#include "connection_config.hpp"

namespace nd::engine {

namespace {

bool fail(ConfigError code, const QString &reason, ConfigError *outCode, QString *outReason) {
    if (outCode) {
        *outCode = code;
    }
    if (outReason) {
        *outReason = reason;
    }
    return false;
}

}  // namespace

QString role_name(Role role) {
    switch (role) {
    case Role::Server:
        return QStringLiteral("Server");
    case Role::Client:
        return QStringLiteral("Client");
    case Role::Proxy:
        return QStringLiteral("Proxy");
    }
    return QStringLiteral("Client");
}

std::optional<Role> role_from_name(const QString &name) {
    const QString key = name.trimmed();
    for (const auto candidate : {Role::Server, Role::Client, Role::Proxy}) {
        if (key.compare(role_name(candidate), Qt::CaseInsensitive) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

QString compose_text(const Transaction &tx) {
    QString text = tx.data;
    if (tx.appendReturn) {
        text.append(QLatin1Char('\r'));
    }
    if (tx.appendNewline) {
        text.append(QLatin1Char('\n'));
    }
    return text;
}

bool validate_config(const ConnectionConfig &config, ConfigError *error, QString *message) {
    if (error) {
        *error = ConfigError::None;
    }
    if (message) {
        message->clear();
    }

    if (config.role == Role::Client) {
        if (config.host.trimmed().isEmpty()) {
            return fail(ConfigError::MissingField, QStringLiteral("Client requires a host."), error, message);
        }
        if (config.port == 0) {
            return fail(ConfigError::InvalidPort, QStringLiteral("Client requires a non-zero port."), error, message);
        }
    }

    const bool hasRemoteHost = config.remoteHost.has_value() && !config.remoteHost->trimmed().isEmpty();
    const bool hasRemotePort = config.remotePort.has_value();
    if (hasRemoteHost != hasRemotePort) {
        return fail(ConfigError::PartialProxyTarget,
                    QStringLiteral("RemoteHost and RemotePort must be set together."), error, message);
    }
    if (config.role == Role::Proxy) {
        if (!hasRemoteHost) {
            return fail(ConfigError::MissingProxyTarget,
                        QStringLiteral("Proxy requires RemoteHost and RemotePort."), error, message);
        }
        if (*config.remotePort == 0) {
            return fail(ConfigError::InvalidPort, QStringLiteral("Proxy requires a non-zero RemotePort."), error, message);
        }
    }

    if (config.jitterMinMs.has_value() != config.jitterMaxMs.has_value()) {
        return fail(ConfigError::PartialJitter,
                    QStringLiteral("JitterMinMs and JitterMaxMs must be set together."), error, message);
    }
    if (config.jitterMinMs.has_value()) {
        if (*config.jitterMinMs > *config.jitterMaxMs) {
            return fail(ConfigError::InvalidJitterRange,
                        QStringLiteral("JitterMinMs (%1) exceeds JitterMaxMs (%2).")
                            .arg(*config.jitterMinMs)
                            .arg(*config.jitterMaxMs),
                        error, message);
        }
        if (!config.intervalMs.has_value()) {
            return fail(ConfigError::PartialJitter, QStringLiteral("Jitter requires IntervalMs."), error, message);
        }
    }
    return true;
}

}  // namespace nd::engine
