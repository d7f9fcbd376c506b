#pragma once

#include "common/byte_codec.hpp"

#include <QtCore/QString>
#include <QtCore/QVector>

#include <cstdint>
#include <optional>

namespace nd::engine {

enum class Role {
    Server = 0,
    Client,
    Proxy,
};

enum class ConfigError {
    None = 0,
    InvalidJson,
    MissingField,
    InvalidRole,
    InvalidEncoding,
    InvalidPort,
    MissingProxyTarget,
    PartialProxyTarget,
    PartialJitter,
    InvalidJitterRange,
};

QString role_name(Role role);
std::optional<Role> role_from_name(const QString &name);

struct Transaction {
    QString data;
    codec::Encoding encoding = codec::Encoding::Ascii;
    bool appendReturn = false;
    bool appendNewline = false;
};

// Payload text with the requested CR/LF appended, before any decoding.
QString compose_text(const Transaction &tx);

struct ConnectionConfig {
    QString name;
    Role role = Role::Client;
    QString host = QStringLiteral("127.0.0.1");
    quint16 port = 0;
    std::optional<QString> remoteHost;
    std::optional<quint16> remotePort;
    QVector<Transaction> autoTransactions;
    std::optional<quint32> intervalMs;
    std::optional<quint32> jitterMinMs;
    std::optional<quint32> jitterMaxMs;
    std::optional<QString> dumpFilePath;
};

bool validate_config(const ConnectionConfig &config, ConfigError *error = nullptr, QString *message = nullptr);

}  // namespace nd::engine
