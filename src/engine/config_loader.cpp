#include "config_loader.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonParseError>
#include <QtCore/QJsonValue>
#include <QtCore/QVariant>

#include <limits>

namespace nd::engine {

namespace {

void set_error(ConfigError code, const QString &reason, ConfigError *outCode, QString *outReason) {
    if (outCode) {
        *outCode = code;
    }
    if (outReason) {
        *outReason = reason;
    }
}

QJsonValue field(const QJsonObject &object, const QString &key) {
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        if (it.key().compare(key, Qt::CaseInsensitive) == 0) {
            return it.value();
        }
    }
    return QJsonValue(QJsonValue::Undefined);
}

bool is_absent(const QJsonValue &value) {
    return value.isUndefined() || value.isNull();
}

// Reads an unsigned integer field into [0, maxValue]; absent fields leave `out` empty.
bool read_uint(const QJsonObject &object, const QString &key, quint32 maxValue, std::optional<quint32> &out,
               ConfigError *error, QString *message) {
    const QJsonValue value = field(object, key);
    out.reset();
    if (is_absent(value)) {
        return true;
    }
    const double number = value.toDouble(-1.0);
    if (!value.isDouble() || number < 0 || number > maxValue || number != static_cast<double>(static_cast<qint64>(number))) {
        set_error(key.endsWith(QStringLiteral("Port")) ? ConfigError::InvalidPort : ConfigError::InvalidJson,
                  QStringLiteral("Field '%1' must be an integer between 0 and %2.").arg(key).arg(maxValue), error,
                  message);
        return false;
    }
    out = static_cast<quint32>(number);
    return true;
}

bool read_port(const QJsonObject &object, const QString &key, std::optional<quint16> &out, ConfigError *error,
               QString *message) {
    std::optional<quint32> raw;
    if (!read_uint(object, key, std::numeric_limits<quint16>::max(), raw, error, message)) {
        return false;
    }
    out.reset();
    if (raw) {
        out = static_cast<quint16>(*raw);
    }
    return true;
}

std::optional<QString> read_optional_string(const QJsonObject &object, const QString &key) {
    const QJsonValue value = field(object, key);
    if (is_absent(value) || !value.isString() || value.toString().isEmpty()) {
        return std::nullopt;
    }
    return value.toString();
}

std::optional<Role> read_role(const QJsonObject &object, ConfigError *error, QString *message) {
    QJsonValue value = field(object, QStringLiteral("Type"));
    if (is_absent(value)) {
        value = field(object, QStringLiteral("Role"));
    }
    if (is_absent(value)) {
        set_error(ConfigError::MissingField, QStringLiteral("Connection is missing 'Type'."), error, message);
        return std::nullopt;
    }
    if (value.isString()) {
        if (auto role = role_from_name(value.toString())) {
            return role;
        }
    } else if (value.isDouble()) {
        const int index = value.toInt(-1);
        if (index >= static_cast<int>(Role::Server) && index <= static_cast<int>(Role::Proxy)) {
            return static_cast<Role>(index);
        }
    }
    set_error(ConfigError::InvalidRole,
              QStringLiteral("Unknown connection type '%1'.").arg(value.toVariant().toString()), error, message);
    return std::nullopt;
}

std::optional<Transaction> read_transaction(const QJsonValue &value, ConfigError *error, QString *message) {
    if (!value.isObject()) {
        set_error(ConfigError::MissingField, QStringLiteral("Transaction entries must be objects."), error, message);
        return std::nullopt;
    }
    const QJsonObject object = value.toObject();
    Transaction tx;
    tx.data = field(object, QStringLiteral("Data")).toString();

    const QJsonValue encoding = field(object, QStringLiteral("Encoding"));
    if (encoding.isString()) {
        const auto parsed = codec::encoding_from_name(encoding.toString());
        if (!parsed) {
            set_error(ConfigError::InvalidEncoding,
                      QStringLiteral("Unknown transaction encoding '%1'.").arg(encoding.toString()), error, message);
            return std::nullopt;
        }
        tx.encoding = *parsed;
    } else if (encoding.isDouble()) {
        const int index = encoding.toInt(-1);
        if (index < static_cast<int>(codec::Encoding::Ascii) || index > static_cast<int>(codec::Encoding::Binary)) {
            set_error(ConfigError::InvalidEncoding, QStringLiteral("Unknown transaction encoding %1.").arg(index),
                      error, message);
            return std::nullopt;
        }
        tx.encoding = static_cast<codec::Encoding>(index);
    } else if (!is_absent(encoding)) {
        set_error(ConfigError::InvalidEncoding, QStringLiteral("Transaction encoding must be a name or number."),
                  error, message);
        return std::nullopt;
    }

    tx.appendReturn = field(object, QStringLiteral("AppendReturn")).toBool(false);
    tx.appendNewline = field(object, QStringLiteral("AppendNewline")).toBool(false);
    return tx;
}

std::optional<ConnectionConfig> read_connection(const QJsonValue &value, ConfigError *error, QString *message) {
    if (!value.isObject()) {
        set_error(ConfigError::MissingField, QStringLiteral("Connection entries must be objects."), error, message);
        return std::nullopt;
    }
    const QJsonObject object = value.toObject();

    ConnectionConfig config;
    config.name = field(object, QStringLiteral("Name")).toString();
    const auto role = read_role(object, error, message);
    if (!role) {
        return std::nullopt;
    }
    config.role = *role;

    const QJsonValue host = field(object, QStringLiteral("Host"));
    if (host.isString() && !host.toString().isEmpty()) {
        config.host = host.toString();
    }

    std::optional<quint16> port;
    if (!read_port(object, QStringLiteral("Port"), port, error, message)) {
        return std::nullopt;
    }
    config.port = port.value_or(0);

    config.remoteHost = read_optional_string(object, QStringLiteral("RemoteHost"));
    if (!read_port(object, QStringLiteral("RemotePort"), config.remotePort, error, message)) {
        return std::nullopt;
    }

    const QJsonValue transactions = field(object, QStringLiteral("AutoTransactions"));
    if (transactions.isArray()) {
        for (const QJsonValue &entry : transactions.toArray()) {
            auto tx = read_transaction(entry, error, message);
            if (!tx) {
                return std::nullopt;
            }
            config.autoTransactions.append(*tx);
        }
    } else if (!is_absent(transactions)) {
        set_error(ConfigError::MissingField, QStringLiteral("'AutoTransactions' must be an array."), error, message);
        return std::nullopt;
    }

    constexpr quint32 kMaxMs = std::numeric_limits<qint32>::max();
    if (!read_uint(object, QStringLiteral("IntervalMs"), kMaxMs, config.intervalMs, error, message) ||
        !read_uint(object, QStringLiteral("JitterMinMs"), kMaxMs, config.jitterMinMs, error, message) ||
        !read_uint(object, QStringLiteral("JitterMaxMs"), kMaxMs, config.jitterMaxMs, error, message)) {
        return std::nullopt;
    }
    config.dumpFilePath = read_optional_string(object, QStringLiteral("DumpFilePath"));

    QString reason;
    if (!validate_config(config, error, &reason)) {
        if (message) {
            *message = config.name.isEmpty() ? reason : QStringLiteral("%1: %2").arg(config.name, reason);
        }
        return std::nullopt;
    }
    return config;
}

QJsonObject write_connection(const ConnectionConfig &config) {
    QJsonObject object;
    object.insert(QStringLiteral("Name"), config.name);
    object.insert(QStringLiteral("Type"), static_cast<int>(config.role));
    object.insert(QStringLiteral("Host"), config.host);
    object.insert(QStringLiteral("Port"), config.port);
    object.insert(QStringLiteral("RemoteHost"), config.remoteHost ? QJsonValue(*config.remoteHost) : QJsonValue());
    object.insert(QStringLiteral("RemotePort"), config.remotePort ? QJsonValue(*config.remotePort) : QJsonValue());

    QJsonArray transactions;
    for (const auto &tx : config.autoTransactions) {
        QJsonObject entry;
        entry.insert(QStringLiteral("Data"), tx.data);
        entry.insert(QStringLiteral("Encoding"), static_cast<int>(tx.encoding));
        entry.insert(QStringLiteral("AppendReturn"), tx.appendReturn);
        entry.insert(QStringLiteral("AppendNewline"), tx.appendNewline);
        transactions.append(entry);
    }
    object.insert(QStringLiteral("AutoTransactions"), transactions);

    const auto optionalMs = [](const std::optional<quint32> &value) {
        return value ? QJsonValue(static_cast<qint64>(*value)) : QJsonValue();
    };
    object.insert(QStringLiteral("IntervalMs"), optionalMs(config.intervalMs));
    object.insert(QStringLiteral("JitterMinMs"), optionalMs(config.jitterMinMs));
    object.insert(QStringLiteral("JitterMaxMs"), optionalMs(config.jitterMaxMs));
    object.insert(QStringLiteral("DumpFilePath"), config.dumpFilePath ? QJsonValue(*config.dumpFilePath) : QJsonValue());
    return object;
}

}  // namespace

std::optional<QVector<ConnectionConfig>> load_connections(const QByteArray &json, ConfigError *error,
                                                          QString *message) {
    set_error(ConfigError::None, QString(), error, message);

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        set_error(ConfigError::InvalidJson,
                  parseError.error != QJsonParseError::NoError
                      ? QStringLiteral("Invalid JSON at offset %1: %2").arg(parseError.offset).arg(parseError.errorString())
                      : QStringLiteral("Configuration root must be an object."),
                  error, message);
        return std::nullopt;
    }

    QVector<ConnectionConfig> configs;
    const QJsonValue connections = field(document.object(), QStringLiteral("Connections"));
    if (is_absent(connections)) {
        return configs;
    }
    if (!connections.isArray()) {
        set_error(ConfigError::InvalidJson, QStringLiteral("'Connections' must be an array."), error, message);
        return std::nullopt;
    }
    for (const QJsonValue &entry : connections.toArray()) {
        auto config = read_connection(entry, error, message);
        if (!config) {
            return std::nullopt;
        }
        configs.append(std::move(*config));
    }
    return configs;
}

std::optional<QVector<ConnectionConfig>> load_connections_file(const QString &path, ConfigError *error,
                                                               QString *message) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        set_error(ConfigError::InvalidJson, QStringLiteral("Cannot open %1: %2").arg(path, file.errorString()), error,
                  message);
        return std::nullopt;
    }
    return load_connections(file.readAll(), error, message);
}

QByteArray save_connections(const QVector<ConnectionConfig> &configs) {
    QJsonArray connections;
    for (const auto &config : configs) {
        connections.append(write_connection(config));
    }
    QJsonObject root;
    root.insert(QStringLiteral("Connections"), connections);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

}  // namespace nd::engine
