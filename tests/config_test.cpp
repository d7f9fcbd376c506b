#include "engine/config_loader.hpp"
#include "engine/connection_config.hpp"

#include <QtCore/QTemporaryDir>
#include <QtCore/QFile>

#include <gtest/gtest.h>

using namespace nd::engine;

namespace {

ConnectionConfig proxy_config() {
    ConnectionConfig config;
    config.name = QStringLiteral("tap");
    config.role = Role::Proxy;
    config.port = 9000;
    config.remoteHost = QStringLiteral("10.0.0.5");
    config.remotePort = 80;
    return config;
}

}  // namespace

TEST(ConnectionConfig, ProxyRequiresRemoteTarget) {
    ConnectionConfig config = proxy_config();
    config.remoteHost.reset();
    config.remotePort.reset();
    ConfigError error = ConfigError::None;
    QString message;
    EXPECT_FALSE(validate_config(config, &error, &message));
    EXPECT_EQ(error, ConfigError::MissingProxyTarget);
    EXPECT_TRUE(message.contains(QStringLiteral("Proxy")));
}

TEST(ConnectionConfig, RemoteTargetIsAllOrNothing) {
    ConnectionConfig config = proxy_config();
    config.remotePort.reset();
    ConfigError error = ConfigError::None;
    EXPECT_FALSE(validate_config(config, &error));
    EXPECT_EQ(error, ConfigError::PartialProxyTarget);
}

TEST(ConnectionConfig, JitterBoundsArePairedAndOrdered) {
    ConnectionConfig config;
    config.role = Role::Client;
    config.port = 7;
    config.intervalMs = 1000;
    config.jitterMinMs = 100;

    ConfigError error = ConfigError::None;
    EXPECT_FALSE(validate_config(config, &error));
    EXPECT_EQ(error, ConfigError::PartialJitter);

    config.jitterMaxMs = 50;
    EXPECT_FALSE(validate_config(config, &error));
    EXPECT_EQ(error, ConfigError::InvalidJitterRange);

    config.jitterMaxMs = 100;
    EXPECT_TRUE(validate_config(config, &error));
    EXPECT_EQ(error, ConfigError::None);
}

TEST(ConnectionConfig, ClientNeedsPort) {
    ConnectionConfig config;
    config.role = Role::Client;
    ConfigError error = ConfigError::None;
    EXPECT_FALSE(validate_config(config, &error));
    EXPECT_EQ(error, ConfigError::InvalidPort);
}

TEST(ConnectionConfig, ServerAcceptsEphemeralPort) {
    ConnectionConfig config;
    config.role = Role::Server;
    EXPECT_TRUE(validate_config(config));
}

TEST(ConfigLoader, ReadsPersistedDocument) {
    const QByteArray json = R"({
        "Connections": [
            {
                "Port": 5000,
                "Name": "echo",
                "Type": 0,
                "Host": "127.0.0.1",
                "AutoTransactions": [
                    { "Data": "PING", "Encoding": 0, "AppendReturn": false, "AppendNewline": true },
                    { "Data": "de ad", "Encoding": 1 }
                ],
                "IntervalMs": 1000,
                "JitterMinMs": 100,
                "JitterMaxMs": 300,
                "RemoteHost": null,
                "RemotePort": null,
                "DumpFilePath": "/tmp/echo.log"
            },
            {
                "Name": "tap",
                "Type": 2,
                "Port": 9000,
                "RemoteHost": "example.org",
                "RemotePort": 80,
                "AutoTransactions": [],
                "IntervalMs": null
            }
        ]
    })";

    ConfigError error = ConfigError::None;
    QString message;
    const auto configs = load_connections(json, &error, &message);
    ASSERT_TRUE(configs.has_value()) << message.toStdString();
    ASSERT_EQ(configs->size(), 2);

    const ConnectionConfig &echo = configs->at(0);
    EXPECT_EQ(echo.name, QStringLiteral("echo"));
    EXPECT_EQ(echo.role, Role::Server);
    EXPECT_EQ(echo.port, 5000);
    ASSERT_EQ(echo.autoTransactions.size(), 2);
    EXPECT_TRUE(echo.autoTransactions.at(0).appendNewline);
    EXPECT_EQ(echo.autoTransactions.at(1).encoding, nd::codec::Encoding::Hex);
    EXPECT_EQ(echo.intervalMs, 1000u);
    EXPECT_EQ(echo.jitterMinMs, 100u);
    EXPECT_EQ(echo.jitterMaxMs, 300u);
    EXPECT_FALSE(echo.remoteHost.has_value());
    EXPECT_EQ(echo.dumpFilePath, QStringLiteral("/tmp/echo.log"));

    const ConnectionConfig &tap = configs->at(1);
    EXPECT_EQ(tap.role, Role::Proxy);
    EXPECT_EQ(tap.remoteHost, QStringLiteral("example.org"));
    EXPECT_EQ(tap.remotePort, quint16(80));
    EXPECT_FALSE(tap.intervalMs.has_value());
}

TEST(ConfigLoader, AcceptsNamedEnumsAndLowercaseKeys) {
    const QByteArray json = R"({ "connections": [
        { "name": "c", "role": "client", "host": "localhost", "port": 23,
          "autoTransactions": [ { "data": "SGk=", "encoding": "Binary" } ] }
    ] })";
    const auto configs = load_connections(json);
    ASSERT_TRUE(configs.has_value());
    ASSERT_EQ(configs->size(), 1);
    EXPECT_EQ(configs->at(0).role, Role::Client);
    EXPECT_EQ(configs->at(0).host, QStringLiteral("localhost"));
    EXPECT_EQ(configs->at(0).autoTransactions.at(0).encoding, nd::codec::Encoding::Binary);
}

TEST(ConfigLoader, RejectsInvalidInput) {
    ConfigError error = ConfigError::None;
    EXPECT_FALSE(load_connections("{ not json", &error).has_value());
    EXPECT_EQ(error, ConfigError::InvalidJson);

    EXPECT_FALSE(load_connections(R"({"Connections":[{"Name":"x","Type":7,"Port":1}]})", &error).has_value());
    EXPECT_EQ(error, ConfigError::InvalidRole);

    EXPECT_FALSE(load_connections(R"({"Connections":[{"Name":"x","Type":0,"Port":70000}]})", &error).has_value());
    EXPECT_EQ(error, ConfigError::InvalidPort);

    EXPECT_FALSE(load_connections(R"({"Connections":[{"Name":"p","Type":"Proxy","Port":1}]})", &error).has_value());
    EXPECT_EQ(error, ConfigError::MissingProxyTarget);

    QString message;
    EXPECT_FALSE(load_connections(
                     R"({"Connections":[{"Name":"s","Type":0,"AutoTransactions":[{"Data":"x","Encoding":"utf8"}]}]})",
                     &error, &message)
                     .has_value());
    EXPECT_EQ(error, ConfigError::InvalidEncoding);
    EXPECT_TRUE(message.contains(QStringLiteral("utf8")));
}

TEST(ConfigLoader, SavedDocumentLoadsBack) {
    ConnectionConfig config = proxy_config();
    config.dumpFilePath = QStringLiteral("tap.log");

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("config.json"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(save_connections({config}));
    file.close();

    const auto loaded = load_connections_file(path);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 1);
    EXPECT_EQ(loaded->at(0).name, config.name);
    EXPECT_EQ(loaded->at(0).role, Role::Proxy);
    EXPECT_EQ(loaded->at(0).remoteHost, config.remoteHost);
    EXPECT_EQ(loaded->at(0).remotePort, config.remotePort);
    EXPECT_EQ(loaded->at(0).dumpFilePath, config.dumpFilePath);
}

TEST(ConfigLoader, MissingFileIsReported) {
    ConfigError error = ConfigError::None;
    QString message;
    EXPECT_FALSE(load_connections_file(QStringLiteral("/nonexistent/netdiag.json"), &error, &message).has_value());
    EXPECT_EQ(error, ConfigError::InvalidJson);
    EXPECT_FALSE(message.isEmpty());
}
