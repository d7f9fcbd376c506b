#include "probe/dns_lookup.hpp"
#include "probe/packet_generator.hpp"
#include "probe/port_scanner.hpp"
#include "probe/throughput_tester.hpp"

#include "test_support.hpp"

#include <QtCore/QMutex>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>

using namespace nd::probe;
using nd::test::wait_until;

namespace {

// Runs a blocking probe off the main thread while the test keeps the event
// loop turning for the in-process peers.
template <typename Fn>
void run_pumped(Fn fn, int timeoutMs = 15000) {
    std::atomic<bool> done{false};
    std::thread worker([&] {
        fn();
        done = true;
    });
    const bool finished = wait_until([&] { return done.load(); }, timeoutMs);
    worker.join();
    EXPECT_TRUE(finished);
}

// True when nothing listens on the `count` ports following `base`; each is
// briefly bound to prove it.
bool free_ports_after(quint16 base, int count) {
    for (int i = 1; i <= count; ++i) {
        QTcpServer reservation;
        if (!reservation.listen(QHostAddress::LocalHost, static_cast<quint16>(base + i))) {
            return false;
        }
    }
    return true;
}

}  // namespace

TEST(PortScanner, ProbesSinglePorts) {
    QTcpServer listener;
    ASSERT_TRUE(listener.listen(QHostAddress::LocalHost, 0));
    EXPECT_TRUE(scan_port(QStringLiteral("127.0.0.1"), listener.serverPort()));

    const quint16 dead = nd::test::closed_port();
    ASSERT_NE(dead, 0);
    EXPECT_FALSE(scan_port(QStringLiteral("127.0.0.1"), dead));
}

TEST(PortScanner, RangeFindsExactlyTheListeningPort) {
    QTcpServer listener;
    quint16 open = 0;
    for (int attempt = 0; attempt < 20 && open == 0; ++attempt) {
        listener.close();
        ASSERT_TRUE(listener.listen(QHostAddress::LocalHost, 0));
        const quint16 candidate = listener.serverPort();
        if (candidate > 65525 || !free_ports_after(candidate, 9)) {
            continue;
        }
        open = candidate;
    }
    ASSERT_NE(open, 0) << "no run of free loopback ports found";

    for (int permits : {3, kMaxConcurrentProbes}) {
        QMutex mutex;
        QList<quint16> progress;
        QVector<ScanResult> results;
        run_pumped([&] {
            results = scan_range(QStringLiteral("127.0.0.1"), open, open + 9, kDefaultScanTimeoutMs,
                                 [&](quint16 port) {
                                     QMutexLocker lock(&mutex);
                                     progress.append(port);
                                 },
                                 permits);
        });

        ASSERT_EQ(results.size(), 10) << "permits " << permits;
        EXPECT_EQ(progress.size(), 10);
        for (int i = 0; i < results.size(); ++i) {
            EXPECT_EQ(results[i].port, open + i);
            EXPECT_EQ(results[i].isOpen, i == 0) << "port " << results[i].port;
        }
        EXPECT_EQ(std::count_if(results.cbegin(), results.cend(), [](const ScanResult &r) { return r.isOpen; }), 1);
    }
}

TEST(PortScanner, RejectsInvalidRange) {
    QString error;
    int calls = 0;
    EXPECT_TRUE(scan_range(QStringLiteral("127.0.0.1"), 100, 99, 50, [&](quint16) { ++calls; },
                           kMaxConcurrentProbes, &error)
                    .isEmpty());
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_TRUE(scan_range(QStringLiteral("127.0.0.1"), 0, 10, 50, {}, kMaxConcurrentProbes, &error).isEmpty());
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(calls, 0);
}

TEST(PortScanner, DescribesWellKnownPorts) {
    EXPECT_EQ(port_description(22), QStringLiteral("SSH"));
    EXPECT_EQ(port_description(80), QStringLiteral("HTTP"));
    EXPECT_EQ(port_description(443), QStringLiteral("HTTPS"));
    EXPECT_EQ(port_description(1), QStringLiteral("Unknown Service"));
}

TEST(ThroughputTester, StreamsForTheRequestedDuration) {
    nd::test::SinkServer sink;
    sink.discardData();
    ASSERT_TRUE(sink.listen());
    const quint16 port = sink.port();

    std::atomic<int> progressCalls{0};
    ThroughputResult result;
    run_pumped([&] {
        result = run_throughput_test(QStringLiteral("127.0.0.1"), port, 1,
                                     [&](std::uint64_t) { ++progressCalls; });
    });

    EXPECT_TRUE(result.success);
    EXPECT_GT(result.totalBytes, 0u);
    EXPECT_GE(result.elapsed.count(), 1000);
    EXPECT_GT(result.bytesPerSecond, 0.0);
    EXPECT_GT(progressCalls.load(), 0);
}

TEST(ThroughputTester, ConnectFailureYieldsEmptyResult) {
    const quint16 dead = nd::test::closed_port();
    ASSERT_NE(dead, 0);
    const ThroughputResult result = run_throughput_test(QStringLiteral("127.0.0.1"), dead, 1);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.totalBytes, 0u);
    EXPECT_EQ(result.bytesPerSecond, 0.0);
}

TEST(PacketGenerator, InvalidHexNeverConnects) {
    nd::test::SinkServer sink;
    ASSERT_TRUE(sink.listen());

    QStringList lines;
    const int sent = run_packet_generator(QStringLiteral("127.0.0.1"), sink.port(), QStringLiteral("0g"), 3, 0,
                                          [&lines](const QString &line) { lines.append(line); });
    EXPECT_EQ(sent, 0);
    ASSERT_EQ(lines.size(), 1);
    EXPECT_TRUE(lines.first().startsWith(QStringLiteral("[PacketGen] Invalid hex data:")));

    QTest::qWait(100);
    EXPECT_EQ(sink.connections(), 0);
}

TEST(PacketGenerator, ReplaysPayload) {
    nd::test::SinkServer sink;
    ASSERT_TRUE(sink.listen());
    const quint16 port = sink.port();

    QMutex mutex;
    QStringList lines;
    int sent = 0;
    run_pumped([&] {
        sent = run_packet_generator(QStringLiteral("127.0.0.1"), port, QStringLiteral("0a 0b 0c"), 4, 10,
                                    [&](const QString &line) {
                                        QMutexLocker lock(&mutex);
                                        lines.append(line);
                                    });
    });

    EXPECT_EQ(sent, 4);
    ASSERT_TRUE(wait_until([&] { return sink.receivedBytes() >= 12; }));
    EXPECT_EQ(sink.received(), QByteArray::fromHex("0a0b0c0a0b0c0a0b0c0a0b0c"));
    EXPECT_EQ(lines.filter(QStringLiteral("Sent packet")).size(), 4);
    EXPECT_EQ(lines.last(), QStringLiteral("[PacketGen] Done."));
}

TEST(PacketGenerator, ConnectFailureIsLogged) {
    const quint16 dead = nd::test::closed_port();
    ASSERT_NE(dead, 0);
    QStringList lines;
    const int sent = run_packet_generator(QStringLiteral("127.0.0.1"), dead, QStringLiteral("00"), 2, 0,
                                          [&lines](const QString &line) { lines.append(line); });
    EXPECT_EQ(sent, 0);
    EXPECT_EQ(lines.filter(QStringLiteral("[PacketGen] Error:")).size(), 1);
}

TEST(DnsLookup, ResolvesLocalhost) {
    EXPECT_FALSE(resolve_host(QStringLiteral("localhost")).isEmpty());
    EXPECT_FALSE(resolve_host(QStringLiteral("127.0.0.1")).isEmpty());
}

TEST(DnsLookup, ReverseLookupRejectsGarbage) {
    EXPECT_FALSE(reverse_lookup(QStringLiteral("not-an-ip")).has_value());
}

TEST(ThroughputTester, CancellationKeepsPartialTotals) {
    nd::test::SinkServer sink;
    sink.discardData();
    ASSERT_TRUE(sink.listen());
    const quint16 port = sink.port();

    std::atomic<bool> cancelled{false};
    ThroughputResult result;
    run_pumped([&] {
        result = run_throughput_test(QStringLiteral("127.0.0.1"), port, 30, [&](std::uint64_t totalBytes) {
            if (totalBytes >= 4u * kThroughputBufferBytes) {
                cancelled = true;
            }
        }, &cancelled);
    });

    EXPECT_TRUE(result.success);
    EXPECT_GE(result.totalBytes, 4u * kThroughputBufferBytes);
    EXPECT_LT(result.elapsed.count(), 30000);
}

TEST(PacketGenerator, CancelledRunSendsNothing) {
    nd::test::SinkServer sink;
    ASSERT_TRUE(sink.listen());
    const quint16 port = sink.port();

    const std::atomic<bool> cancelled{true};
    QStringList lines;
    int sent = -1;
    run_pumped([&] {
        sent = run_packet_generator(QStringLiteral("127.0.0.1"), port, QStringLiteral("ff"), 5, 0,
                                    [&lines](const QString &line) { lines.append(line); }, &cancelled);
    });
    EXPECT_EQ(sent, 0);
    EXPECT_EQ(lines.last(), QStringLiteral("[PacketGen] Done."));
}
