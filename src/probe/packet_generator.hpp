#pragma once

#include <QtCore/QString>

#include <atomic>
#include <functional>

namespace nd::probe {

using PacketLogFn = std::function<void(const QString &line)>;

// Replays one hex payload `iterations` times with delayMs between writes.
// Every outcome, including invalid hex and socket failures, is reported
// through onLog. Returns the number of packets written. Blocks the calling
// thread.
int run_packet_generator(const QString &host, quint16 port, const QString &hexPayload, int iterations, int delayMs,
                         const PacketLogFn &onLog = {}, const std::atomic<bool> *cancelled = nullptr);

}  // namespace nd::probe
