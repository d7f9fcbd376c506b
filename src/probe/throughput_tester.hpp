#pragma once

#include <QtCore/QString>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace nd::probe {

constexpr int kThroughputBufferBytes = 64 * 1024;

struct ThroughputResult {
    std::uint64_t totalBytes = 0;
    std::chrono::milliseconds elapsed{0};
    double bytesPerSecond = 0.0;
    bool success = false;
};

using ThroughputProgressFn = std::function<void(std::uint64_t totalBytes)>;

// Connects once and writes random data for durationSeconds. Connection or
// I/O failures produce success=false with zero totals; nothing is thrown.
// Blocks the calling thread.
ThroughputResult run_throughput_test(const QString &host, quint16 port, int durationSeconds,
                                     const ThroughputProgressFn &onProgress = {},
                                     const std::atomic<bool> *cancelled = nullptr);

}  // namespace nd::probe
