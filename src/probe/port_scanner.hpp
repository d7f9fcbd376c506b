#pragma once

#include <QtCore/QString>
#include <QtCore/QVector>

#include <functional>

namespace nd::probe {

constexpr int kMaxConcurrentProbes = 100;
constexpr int kDefaultScanTimeoutMs = 200;

struct ScanResult {
    quint16 port = 0;
    bool isOpen = false;
};

using ScanProgressFn = std::function<void(quint16 port)>;

// A port is open when a TCP connect completes within timeoutMs; any failure
// counts as closed.
bool scan_port(const QString &host, quint16 port, int timeoutMs = kDefaultScanTimeoutMs);

// Probes [startPort, endPort] with at most maxConcurrent connects in flight.
// onProgress runs once per finished probe in completion order, serialized
// across workers. The result is sorted by port. An inverted or zero-based
// range yields an empty result and sets *error.
QVector<ScanResult> scan_range(const QString &host, quint16 startPort, quint16 endPort,
                               int timeoutMs = kDefaultScanTimeoutMs, const ScanProgressFn &onProgress = {},
                               int maxConcurrent = kMaxConcurrentProbes, QString *error = nullptr);

// Display-only name of a well-known service, "Unknown Service" otherwise.
QString port_description(quint16 port);

}  // namespace nd::probe
