#include "port_scanner.hpp"

#include "common/logger.hpp"

#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QThreadPool>
#include <QtNetwork/QTcpSocket>

#include <algorithm>
#include <map>

namespace nd::probe {

namespace {

const std::map<quint16, const char *> &well_known_ports() {
    static const std::map<quint16, const char *> table = {
        {20, "FTP (Data)"},
        {21, "FTP (Control)"},
        {22, "SSH"},
        {23, "Telnet"},
        {25, "SMTP"},
        {53, "DNS"},
        {67, "DHCP (Server)"},
        {68, "DHCP (Client)"},
        {69, "TFTP"},
        {80, "HTTP"},
        {110, "POP3"},
        {123, "NTP"},
        {137, "NetBIOS Name Service"},
        {138, "NetBIOS Datagram Service"},
        {139, "NetBIOS Session Service"},
        {143, "IMAP"},
        {161, "SNMP"},
        {179, "BGP"},
        {389, "LDAP"},
        {443, "HTTPS"},
        {445, "Microsoft-DS (SMB)"},
        {465, "SMTPS"},
        {514, "Syslog"},
        {515, "LPD"},
        {587, "SMTP (Submission)"},
        {631, "IPP (CUPS)"},
        {636, "LDAPS"},
        {873, "Rsync"},
        {993, "IMAPS"},
        {995, "POP3S"},
        {1080, "SOCKS Proxy"},
        {1433, "MS SQL"},
        {1521, "Oracle DB"},
        {2049, "NFS"},
        {3000, "Gitea / Node.js"},
        {3306, "MySQL"},
        {3389, "RDP"},
        {5000, "Flask / Docker Registry"},
        {5432, "PostgreSQL"},
        {5900, "VNC"},
        {6379, "Redis"},
        {8000, "HTTP Alt"},
        {8080, "HTTP Proxy / Tomcat"},
        {8443, "HTTPS Alt"},
        {9000, "Portainer / PHP-FPM"},
        {9090, "Prometheus / Cockpit"},
        {9200, "Elasticsearch"},
        {27017, "MongoDB"},
    };
    return table;
}

}  // namespace

bool scan_port(const QString &host, quint16 port, int timeoutMs) {
    QTcpSocket socket;
    socket.connectToHost(host, port);
    const bool open = socket.waitForConnected(timeoutMs);
    socket.abort();
    return open;
}

QVector<ScanResult> scan_range(const QString &host, quint16 startPort, quint16 endPort, int timeoutMs,
                               const ScanProgressFn &onProgress, int maxConcurrent, QString *error) {
    if (error) {
        error->clear();
    }
    QVector<ScanResult> results;
    if (startPort == 0 || startPort > endPort) {
        const QString reason = QStringLiteral("Invalid port range %1-%2.").arg(startPort).arg(endPort);
        common::Logger::instance().warn(QStringLiteral("scanner"), reason);
        if (error) {
            *error = reason;
        }
        return results;
    }

    results.reserve(endPort - startPort + 1);
    QMutex mutex;
    QThreadPool pool;
    pool.setMaxThreadCount(std::max(1, maxConcurrent));
    for (quint32 port = startPort; port <= endPort; ++port) {
        const auto target = static_cast<quint16>(port);
        pool.start([&, target] {
            const bool open = scan_port(host, target, timeoutMs);
            QMutexLocker locker(&mutex);
            results.append(ScanResult{target, open});
            if (onProgress) {
                onProgress(target);
            }
        });
    }
    pool.waitForDone();

    std::sort(results.begin(), results.end(),
              [](const ScanResult &lhs, const ScanResult &rhs) { return lhs.port < rhs.port; });
    return results;
}

QString port_description(quint16 port) {
    const auto &table = well_known_ports();
    const auto it = table.find(port);
    return it != table.end() ? QString::fromLatin1(it->second) : QStringLiteral("Unknown Service");
}

}  // namespace nd::probe
