#include "netwatch/config.hpp"
#include "netwatch/errors.hpp"
#include "netwatch/log.hpp"
#include "netwatch/network_monitor.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <thread>

using namespace netwatch;

namespace {

const int kExitConfiguration = 1;
const int kExitWirelessUnavailable = 2;

std::string orDash(const std::optional<std::string>& value) {
    return value ? *value : "-";
}

std::string formatMs(const std::optional<double>& value) {
    if (!value) {
        return "-";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << *value << " ms";
    return oss.str();
}

} // namespace

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [command] [options]\n";
    std::cout << "Commands:\n";
    std::cout << "  devices        Discover devices on the local network (default)\n";
    std::cout << "  wifi           List nearby wireless networks\n";
    std::cout << "  health         Sample connection health\n";
    std::cout << "  diagnose       Run a full connection diagnosis\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -j, --json             Output as JSON (default)\n";
    std::cout << "  -t, --table            Output as formatted table\n";
    std::cout << "  -r, --range CIDR       Network range to scan (default: local /24)\n";
    std::cout << "  -s, --strategy NAME    Discovery strategy: auto, arp or ping\n";
    std::cout << "      --max-addresses N  Probe at most N addresses (default 254)\n";
    std::cout << "      --concurrency N    Parallel probes per sweep (default 30)\n";
    std::cout << "      --timeout-ms N     Per-probe timeout in milliseconds\n";
    std::cout << "      --sweep-timeout S  Abandon a sweep after S seconds (default 60)\n";
    std::cout << "      --no-resolve       Skip reverse DNS lookups\n";
    std::cout << "      --target HOST      Latency target (default 8.8.8.8)\n";
    std::cout << "      --interval S       Seconds between health samples (default 5)\n";
    std::cout << "      --count N          Health samples to take (default 1)\n";
    std::cout << "      --history N        Snapshots to include in the history\n";
    std::cout << "  -v, --verbose          Debug logging\n";
    std::cout << "  -q, --quiet            Only log errors\n";
    std::cout << "\nARP discovery needs raw-socket privileges; without them ping is used.\n";
    std::cout << "Log level can also be set with NETWATCH_LOG_LEVEL.\n";
}

void printDevicesAsTable(const DiscoveryResult& result) {
    if (result.devices.empty()) {
        if (result.summary.capabilityUnavailable) {
            std::cout << "Probing unavailable; run with elevated privileges or --strategy ping.\n";
        } else {
            std::cout << "No devices found.\n";
        }
        return;
    }

    std::cout << std::left
              << std::setw(18) << "IP"
              << std::setw(20) << "MAC"
              << std::setw(40) << "Hostname"
              << "\n";

    std::cout << std::string(78, '-') << "\n";

    for (const auto& device : result.devices) {
        std::cout << std::left
                  << std::setw(18) << device.address.toString()
                  << std::setw(20) << orDash(device.physicalAddress)
                  << std::setw(40) << orDash(device.hostname)
                  << "\n";
    }

    std::cout << "\nTotal devices found: " << result.devices.size()
              << " (" << result.summary.addressesProbed << " addresses probed in "
              << result.summary.range.toString() << ", strategy "
              << toString(result.summary.strategyUsed) << ")\n";
}

void printDevicesAsJson(const DiscoveryResult& result) {
    std::cout << "{\"summary\":" << result.summary.toJson() << ",\"devices\":[";
    for (size_t i = 0; i < result.devices.size(); ++i) {
        std::cout << result.devices[i].toJson();
        if (i < result.devices.size() - 1) {
            std::cout << ",";
        }
    }
    std::cout << "]}\n";
}

void printNetworksAsTable(const WirelessScanResult& result) {
    if (result.networks.empty()) {
        std::cout << "No networks found.\n";
        return;
    }

    std::cout << std::left
              << std::setw(32) << "SSID"
              << std::setw(20) << "BSSID"
              << std::setw(10) << "Signal"
              << std::setw(10) << "Strength"
              << std::setw(10) << "Channel"
              << std::setw(15) << "Security"
              << "\n";

    std::cout << std::string(97, '-') << "\n";

    for (const auto& net : result.networks) {
        int dbm = net.rssiDbm ? *net.rssiDbm : dbmFromPercent(net.signalPercent);

        std::cout << std::left
                  << std::setw(32) << net.ssid
                  << std::setw(20) << net.bssid
                  << std::setw(10) << (std::to_string(dbm) + " dBm")
                  << std::setw(10) << (std::to_string(net.signalPercent) + "%")
                  << std::setw(10) << net.channel
                  << std::setw(15) << toString(net.security)
                  << "\n";
    }

    std::cout << "\nTotal networks found: " << result.networks.size()
              << " (via " << result.source << ")\n";
}

void printHealthAsTable(const HealthSnapshot& current, const std::vector<HealthSnapshot>& history,
                        const HealthStatistics& stats) {
    std::cout << "Health score: " << current.score << " (" << toString(current.category) << ")\n";
    std::cout << "  Latency:     " << formatMs(current.latencyMs) << "\n";
    std::cout << "  Packet loss: " << std::fixed << std::setprecision(1)
              << current.packetLossPercent << "%\n";
    std::cout << "  Jitter:      " << current.jitterMs << " ms\n";
    std::cout << "  Uptime:      " << current.uptimePercent << "%\n";
    for (const auto& alert : current.alerts) {
        std::cout << "  ! " << alert << "\n";
    }

    std::cout << "\n" << std::left
              << std::setw(14) << "Time"
              << std::setw(8) << "Score"
              << std::setw(12) << "Category"
              << std::setw(12) << "Latency"
              << std::setw(8) << "Loss"
              << "\n";
    std::cout << std::string(54, '-') << "\n";
    for (const auto& snapshot : history) {
        std::string stamp = formatTimestamp(snapshot.timestamp);
        std::ostringstream loss;
        loss << std::fixed << std::setprecision(0) << snapshot.packetLossPercent << "%";
        std::cout << std::left
                  << std::setw(14) << stamp.substr(stamp.find('T') + 1, 8)
                  << std::setw(8) << snapshot.score
                  << std::setw(12) << toString(snapshot.category)
                  << std::setw(12) << formatMs(snapshot.latencyMs)
                  << std::setw(8) << loss.str()
                  << "\n";
    }

    std::cout << "\nTests: " << stats.successfulTests << "/" << stats.totalTests
              << " successful (" << std::setprecision(1) << stats.successRate << "%)"
              << ", avg latency " << formatMs(stats.avgLatency) << "\n";
}

void printHealthAsJson(const HealthSnapshot& current, const std::vector<HealthSnapshot>& history,
                       const HealthStatistics& stats) {
    std::cout << "{\"current\":" << current.toJson() << ",\"history\":[";
    for (size_t i = 0; i < history.size(); ++i) {
        std::cout << history[i].toJson();
        if (i < history.size() - 1) {
            std::cout << ",";
        }
    }
    std::cout << "],\"statistics\":" << stats.toJson() << "}\n";
}

void printDiagnosisAsTable(const DiagnosisReport& report) {
    std::cout << "Internet:   " << (report.internetReachable ? "connected" : "DISCONNECTED") << "\n";
    std::cout << "Health:     " << report.health.score << " (" << toString(report.health.category) << ")\n";
    std::cout << "DNS lookup: " << formatMs(report.dnsResolutionMs) << "\n";
    std::cout << "Stability:  " << report.stability.stabilityScore << " - "
              << report.stability.recommendation << "\n";
    if (report.fastestHost) {
        std::cout << "Best host:  " << report.fastestHost->host << " ("
                  << formatMs(report.fastestHost->roundTripMs) << ")\n";
    }
    std::cout << "\nRecommendations:\n";
    for (const auto& line : report.recommendations) {
        std::cout << "  " << line << "\n";
    }
}

int runHealth(NetworkMonitor& monitor, const CommandLine& cli, bool useTable) {
    HealthSnapshot current;
    for (int i = 0; i < cli.count; ++i) {
        if (i > 0) {
            std::this_thread::sleep_for(cli.interval);
        }
        current = monitor.health().sampleOnce();
        if (useTable && cli.count > 1) {
            std::cout << "Sample " << (i + 1) << "/" << cli.count << ": score " << current.score << "\n";
        }
    }

    std::vector<HealthSnapshot> history = monitor.getHealthHistory(cli.historyLimit);
    HealthStatistics stats = monitor.getHealthStatistics(cli.historyLimit);
    if (useTable) {
        printHealthAsTable(current, history, stats);
    } else {
        printHealthAsJson(current, history, stats);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CommandLine cli;
    try {
        cli = parseArguments(argc, argv);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printHelp(argv[0]);
        return kExitConfiguration;
    }

    if (cli.showHelp) {
        printHelp(argv[0]);
        return 0;
    }
    setLogLevel(cli.config.logLevel);
    bool useTable = cli.format == OutputFormat::Table;

    try {
        NetworkMonitor monitor(cli.config);

        switch (cli.command) {
            case Command::Devices: {
                if (useTable) {
                    std::cout << "Scanning for devices...\n\n";
                }
                DiscoveryResult result = monitor.discoverDevices(cli.range);
                if (useTable) {
                    printDevicesAsTable(result);
                } else {
                    printDevicesAsJson(result);
                }
                return 0;
            }
            case Command::Wifi: {
                if (useTable) {
                    std::cout << "Scanning for WiFi networks...\n\n";
                }
                WirelessScanResult result = monitor.scanWirelessNetworks();
                if (!result.available()) {
                    std::cerr << "Error: wireless scanning unavailable: " << result.message << "\n";
                    if (!useTable) {
                        std::cout << result.toJson() << "\n";
                    }
                    return kExitWirelessUnavailable;
                }
                if (useTable) {
                    printNetworksAsTable(result);
                } else {
                    std::cout << result.toJson() << "\n";
                }
                return 0;
            }
            case Command::Health:
                return runHealth(monitor, cli, useTable);
            case Command::Diagnose: {
                DiagnosisReport report = monitor.diagnose();
                if (useTable) {
                    printDiagnosisAsTable(report);
                } else {
                    std::cout << report.toJson() << "\n";
                }
                return 0;
            }
        }
        return 0;

    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitConfiguration;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
