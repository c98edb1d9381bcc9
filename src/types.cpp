#include "netwatch/types.hpp"

#include <arpa/inet.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace netwatch {

std::optional<Ipv4Address> Ipv4Address::parse(const std::string& text) {
    struct in_addr addr;
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return Ipv4Address(ntohl(addr.s_addr));
}

std::string Ipv4Address::toString() const {
    std::ostringstream oss;
    oss << ((value_ >> 24) & 0xff) << "."
        << ((value_ >> 16) & 0xff) << "."
        << ((value_ >> 8) & 0xff) << "."
        << (value_ & 0xff);
    return oss.str();
}

const char* toString(Security security) {
    switch (security) {
        case Security::Open: return "Open";
        case Security::WEP: return "WEP";
        case Security::WPA: return "WPA";
        case Security::WPA2: return "WPA2";
        case Security::WPA3: return "WPA3";
        case Security::Unknown: break;
    }
    return "Unknown";
}

const char* toString(HealthCategory category) {
    switch (category) {
        case HealthCategory::Excellent: return "Excellent";
        case HealthCategory::Good: return "Good";
        case HealthCategory::Fair: return "Fair";
        case HealthCategory::Poor: break;
    }
    return "Poor";
}

std::string escapeJson(const std::string& text) {
    std::ostringstream oss;
    for (char c : text) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string formatTimestamp(const Timestamp& timestamp) {
    std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    struct tm local;
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

std::string Device::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"ip\":\"" << address.toString() << "\",";
    if (physicalAddress) {
        json << "\"mac\":\"" << escapeJson(*physicalAddress) << "\",";
    } else {
        json << "\"mac\":null,";
    }
    if (hostname) {
        json << "\"hostname\":\"" << escapeJson(*hostname) << "\",";
    } else {
        json << "\"hostname\":null,";
    }
    json << "\"reachable\":" << (reachable ? "true" : "false") << ",";
    json << "\"last_seen\":\"" << formatTimestamp(lastSeen) << "\"";
    json << "}";
    return json.str();
}

std::string WirelessNetwork::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"ssid\":\"" << escapeJson(ssid) << "\",";
    json << "\"bssid\":\"" << escapeJson(bssid) << "\",";
    json << "\"signal_percent\":" << signalPercent << ",";
    if (rssiDbm) {
        json << "\"signal_dbm\":" << *rssiDbm << ",";
    }
    if (frequencyMhz) {
        json << "\"frequency\":" << *frequencyMhz << ",";
    }
    json << "\"channel\":" << channel << ",";
    json << "\"security\":\"" << toString(security) << "\"";
    json << "}";
    return json.str();
}

std::string HealthSnapshot::toJson() const {
    std::ostringstream json;
    json << std::fixed << std::setprecision(2);
    json << "{";
    json << "\"timestamp\":\"" << formatTimestamp(timestamp) << "\",";
    json << "\"score\":" << score << ",";
    json << "\"category\":\"" << toString(category) << "\",";
    if (latencyMs) {
        json << "\"latency_ms\":" << *latencyMs << ",";
    } else {
        json << "\"latency_ms\":null,";
    }
    if (sampleRoundTripMs) {
        json << "\"sample_rtt_ms\":" << *sampleRoundTripMs << ",";
    } else {
        json << "\"sample_rtt_ms\":null,";
    }
    json << "\"packet_loss_percent\":" << packetLossPercent << ",";
    json << "\"jitter_ms\":" << jitterMs << ",";
    json << "\"uptime_percent\":" << uptimePercent << ",";
    json << "\"samples\":{\"successful\":" << successfulSamples
         << ",\"attempted\":" << attemptedSamples << "},";
    json << "\"alerts\":[";
    for (size_t i = 0; i < alerts.size(); ++i) {
        if (i > 0) json << ",";
        json << "\"" << escapeJson(alerts[i]) << "\"";
    }
    json << "]";
    json << "}";
    return json.str();
}

int percentFromDbm(int dbm) {
    if (dbm <= -100) return 0;
    if (dbm >= -50) return 100;
    return 2 * (dbm + 100);
}

int dbmFromPercent(int percent) {
    if (percent <= 0) return -100;
    if (percent >= 100) return -50;
    return percent / 2 - 100;
}

int channelFromFrequency(uint32_t frequencyMhz) {
    if (frequencyMhz == 2484) return 14;
    if (frequencyMhz >= 2412 && frequencyMhz < 2484) {
        return static_cast<int>((frequencyMhz - 2407) / 5);
    }
    if (frequencyMhz >= 5955 && frequencyMhz <= 7115) {
        return static_cast<int>((frequencyMhz - 5950) / 5);
    }
    if (frequencyMhz >= 5000 && frequencyMhz < 5955) {
        return static_cast<int>((frequencyMhz - 5000) / 5);
    }
    return 0;
}

} // namespace netwatch
