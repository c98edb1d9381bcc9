#include "netwatch/wireless_parsers.hpp"

#include "netwatch/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <sstream>

namespace netwatch {

namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool parse_int(const std::string& text, int& value) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return false;
    char* end = nullptr;
    long parsed = std::strtol(trimmed.c_str(), &end, 10);
    if (end == trimmed.c_str() || *end != '\0') return false;
    value = static_cast<int>(parsed);
    return true;
}

// Leading integer of e.g. "36,+1" or "-40 dBm".
bool parse_leading_int(const std::string& text, int& value) {
    std::string trimmed = trim(text);
    char* end = nullptr;
    long parsed = std::strtol(trimmed.c_str(), &end, 10);
    if (end == trimmed.c_str()) return false;
    value = static_cast<int>(parsed);
    return true;
}

bool is_mac_address(const std::string& text) {
    if (text.size() != 17) return false;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i % 3 == 2) {
            if (text[i] != ':' && text[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

int clamp_percent(int value) {
    return std::min(100, std::max(0, value));
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// nmcli terse mode separates fields with ':' and escapes literal ':' and '\'.
std::vector<std::string> split_terse(const std::string& line) {
    std::vector<std::string> fields(1);
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            fields.back() += line[++i];
        } else if (c == ':') {
            fields.emplace_back();
        } else {
            fields.back() += c;
        }
    }
    return fields;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

Security parseSecurity(const std::string& text) {
    std::string upper = to_upper(trim(text));
    if (upper.empty() || upper == "--" || upper == "NONE" || upper == "OPEN" ||
        starts_with(upper, "ABERTA")) {
        return Security::Open;
    }
    if (contains(upper, "WPA3") || contains(upper, "SAE")) return Security::WPA3;
    if (contains(upper, "WPA2") || contains(upper, "RSN")) return Security::WPA2;
    if (contains(upper, "WPA")) return Security::WPA;
    if (contains(upper, "WEP")) return Security::WEP;
    return Security::Unknown;
}

std::vector<std::string> NmcliParser::command() const {
    return {"nmcli", "-t", "-f", "SSID,BSSID,CHAN,SIGNAL,SECURITY", "dev", "wifi"};
}

std::vector<WirelessNetwork> NmcliParser::parse(const std::string& rawOutput) const {
    std::vector<WirelessNetwork> networks;

    for (const auto& line : split_lines(rawOutput)) {
        if (trim(line).empty()) {
            continue;
        }
        std::vector<std::string> fields = split_terse(line);
        if (fields.size() < 4) {
            NETWATCH_LOG_DEBUG("wireless", "nmcli: skipping malformed line '" << line << "'");
            continue;
        }

        WirelessNetwork network;
        network.ssid = trim(fields[0]);
        network.bssid = trim(fields[1]);
        if (network.ssid.empty() || network.ssid == "--") {
            continue;   // hidden network
        }
        int signal = 0;
        if (!is_mac_address(network.bssid) || !parse_int(fields[3], signal)) {
            NETWATCH_LOG_DEBUG("wireless", "nmcli: skipping malformed line '" << line << "'");
            continue;
        }
        network.signalPercent = clamp_percent(signal);
        network.rssiDbm = dbmFromPercent(network.signalPercent);
        if (!parse_int(fields[2], network.channel)) {
            network.channel = 0;
        }
        network.security = fields.size() > 4 ? parseSecurity(fields[4]) : Security::Unknown;
        networks.push_back(network);
    }
    return networks;
}

std::vector<std::string> IwlistParser::command() const {
    return {"iwlist", "scanning"};
}

std::vector<WirelessNetwork> IwlistParser::parse(const std::string& rawOutput) const {
    std::vector<WirelessNetwork> networks;

    struct Cell {
        WirelessNetwork network;
        bool hasSignal = false;
        bool hasEncryptionFlag = false;
        bool encrypted = false;
        bool wpa = false;
        bool wpa2 = false;
        bool wpa3 = false;
    };
    std::unique_ptr<Cell> cell;

    auto flush = [&]() {
        if (!cell) return;
        if (!cell->hasSignal || !is_mac_address(cell->network.bssid)) {
            NETWATCH_LOG_DEBUG("wireless", "iwlist: skipping incomplete cell " << cell->network.bssid);
        } else if (!cell->network.ssid.empty()) {
            if (cell->wpa3) {
                cell->network.security = Security::WPA3;
            } else if (cell->wpa2) {
                cell->network.security = Security::WPA2;
            } else if (cell->wpa) {
                cell->network.security = Security::WPA;
            } else if (cell->hasEncryptionFlag) {
                cell->network.security = cell->encrypted ? Security::WEP : Security::Open;
            }
            networks.push_back(cell->network);
        }
        cell.reset();
    };

    for (const auto& raw : split_lines(rawOutput)) {
        std::string line = trim(raw);

        size_t address = line.find("Address:");
        if (starts_with(line, "Cell ") && address != std::string::npos) {
            flush();
            cell = std::make_unique<Cell>();
            cell->network.bssid = trim(line.substr(address + 8));
            continue;
        }
        if (!cell) {
            continue;
        }

        if (starts_with(line, "ESSID:")) {
            std::string essid = trim(line.substr(6));
            if (essid.size() >= 2 && essid.front() == '"' && essid.back() == '"') {
                essid = essid.substr(1, essid.size() - 2);
            }
            cell->network.ssid = essid;
        } else if (contains(line, "Signal level=")) {
            std::string level = line.substr(line.find("Signal level=") + 13);
            int value = 0;
            if (!parse_leading_int(level, value)) {
                continue;
            }
            cell->hasSignal = true;
            size_t slash = level.find('/');
            if (slash != std::string::npos && !contains(level, "dBm")) {
                int scale = 100;
                if (parse_leading_int(level.substr(slash + 1), scale) && scale > 0) {
                    cell->network.signalPercent = clamp_percent(value * 100 / scale);
                }
                cell->network.rssiDbm = dbmFromPercent(cell->network.signalPercent);
            } else {
                cell->network.rssiDbm = value;
                cell->network.signalPercent = percentFromDbm(value);
            }
        } else if (starts_with(line, "Channel:")) {
            parse_int(line.substr(8), cell->network.channel);
        } else if (starts_with(line, "Frequency:")) {
            size_t channel = line.find("(Channel ");
            if (channel != std::string::npos && cell->network.channel == 0) {
                parse_leading_int(line.substr(channel + 9), cell->network.channel);
            }
            double ghz = std::atof(line.substr(10).c_str());
            if (ghz > 0) {
                cell->network.frequencyMhz = static_cast<uint32_t>(ghz * 1000 + 0.5);
            }
        } else if (starts_with(line, "Encryption key:")) {
            cell->hasEncryptionFlag = true;
            cell->encrypted = trim(line.substr(15)) == "on";
        } else if (starts_with(line, "IE:")) {
            std::string upper = to_upper(line);
            if (contains(upper, "SAE") || contains(upper, "WPA3")) {
                cell->wpa3 = true;
            } else if (contains(upper, "WPA2") || contains(upper, "802.11I")) {
                cell->wpa2 = true;
            } else if (contains(upper, "WPA")) {
                cell->wpa = true;
            }
        } else if (starts_with(line, "Authentication Suites") && contains(to_upper(line), "SAE")) {
            cell->wpa3 = true;
        }
    }
    flush();
    return networks;
}

std::vector<std::string> AirportParser::command() const {
    return {"/System/Library/PrivateFrameworks/Apple80211.framework/Versions/Current/Resources/airport", "-s"};
}

std::vector<WirelessNetwork> AirportParser::parse(const std::string& rawOutput) const {
    std::vector<WirelessNetwork> networks;

    for (const auto& line : split_lines(rawOutput)) {
        std::istringstream stream(line);
        std::vector<std::string> tokens;
        std::string token;
        while (stream >> token) {
            tokens.push_back(token);
        }

        // SSIDs may contain spaces, so anchor on the BSSID column.
        size_t bssid_index = tokens.size();
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (is_mac_address(tokens[i])) {
                bssid_index = i;
                break;
            }
        }
        if (bssid_index == tokens.size()) {
            continue;   // header or garbage
        }

        int rssi = 0;
        if (bssid_index == 0 || bssid_index + 1 >= tokens.size() ||
            !parse_int(tokens[bssid_index + 1], rssi)) {
            NETWATCH_LOG_DEBUG("wireless", "airport: skipping malformed line '" << line << "'");
            continue;
        }

        WirelessNetwork network;
        size_t ssid_end = line.find(tokens[bssid_index]);
        network.ssid = trim(line.substr(0, ssid_end));
        network.bssid = tokens[bssid_index];
        network.rssiDbm = rssi;
        network.signalPercent = percentFromDbm(rssi);
        if (bssid_index + 2 < tokens.size()) {
            parse_leading_int(tokens[bssid_index + 2], network.channel);
        }
        if (bssid_index + 5 < tokens.size()) {
            std::string security;
            for (size_t i = bssid_index + 5; i < tokens.size(); ++i) {
                if (!security.empty()) security += " ";
                security += tokens[i];
            }
            network.security = parseSecurity(security);
        }
        networks.push_back(network);
    }
    return networks;
}

std::vector<std::string> NetshParser::command() const {
    return {"netsh", "wlan", "show", "networks", "mode=bssid"};
}

std::vector<WirelessNetwork> NetshParser::parse(const std::string& rawOutput) const {
    std::vector<WirelessNetwork> networks;

    std::string ssid;
    Security security = Security::Unknown;
    std::unique_ptr<WirelessNetwork> current;
    bool has_signal = false;

    auto flush = [&]() {
        if (!current) return;
        if (has_signal && is_mac_address(current->bssid) && !current->ssid.empty()) {
            networks.push_back(*current);
        } else {
            NETWATCH_LOG_DEBUG("wireless", "netsh: skipping incomplete BSSID block " << current->bssid);
        }
        current.reset();
        has_signal = false;
    };

    for (const auto& raw : split_lines(rawOutput)) {
        size_t colon = raw.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = trim(raw.substr(0, colon));
        std::string value = trim(raw.substr(colon + 1));

        if (starts_with(key, "BSSID")) {
            flush();
            current = std::make_unique<WirelessNetwork>();
            current->ssid = ssid;
            current->bssid = value;
            current->security = security;
        } else if (starts_with(key, "SSID")) {
            flush();
            ssid = value;
            security = Security::Unknown;
        } else if (starts_with(key, "Authentication") || starts_with(key, "Autentica")) {
            security = parseSecurity(value);
            if (current) current->security = security;
        } else if (current && (starts_with(key, "Signal") || starts_with(key, "Sinal"))) {
            int percent = 0;
            if (parse_leading_int(value, percent)) {
                current->signalPercent = clamp_percent(percent);
                current->rssiDbm = dbmFromPercent(current->signalPercent);
                has_signal = true;
            }
        } else if (current && (starts_with(key, "Channel") || starts_with(key, "Canal"))) {
            parse_leading_int(value, current->channel);
        }
    }
    flush();
    return networks;
}

std::vector<std::unique_ptr<WirelessOutputParser>> makePlatformParsers() {
    std::vector<std::unique_ptr<WirelessOutputParser>> parsers;
#if defined(_WIN32)
    parsers.push_back(std::make_unique<NetshParser>());
#elif defined(__APPLE__)
    parsers.push_back(std::make_unique<AirportParser>());
#else
    parsers.push_back(std::make_unique<NmcliParser>());
    parsers.push_back(std::make_unique<IwlistParser>());
#endif
    return parsers;
}

} // namespace netwatch
