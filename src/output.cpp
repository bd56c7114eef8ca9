// ============================================================================
// output.cpp — implementation for output.hpp
// ============================================================================

#include "output.hpp"

#include <cstdio>       // fileno
#include <optional>
#include <unistd.h>     // isatty

using json = nlohmann::json;

namespace blesniff {

bool parse_format(const std::string& s, OutputFormat& out) {
    if (s == "pretty") { out = OutputFormat::pretty; return true; }
    if (s == "json")   { out = OutputFormat::json;   return true; }
    if (s == "raw")    { out = OutputFormat::raw;    return true; }
    return false;
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool from_hex(const std::string& s, std::vector<uint8_t>& out) {
    out.clear();
    size_t i = 0;
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) i = 2;

    int hi = -1;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ':' || c == '-') continue;
        const int d = hex_digit(c);
        if (d < 0) return false;
        if (hi < 0) { hi = d; continue; }
        out.push_back(static_cast<uint8_t>((hi << 4) | d));
        hi = -1;
    }
    return hi < 0;   // odd digit count leaves a half byte
}

bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

void to_json(json& j, const ManufacturerData& m) {
    j = json{{"company_id", m.company_id}, {"data", to_hex(m.data)}};
}

void to_json(json& j, const RawField& r) {
    j = json{{"type", r.type}, {"value", to_hex(r.value)}};
}

void to_json(json& j, const SnifferHeader& h) {
    j = json{
        {"protocol_version", h.protocol_version},
        {"packet_counter",   h.packet_counter},
        {"crc_ok",           h.crc_ok},
        {"phy",              h.phy},
        {"aux_type",         h.aux_type},
        {"address_resolved", h.address_resolved},
        {"event_counter",    h.event_counter},
        {"timestamp_us",     h.timestamp_us},
        {"access_address",   h.access_address},
        {"pdu_type",         h.pdu_type},
        {"channel_select",   h.channel_select},
        {"tx_addr_random",   h.tx_addr_random},
        {"rx_addr_random",   h.rx_addr_random}
    };
}

// Optional -> value or null
template <typename T>
static json opt(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

void to_json(json& j, const BlePacket& p) {
    j = json::object();
    j["mac"]             = mac_to_string(p.mac);
    j["rssi"]            = opt(p.rssi);
    j["channel"]         = opt(p.channel);
    j["flags"]           = opt(p.flags);
    j["tx_power"]        = opt(p.tx_power);
    j["local_name"]      = opt(p.local_name);
    j["manufacturer_id"] = opt(p.manufacturer_id);
    j["manufacturer_data"] = p.manufacturer_data ? json(to_hex(*p.manufacturer_data))
                                                 : json(nullptr);
    j["manufacturers"]   = p.manufacturers;
    j["raw_fields"]      = p.raw_fields;
    j["ad_types"]        = p.ad_types;
    j["peer_mac"]        = p.peer_mac ? json(mac_to_string(*p.peer_mac)) : json(nullptr);
    j["sniffer"]         = opt(p.sniffer);
}

std::string format_packet(const BlePacket& pkt, DecodeStatus st,
                          const uint8_t* frame, size_t n,
                          OutputFormat fmt, const Ansi& ansi) {
    switch (fmt) {
        case OutputFormat::json: {
            json j = pkt;
            j["status"] = to_string(st);
            return j.dump();
        }
        case OutputFormat::raw:
            return to_hex(frame, n);
        case OutputFormat::pretty:
            break;
    }

    std::string line = describe(pkt);
    if (ansi.enabled) {
        // highlight the address token only
        const std::string mac = mac_to_string(pkt.mac);
        const auto pos = line.find(mac);
        if (pos != std::string::npos) line.replace(pos, mac.size(), ansi.bold(mac));
    }
    if (st != DecodeStatus::ok)
        line += " " + ansi.red(std::string("status=") + to_string(st));
    return line;
}

} // namespace blesniff
