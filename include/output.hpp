#pragma once
/**
 * @file output.hpp
 * @brief Packet and event rendering shared by blesniff and blesniff-decode.
 *
 * Formats:
 *   pretty  describe() line, status appended when not ok, ANSI on a TTY
 *   json    one compact JSON object per line (nlohmann::json)
 *   raw     lowercase hex of the unescaped frame (or of the input bytes)
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "blesniff/ble_packet.hpp"
#include "blesniff/ad_field.hpp"

namespace blesniff {

enum class OutputFormat : uint8_t { pretty, json, raw };

/// Map "pretty"/"json"/"raw"; false for anything else.
bool parse_format(const std::string& s, OutputFormat& out);

// nlohmann ADL hooks. Empty optionals become null.
void to_json(nlohmann::json& j, const ManufacturerData& m);
void to_json(nlohmann::json& j, const RawField& r);
void to_json(nlohmann::json& j, const SnifferHeader& h);
void to_json(nlohmann::json& j, const BlePacket& p);

struct Ansi {
  bool enabled{false};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

/**
 * @brief Parse hex text into bytes.
 *
 * Accepts "020106", "02 01 06", "02:01:06" and a leading "0x". Whitespace, ':'
 * and '-' separate nothing and are skipped.
 *
 * @return false on a non-hex character or an odd digit count.
 */
bool from_hex(const std::string& s, std::vector<uint8_t>& out);

/// True if stdout is a terminal.
bool is_tty_stdout();

/**
 * @brief Render one packet.
 *
 * @param frame,n  bytes the packet was decoded from; used by the raw format only
 */
std::string format_packet(const BlePacket& pkt, DecodeStatus st,
                          const uint8_t* frame, size_t n,
                          OutputFormat fmt, const Ansi& ansi);

} // namespace blesniff
