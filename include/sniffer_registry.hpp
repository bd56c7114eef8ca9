#pragma once
/**
 * @page bs-sniffer-registry blesniff Sniffer Registry
 * @file sniffer_registry.hpp
 * @brief Find nRF sniffer boards attached over USB and remember where they are.
 *
 * @details
 * PURPOSE
 * -------
 * A sniffer dongle enumerates as an ordinary tty, next to every other USB-serial
 * gadget on the bench. This layer finds the ones actually running sniffer firmware,
 * records the firmware version they report, and saves the roster as JSON so scripts
 * can pick a device without guessing at /dev/ttyACM numbers.
 *
 * WHAT THIS DOES
 * --------------
 * - Scans /dev/serial/by-id (stable across reboots), falling back to /dev/ttyACM*
 *   and /dev/ttyUSB* when that directory does not exist.
 * - Probes each candidate: open at the given baud, send REQ_VERSION, read frames
 *   until a RESP_VERSION arrives or the timeout runs out.
 * - save_registry() writes sniffers.json under $XDG_CONFIG_HOME/blesniff/
 *   (fallback ~/.config/blesniff/).
 *
 * RELIABILITY AND TRADE-OFFS
 * --------------------------
 * - No libudev; filesystem inspection and glob(3) only.
 * - Probing costs up to probe timeout per device. Firmware older than 3.x does not
 *   answer REQ_VERSION and shows up with online=false.
 *
 * EXAMPLE
 * -------
 * @code
 *   auto found = blesniff::discover_sniffers(blesniff::DEFAULT_BAUD);
 *   for (const auto& s : found)
 *       if (s.online) std::cout << s.dev_path << " fw=" << s.version << "\n";
 *   blesniff::save_registry(found);
 * @endcode
 */

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace blesniff {

/// One probed device.
struct SnifferInfo {
    std::string dev_path;   ///< canonical device path, e.g. "/dev/ttyACM0"
    std::string by_id;      ///< /dev/serial/by-id link name, empty if not found there
    std::string version;    ///< firmware version from RESP_VERSION, empty if silent
    bool online = false;    ///< answered the probe
};

void to_json(nlohmann::json& j, const SnifferInfo& s);
void from_json(const nlohmann::json& j, SnifferInfo& s);

/**
 * @brief Ask one device for its firmware version.
 *
 * @return version string; empty if the device could not be opened, did not answer
 *         within @p timeout_ms, or answered something else.
 */
std::string probe_version(const std::string& dev_path, int baud, int timeout_ms = 1200);

/**
 * @brief Scan and probe every candidate tty.
 *
 * An empty result means no candidate tty exists, not that something failed.
 */
std::vector<SnifferInfo> discover_sniffers(int baud, int timeout_ms = 1200);

/// Directory used for registry and config files ($XDG_CONFIG_HOME/blesniff or ~/.config/blesniff).
std::string config_dir();

/**
 * @brief Write @p list to @p path, or to config_dir()/sniffers.json if @p path is empty.
 *
 * @return false if the directory or the file cannot be written.
 */
bool save_registry(const std::vector<SnifferInfo>& list, const std::string& path = {});

/**
 * @brief Read a registry written by save_registry().
 *
 * @return false if the file is missing or not a JSON array of sniffer records.
 */
bool load_registry(const std::string& path, std::vector<SnifferInfo>& out);

} // namespace blesniff
