#pragma once
/**
 * @page bs-settings blesniff Runtime Settings
 * @file settings.hpp
 * @brief Process-wide capture settings: JSON file, command line, installed once.
 *
 * @details
 * SOURCES (later wins)
 * --------------------
 *   1) built-in defaults (this struct)
 *   2) config file: --config <path>, else $XDG_CONFIG_HOME/blesniff/config.json if present
 *   3) command-line options
 *
 * The CLI fills a Settings value from 1..3 and calls install_settings() once before
 * starting any capture thread. After that, settings() is read-only from every thread.
 *
 * FILE FORMAT
 * -----------
 * @code
 *   {
 *     "dev": "/dev/serial/by-id/usb-SEGGER_J-Link_000683xxxxxx-if00",
 *     "baud": 460800,
 *     "boot_delay_ms": 400,
 *     "read_timeout_ms": 200,
 *     "max_frame": 261,
 *     "scan_rsp": true,
 *     "aux": false,
 *     "coded": false,
 *     "format": "json"
 *   }
 * @endcode
 * Unknown keys are ignored. A known key with the wrong JSON type fails the load with
 * reason "bad_config:<key>", as does an integer outside its range: negative or above
 * INT_MAX, or for max_frame outside 6..261.
 */

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace blesniff {

struct Settings {
    std::string dev;                     // empty: pick the single online sniffer
    int         baud            = 460800;
    int         boot_delay_ms   = 400;
    int         read_timeout_ms = 200;
    size_t      max_frame       = 261;
    bool        scan_rsp        = false;
    bool        aux             = false;
    bool        coded           = false;
    std::string format          = "pretty";   // pretty|json|raw
    bool        verbose         = false;
    bool        stats           = false;
    bool        color           = true;
};

/// True for "pretty", "json" and "raw".
bool valid_format(const std::string& f);

/**
 * @brief Merge the keys present in @p j into @p s.
 *
 * @return false with @p err = "bad_config:<key>" (or "bad_config:not_object") on a type error.
 */
bool apply_config(const nlohmann::json& j, Settings& s, std::string& err);

/**
 * @brief Read @p path and apply_config() it.
 *
 * @return false with @p err = "config_open" / "config_parse" / "bad_config:<key>".
 */
bool load_config_file(const std::string& path, Settings& s, std::string& err);

/// $XDG_CONFIG_HOME/blesniff/config.json (or ~/.config/blesniff/config.json).
std::string default_config_path();

/**
 * @brief Install @p s as the process-wide settings.
 *
 * @return false if settings were already installed (the first value stays).
 */
bool install_settings(const Settings& s);

/// Installed settings, or the defaults if nothing was installed yet.
const Settings& settings();

} // namespace blesniff
