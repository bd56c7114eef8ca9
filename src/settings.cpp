// ============================================================================
// settings.cpp — implementation for settings.hpp
// ============================================================================

#include "settings.hpp"
#include "sniffer_registry.hpp"   // config_dir()

#include "blesniff/sniffer_protocol.hpp"   // HEADER_LENGTH, MAX_FRAME_LEN

#include <climits>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace blesniff {

bool valid_format(const std::string& f) {
    return f == "pretty" || f == "json" || f == "raw";
}

// ---------------------------------------------------------------------------
// Per-type readers. Absent key: leave the field alone.
// ---------------------------------------------------------------------------
static bool read_string(const json& j, const char* key, std::string& dst, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) { err = std::string("bad_config:") + key; return false; }
    dst = it->get<std::string>();
    return true;
}

// Integer keys must lie in [lo, hi]; the default bound is [0, INT_MAX].
static bool read_int(const json& j, const char* key, int& dst, std::string& err,
                     long long lo = 0, long long hi = INT_MAX) {
    auto it = j.find(key);
    if (it == j.end()) return true;

    bool in_range = false;
    if (it->is_number_unsigned()) {
        const unsigned long long v = it->get<unsigned long long>();
        in_range = v <= static_cast<unsigned long long>(hi) && static_cast<long long>(v) >= lo;
    } else if (it->is_number_integer()) {
        const long long v = it->get<long long>();
        in_range = v >= lo && v <= hi;
    }
    if (!in_range) { err = std::string("bad_config:") + key; return false; }
    dst = static_cast<int>(it->get<long long>());
    return true;
}

static bool read_bool(const json& j, const char* key, bool& dst, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_boolean()) { err = std::string("bad_config:") + key; return false; }
    dst = it->get<bool>();
    return true;
}

bool apply_config(const json& j, Settings& s, std::string& err) {
    if (!j.is_object()) { err = "bad_config:not_object"; return false; }

    int max_frame = static_cast<int>(s.max_frame);
    if (!read_string(j, "dev", s.dev, err))                    return false;
    if (!read_int   (j, "baud", s.baud, err))                  return false;
    if (!read_int   (j, "boot_delay_ms", s.boot_delay_ms, err))     return false;
    if (!read_int   (j, "read_timeout_ms", s.read_timeout_ms, err)) return false;
    if (!read_int   (j, "max_frame", max_frame, err,
                     HEADER_LENGTH, static_cast<long long>(MAX_FRAME_LEN)))  return false;
    if (!read_bool  (j, "scan_rsp", s.scan_rsp, err))          return false;
    if (!read_bool  (j, "aux", s.aux, err))                    return false;
    if (!read_bool  (j, "coded", s.coded, err))                return false;
    if (!read_string(j, "format", s.format, err))              return false;

    if (!valid_format(s.format)) { err = "bad_config:format"; return false; }
    s.max_frame = static_cast<size_t>(max_frame);
    return true;
}

bool load_config_file(const std::string& path, Settings& s, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "config_open"; return false; }

    json j = json::parse(in, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded()) { err = "config_parse"; return false; }
    return apply_config(j, s, err);
}

std::string default_config_path() {
    return (fs::path(config_dir()) / "config.json").string();
}

// ---------------------------------------------------------------------------
// Process-wide instance. Written once under call_once, read-only afterwards.
// ---------------------------------------------------------------------------
namespace {
std::once_flag g_once;
Settings       g_settings;
}

bool install_settings(const Settings& s) {
    bool installed = false;
    std::call_once(g_once, [&] {
        g_settings = s;
        installed = true;
    });
    return installed;
}

const Settings& settings() {
    return g_settings;
}

} // namespace blesniff
