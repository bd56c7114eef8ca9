// ============================================================================
// sniffer_registry.cpp — implementation for sniffer_registry.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file sniffer_registry.cpp
 */

#include "sniffer_registry.hpp"       // SnifferInfo, discover/save/load
#include "commands.hpp"               // make_req_version(), parse_version()
#include "serial_io.hpp"              // open_serial(), write_bytes(), read_chunk(), close_serial()
#include "blesniff/reassembler.hpp"   // frames out of the probe replies

#include <filesystem>         // walk /dev/serial/by-id, create config dir
#include <fstream>            // read/write sniffers.json
#include <iostream>           // std::cerr diagnostics
#include <chrono>             // probe deadline
#include <glob.h>             // glob(3) fallback for /dev/ttyACM*, /dev/ttyUSB*
#include <system_error>       // std::error_code for non-throwing filesystem ops
#include <cstdlib>            // getenv for XDG/HOME lookups

namespace fs = std::filesystem;
namespace blesniff {

// ---------------------------------------------------------------------------
// Probe-time constants.
// PROBE_BOOT_MS: time to let a port settle after open (CDC boards may reset).
// ---------------------------------------------------------------------------
static constexpr int PROBE_BOOT_MS = 400;

// -------- json --------

void to_json(nlohmann::json& j, const SnifferInfo& s) {
    j = nlohmann::json{
        {"dev_path", s.dev_path},
        {"by_id",    s.by_id},
        {"version",  s.version},
        {"online",   s.online}
    };
}

void from_json(const nlohmann::json& j, SnifferInfo& s) {
    j.at("dev_path").get_to(s.dev_path);
    s.by_id   = j.value("by_id", std::string{});
    s.version = j.value("version", std::string{});
    s.online  = j.value("online", false);
}

// -------- helpers --------

/*
 * append_glob()
 * -------------
 * Append results of a glob() pattern; always globfree().
 */
static void append_glob(std::vector<SnifferInfo>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i) {
            SnifferInfo s;
            s.dev_path = g.gl_pathv[i];
            out.push_back(s);
        }
    }
    globfree(&g);
}

std::string config_dir() {
    if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x)
        return (fs::path(x) / "blesniff").string();
    const char* home = std::getenv("HOME");
    return (fs::path(home ? home : "") / ".config" / "blesniff").string();
}

// -------- public API --------

/*
 * probe_version()
 * ---------------
 * Phases:
 *   1) open port (with boot delay),
 *   2) write REQ_VERSION,
 *   3) read and reassemble until RESP_VERSION or deadline,
 *   4) close port.
 * The sniffer may already be streaming advertisements; those frames are skipped.
 */
std::string probe_version(const std::string& dev_path, int baud, int timeout_ms) {
    std::string err;
    int fd = open_serial(dev_path, baud, PROBE_BOOT_MS, err);
    if (fd < 0) return {};                                 // not ours, or no permission

    std::string version;
    if (write_bytes(fd, make_req_version(1))) {
        FrameReassembler rs;
        uint8_t buf[256];
        const auto deadline = std::chrono::steady_clock::now()
                            + std::chrono::milliseconds(timeout_ms);

        bool done = false;
        while (!done && std::chrono::steady_clock::now() < deadline) {
            size_t got = 0;
            const ReadStatus rd = read_chunk(fd, buf, sizeof(buf), 100, got, err);
            if (rd == ReadStatus::error || rd == ReadStatus::end_of_stream) break;
            if (rd != ReadStatus::ok) continue;

            const FeedResult step = rs.feed(buf, got);
            for (const auto& frame : step.frames) {
                if (parse_version(frame, version)) { done = true; break; }
            }
        }
    }

    close_serial(fd);
    return version;
}


/*
 * discover_sniffers()
 * -------------------
 * Prefer /dev/serial/by-id symlinks; fall back to globbing tty names.
 * Never throws; unreadable entries are skipped.
 */
std::vector<SnifferInfo> discover_sniffers(int baud, int timeout_ms) {
    std::vector<SnifferInfo> candidates;

    std::error_code ec;
    const fs::path by_id("/dev/serial/by-id");
    if (fs::exists(by_id, ec)) {
        for (const auto& e : fs::directory_iterator(by_id, ec)) {
            if (!e.is_symlink(ec)) continue;
            auto canon = fs::canonical(e.path(), ec);
            if (ec) continue;
            SnifferInfo s;
            s.dev_path = canon.string();
            s.by_id    = e.path().filename().string();
            candidates.push_back(s);
        }
    } else {
        append_glob(candidates, "/dev/ttyACM*");
        append_glob(candidates, "/dev/ttyUSB*");
    }

    for (auto& s : candidates) {
        s.version = probe_version(s.dev_path, baud, timeout_ms);
        s.online  = !s.version.empty();
    }
    return candidates;
}


bool save_registry(const std::vector<SnifferInfo>& list, const std::string& path) {
    fs::path file = path.empty() ? fs::path(config_dir()) / "sniffers.json" : fs::path(path);

    std::error_code ec;
    if (file.has_parent_path()) fs::create_directories(file.parent_path(), ec);
    if (ec) {
        std::cerr << "status=error reason=config_dir detail=\"" << ec.message() << "\"\n";
        return false;
    }

    std::ofstream ofs(file);
    if (!ofs) {
        std::cerr << "status=error reason=registry_write path=" << file.string() << "\n";
        return false;
    }
    ofs << nlohmann::json(list).dump(2) << "\n";
    return static_cast<bool>(ofs);
}


bool load_registry(const std::string& path, std::vector<SnifferInfo>& out) {
    std::ifstream ifs(path);
    if (!ifs) return false;

    auto j = nlohmann::json::parse(ifs, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded() || !j.is_array()) return false;

    out.clear();
    try {
        for (const auto& e : j) {
            if (!e.is_object()) return false;
            out.push_back(e.get<SnifferInfo>());
        }
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "status=error reason=registry_format detail=\"" << ex.what() << "\"\n";
        out.clear();
        return false;
    }
    return true;
}

} // namespace blesniff
