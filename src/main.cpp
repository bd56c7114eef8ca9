#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <CLI/CLI.hpp>

#include "blesniff/stream.hpp"     // run_stream(), CallbackSink
#include "blesniff/version.hpp"    // BLESNIFF_VERSION
#include "commands.hpp"            // make_scan_request(), make_temporary_key(), describe_event()
#include "serial_io.hpp"           // open_serial(), write_bytes()
#include "serial_source.hpp"       // SerialByteSource
#include "sniffer_registry.hpp"    // discover_sniffers(), save_registry()
#include "settings.hpp"            // Settings, load_config_file(), install_settings()
#include "output.hpp"              // format_packet(), Ansi

using namespace blesniff;

static std::atomic<bool> g_stop{false};

extern "C" void on_sigint(int) { g_stop.store(true); }

static void print_stats(const StreamResult& r) {
  const auto& s = r.stats;
  std::cerr << "stats status=" << to_string(r.status)
            << " reads=" << s.reads
            << " bytes=" << s.bytes_in
            << " frames=" << s.frames
            << " frame_errors=" << s.frame_errors
            << " packets=" << s.packets
            << " truncated=" << s.truncated_packets
            << " short=" << s.short_packets
            << " other=" << s.other_frames << "\n";
}

int main(int argc, char** argv) {
  CLI::App app{"blesniff - BLE advertising capture from an nRF sniffer"};

  Settings cfg;
  std::string config_path;
  bool do_scan = false, show_version = false, no_color = false;
  uint64_t max_packets = 0;
  std::string tk_hex;
  std::vector<int> hop;

  app.add_option("--config", config_path, "JSON settings file (default $XDG_CONFIG_HOME/blesniff/config.json)");
  auto* o_dev   = app.add_option("--dev", cfg.dev, "Serial device (e.g. /dev/serial/by-id/...)");
  auto* o_baud  = app.add_option("--baud", cfg.baud, "Baud rate (default 460800)");
  auto* o_boot  = app.add_option("--boot-delay", cfg.boot_delay_ms, "Delay after open (ms) to let USB reset");
  auto* o_tmo   = app.add_option("--timeout", cfg.read_timeout_ms, "Read poll timeout (ms)");
  auto* o_maxf  = app.add_option("--max-frame", cfg.max_frame, "Largest accepted frame in bytes")
                    ->check(CLI::Range(6, 261));
  auto* o_rsp   = app.add_flag("--scan-rsp", cfg.scan_rsp, "Also report SCAN_RSP packets");
  auto* o_aux   = app.add_flag("--aux", cfg.aux, "Follow extended advertising (AUX_*)");
  auto* o_coded = app.add_flag("--coded", cfg.coded, "Scan on the Coded PHY");
  auto* o_fmt   = app.add_option("--format", cfg.format, "Output format: pretty|json|raw")
                    ->check(CLI::IsMember({"pretty", "json", "raw"}));
  app.add_option("--tk", tk_hex, "Temporary key, 32 hex digits (default all zero)");
  app.add_option("--hop", hop, "Advertising channel hop sequence, e.g. --hop 37 38 39")
     ->check(CLI::Range(37, 39));
  app.add_option("--max-packets", max_packets, "Stop after N packets (0 = unlimited)");
  app.add_flag("--scan", do_scan, "List attached sniffers (dev/version/online) and save registry");
  app.add_flag("--verbose,-v", cfg.verbose, "Per-frame diagnostics on stderr");
  app.add_flag("--stats", cfg.stats, "Print counters on exit");
  app.add_flag("--no-color", no_color, "Disable ANSI colors");
  app.add_flag("--version", show_version, "Print version and exit");

  CLI11_PARSE(app, argc, argv);

  if (show_version) {
    std::cout << "blesniff " << BLESNIFF_VERSION << "\n";
    return 0;
  }

  // -------- settings: defaults < file < command line --------
  {
    Settings merged;
    std::string err;
    const bool explicit_cfg = !config_path.empty();
    const std::string path = explicit_cfg ? config_path : default_config_path();
    std::error_code ec;
    if (explicit_cfg || std::filesystem::exists(path, ec)) {
      if (!load_config_file(path, merged, err)) {
        std::cerr << "status=error reason=" << err << " path=" << path << "\n";
        return 2;
      }
    }
    if (o_dev->count())   merged.dev = cfg.dev;
    if (o_baud->count())  merged.baud = cfg.baud;
    if (o_boot->count())  merged.boot_delay_ms = cfg.boot_delay_ms;
    if (o_tmo->count())   merged.read_timeout_ms = cfg.read_timeout_ms;
    if (o_maxf->count())  merged.max_frame = cfg.max_frame;
    if (o_rsp->count())   merged.scan_rsp = cfg.scan_rsp;
    if (o_aux->count())   merged.aux = cfg.aux;
    if (o_coded->count()) merged.coded = cfg.coded;
    if (o_fmt->count())   merged.format = cfg.format;
    merged.verbose = cfg.verbose;
    merged.stats   = cfg.stats;
    merged.color   = !no_color;
    if (!install_settings(merged)) {
      std::cerr << "status=error reason=settings_installed_twice\n";
      return 1;
    }
  }
  const Settings& s = settings();

  if (!baud_supported(s.baud)) {
    std::cerr << "status=error reason=bad_baud baud=" << s.baud << "\n";
    return 2;
  }

  TemporaryKey tk{};
  if (!tk_hex.empty()) {
    std::vector<uint8_t> bytes;
    if (!from_hex(tk_hex, bytes) || bytes.size() != tk.size()) {
      std::cerr << "status=error reason=bad_tk\n";
      return 2;
    }
    std::copy(bytes.begin(), bytes.end(), tk.begin());
  }

  // -------- scan mode --------
  if (do_scan) {
    auto found = discover_sniffers(s.baud);
    for (const auto& f : found) {
      std::cout << "dev=" << f.dev_path
                << " version=" << (f.version.empty() ? "-" : f.version)
                << " online=" << (f.online ? 1 : 0) << "\n";
    }
    return save_registry(found) ? 0 : 1;
  }

  // ===== Target resolution =====
  std::string dev = s.dev;
  if (dev.empty()) {
    auto found = discover_sniffers(s.baud);
    if (!save_registry(found))
      std::cerr << "status=warn reason=registry_not_saved\n";

    int online_count = 0;
    for (const auto& f : found) {
      if (f.online) { online_count++; dev = f.dev_path; }
    }
    if (online_count > 1) {
      std::cerr << "status=error reason=multiple_sniffers_connected need_dev\n";
      for (const auto& f : found) {
        if (f.online) std::cerr << "candidate dev=" << f.dev_path << " version=" << f.version << "\n";
      }
      return 5;
    }
    if (online_count == 0) {
      std::cerr << "status=error reason=no_sniffers_online\n";
      return 6;
    }
  }

  // -------- open + start scanning --------
  std::string err;
  int fd = open_serial(dev, s.baud, s.boot_delay_ms, err);
  if (fd < 0) {
    std::cerr << "status=error reason=" << err << " dev=" << dev << "\n";
    return 1;
  }
  SerialByteSource src(fd, dev, s.read_timeout_ms);

  uint16_t counter = 0;
  std::vector<std::vector<uint8_t>> reqs;
  reqs.push_back(make_scan_request({s.scan_rsp, s.aux, s.coded}, counter++));
  reqs.push_back(make_temporary_key(tk, counter++));
  if (!hop.empty()) {
    std::vector<uint8_t> chans(hop.begin(), hop.end());
    reqs.push_back(make_hop_sequence(chans, counter++));
  }
  for (const auto& r : reqs) {
    if (!write_bytes(src.fd(), r)) {
      std::cerr << "status=error reason=write_failed dev=" << dev << "\n";
      return 1;
    }
  }
  if (s.verbose) {
    std::cerr << "event=scan_started dev=" << dev << " baud=" << s.baud
              << " scan_rsp=" << s.scan_rsp << " aux=" << s.aux << " coded=" << s.coded << "\n";
  }

  // -------- capture loop --------
  OutputFormat fmt = OutputFormat::pretty;
  if (!parse_format(s.format, fmt)) {
    std::cerr << "status=error reason=bad_format format=" << s.format << "\n";
    return 2;
  }
  Ansi ansi;
  ansi.enabled = s.color && is_tty_stdout() && fmt == OutputFormat::pretty;

  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  uint64_t printed = 0;
  CallbackSink sink;
  sink.packet = [&](const BlePacket& pkt, DecodeStatus st, const Frame& frame) {
    std::cout << format_packet(pkt, st, frame.data(), frame.size(), fmt, ansi) << "\n";
    if (max_packets && ++printed >= max_packets) g_stop.store(true);
  };
  sink.frame_error = [&](const FrameError& e) {
    if (s.verbose)
      std::cerr << "event=frame_error reason=" << to_string(e.kind)
                << " discarded=" << e.discarded << "\n";
  };
  sink.event = [&](const Frame& frame, DecodeStatus st) {
    if (!s.verbose) return;
    std::cerr << describe_event(frame);
    if (st == DecodeStatus::short_packet || st == DecodeStatus::unsupported_pdu)
      std::cerr << " reason=" << to_string(st);
    std::cerr << "\n";
  };

  StreamResult res = run_stream(src, sink, &g_stop, s.max_frame);
  std::cout.flush();

  // Leave the firmware idle.
  if (res.status != StreamStatus::io_error && !write_bytes(src.fd(), make_go_idle(counter++)))
    std::cerr << "status=warn reason=go_idle_failed dev=" << dev << "\n";

  if (s.stats) print_stats(res);

  if (res.status == StreamStatus::io_error) {
    std::cerr << "status=error reason=" << res.error << " dev=" << dev << "\n";
    return 1;
  }
  return 0;
}
