/**
 * @file main.cpp
 * @brief blesniff-decode: offline decoder for advertising payloads and sniffer captures.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11).
 *  - Take hex input from positional arguments, or one input per line on stdin.
 *    A binary capture file can be given with --input (stream layout only).
 *  - Decode with the selected layout:
 *      ad      AD elements only
 *      addr    6 address bytes (over-the-air order) + AD elements
 *      frame   one unescaped sniffer frame
 *      stream  raw serial bytes, reassembled and decoded with run_stream()
 *  - Print packets in pretty|json|raw, diagnostics as key=value on stderr.
 *
 * Exit status: 0 all inputs decoded, 2 usage/input error, 3 at least one input failed.
 */

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>

#include "blesniff/packet_builder.hpp"
#include "blesniff/stream.hpp"
#include "blesniff/version.hpp"
#include "commands.hpp"
#include "output.hpp"

using namespace blesniff;

// ---------- small utilities ----------

static bool read_binary_file(const std::string& path, std::vector<uint8_t>& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return true;
}

static bool layout_from_name(const std::string& name, RawLayout& out) {
  if (name == "ad")    { out = RawLayout::ad_only;          return true; }
  if (name == "addr")  { out = RawLayout::address_prefixed; return true; }
  if (name == "frame") { out = RawLayout::sniffer_frame;    return true; }
  return false;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::vector<std::string> hex_inputs;
  std::string opt_layout = "ad";
  std::string opt_format = "pretty";
  std::string opt_input;
  size_t opt_chunk = STREAM_READ_CHUNK;
  bool opt_no_color = false, opt_verbose = false, opt_stats = false, opt_version = false;

  CLI::App app{"blesniff-decode - decode BLE advertising bytes offline"};
  app.add_option("hex", hex_inputs, "Hex input(s); stdin lines when omitted");
  app.add_option("--layout", opt_layout, "Input layout: ad|addr|frame|stream")
     ->check(CLI::IsMember({"ad", "addr", "frame", "stream"}));
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")
     ->check(CLI::IsMember({"pretty", "json", "raw"}));
  app.add_option("--input", opt_input, "Binary capture file (stream layout)");
  app.add_option("--chunk", opt_chunk, "Bytes per read when replaying a stream")
     ->check(CLI::PositiveNumber);
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("--verbose,-v", opt_verbose, "Report frame errors and non-packet frames");
  app.add_flag("--stats", opt_stats, "Print counters on exit (stream layout)");
  app.add_flag("--version", opt_version, "Print version and exit");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  if (opt_version) {
    std::cout << "blesniff-decode " << version() << "\n";
    return 0;
  }

  OutputFormat fmt = OutputFormat::pretty;
  if (!parse_format(opt_format, fmt)) {
    std::cerr << "status=error reason=bad_format format=" << opt_format << "\n";
    return 2;
  }
  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && fmt == OutputFormat::pretty;

  if (!opt_input.empty() && opt_layout != "stream") {
    std::cerr << "status=error reason=input_needs_stream_layout\n";
    return 2;
  }

  // Collect inputs: arguments first, else stdin lines.
  std::vector<std::vector<uint8_t>> inputs;
  if (!opt_input.empty()) {
    std::vector<uint8_t> bytes;
    if (!read_binary_file(opt_input, bytes)) {
      std::cerr << "status=error reason=input_open path=" << opt_input << "\n";
      return 2;
    }
    inputs.push_back(std::move(bytes));
  } else {
    std::vector<std::string> lines = hex_inputs;
    if (lines.empty()) {
      std::string line;
      while (std::getline(std::cin, line)) {
        if (line.empty() || line[0] == '#') continue;
        lines.push_back(line);
      }
    }
    size_t n = 0;
    for (const auto& l : lines) {
      ++n;
      std::vector<uint8_t> bytes;
      if (!from_hex(l, bytes)) {
        std::cerr << "status=error reason=bad_hex input=" << n << "\n";
        return 2;
      }
      inputs.push_back(std::move(bytes));
    }
  }

  // -------- stream: everything is one byte stream --------
  if (opt_layout == "stream") {
    std::vector<uint8_t> all;
    for (const auto& in : inputs) all.insert(all.end(), in.begin(), in.end());

    CallbackSink sink;
    sink.packet = [&](const BlePacket& pkt, DecodeStatus st, const Frame& frame) {
      std::cout << format_packet(pkt, st, frame.data(), frame.size(), fmt, ansi) << "\n";
    };
    sink.frame_error = [&](const FrameError& e) {
      if (opt_verbose)
        std::cerr << "event=frame_error reason=" << to_string(e.kind)
                  << " discarded=" << e.discarded << "\n";
    };
    sink.event = [&](const Frame& frame, DecodeStatus st) {
      if (opt_verbose)
        std::cerr << describe_event(frame) << " status=" << to_string(st) << "\n";
    };

    BufferSource src(std::move(all), opt_chunk);
    StreamResult res = run_stream(src, sink);
    if (opt_stats) {
      const auto& s = res.stats;
      std::cerr << "stats status=" << to_string(res.status)
                << " bytes=" << s.bytes_in << " frames=" << s.frames
                << " frame_errors=" << s.frame_errors << " packets=" << s.packets
                << " truncated=" << s.truncated_packets << " short=" << s.short_packets
                << " other=" << s.other_frames << "\n";
    }
    return (res.stats.frame_errors || res.stats.short_packets) ? 3 : 0;
  }

  // -------- one packet per input --------
  RawLayout layout = RawLayout::ad_only;
  if (!layout_from_name(opt_layout, layout)) {
    std::cerr << "status=error reason=bad_layout layout=" << opt_layout << "\n";
    return 2;
  }

  int rc = 0;
  size_t n = 0;
  for (const auto& in : inputs) {
    ++n;
    BlePacket pkt;
    const DecodeStatus st = decode_raw(in, pkt, layout);
    if (!packet_usable(st)) {
      std::cerr << "status=error reason=" << to_string(st) << " input=" << n << "\n";
      rc = 3;
      continue;
    }
    if (st == DecodeStatus::truncated_field) rc = 3;
    std::cout << format_packet(pkt, st, in.data(), in.size(), fmt, ansi) << "\n";
  }
  return rc;
}
