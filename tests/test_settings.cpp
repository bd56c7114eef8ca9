#include <doctest/doctest.h>
#include "settings.hpp"
#include "sniffer_registry.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace blesniff;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Scratch file under the system temp dir, removed on scope exit.
struct TempFile {
    fs::path path;
    explicit TempFile(const std::string& name)
        : path(fs::temp_directory_path() / ("blesniff_test_" + name)) {}
    ~TempFile() { std::error_code ec; fs::remove(path, ec); }

    void write(const std::string& text) const {
        std::ofstream ofs(path);
        ofs << text;
    }
};

} // namespace

TEST_CASE("apply_config merges the keys that are present") {
    Settings s;
    std::string err;
    const json j = {{"dev", "/dev/ttyACM3"}, {"baud", 1000000}, {"scan_rsp", true},
                    {"format", "json"}, {"max_frame", 64}};
    REQUIRE(apply_config(j, s, err));

    CHECK(s.dev == "/dev/ttyACM3");
    CHECK(s.baud == 1000000);
    CHECK(s.scan_rsp);
    CHECK(s.format == "json");
    CHECK(s.max_frame == 64);
    CHECK(s.boot_delay_ms == 400);        // untouched
    CHECK(s.read_timeout_ms == 200);
    CHECK_FALSE(s.aux);
}

TEST_CASE("apply_config rejects bad values and ignores unknown keys") {
    Settings s;
    std::string err;

    SUBCASE("unknown key") {
        CHECK(apply_config(json{{"colour", "blue"}}, s, err));
        CHECK(err.empty());
    }
    SUBCASE("wrong type") {
        CHECK_FALSE(apply_config(json{{"baud", "fast"}}, s, err));
        CHECK(err == "bad_config:baud");
    }
    SUBCASE("negative number") {
        CHECK_FALSE(apply_config(json{{"read_timeout_ms", -5}}, s, err));
        CHECK(err == "bad_config:read_timeout_ms");
    }
    SUBCASE("bool expected") {
        CHECK_FALSE(apply_config(json{{"coded", 1}}, s, err));
        CHECK(err == "bad_config:coded");
    }
    SUBCASE("unknown output format") {
        CHECK_FALSE(apply_config(json{{"format", "xml"}}, s, err));
        CHECK(err == "bad_config:format");
    }
    SUBCASE("max_frame below the frame header") {
        CHECK_FALSE(apply_config(json{{"max_frame", 0}}, s, err));
        CHECK(err == "bad_config:max_frame");
        CHECK(s.max_frame == 261);
    }
    SUBCASE("max_frame above the largest frame") {
        CHECK_FALSE(apply_config(json{{"max_frame", 262}}, s, err));
        CHECK(err == "bad_config:max_frame");
    }
    SUBCASE("max_frame at both bounds") {
        CHECK(apply_config(json{{"max_frame", 6}}, s, err));
        CHECK(s.max_frame == 6);
        CHECK(apply_config(json{{"max_frame", 261}}, s, err));
        CHECK(s.max_frame == 261);
    }
    SUBCASE("integer wider than int") {
        CHECK_FALSE(apply_config(json{{"baud", 4294967296LL}}, s, err));
        CHECK(err == "bad_config:baud");
        CHECK(s.baud == 460800);
    }
    SUBCASE("unsigned integer wider than int") {
        CHECK_FALSE(apply_config(json{{"boot_delay_ms", 3000000000ULL}}, s, err));
        CHECK(err == "bad_config:boot_delay_ms");
    }
    SUBCASE("top level is not an object") {
        CHECK_FALSE(apply_config(json::array({1, 2}), s, err));
        CHECK(err == "bad_config:not_object");
    }
}

TEST_CASE("load_config_file") {
    Settings s;
    std::string err;

    SUBCASE("valid file") {
        TempFile f("config_ok.json");
        f.write(R"({"baud": 115200, "aux": true})");
        REQUIRE(load_config_file(f.path.string(), s, err));
        CHECK(s.baud == 115200);
        CHECK(s.aux);
    }
    SUBCASE("missing file") {
        CHECK_FALSE(load_config_file("/nonexistent/blesniff/config.json", s, err));
        CHECK(err == "config_open");
    }
    SUBCASE("not JSON") {
        TempFile f("config_bad.json");
        f.write("baud = 115200\n");
        CHECK_FALSE(load_config_file(f.path.string(), s, err));
        CHECK(err == "config_parse");
    }
}

TEST_CASE("settings install once") {
    Settings first;
    first.dev = "/dev/ttyACM9";
    Settings second;
    second.dev = "/dev/ttyUSB0";

    CHECK(install_settings(first));
    CHECK_FALSE(install_settings(second));
    CHECK(settings().dev == "/dev/ttyACM9");
}

TEST_CASE("sniffer registry written and read back") {
    TempFile f("sniffers.json");
    std::vector<SnifferInfo> list(2);
    list[0].dev_path = "/dev/ttyACM0";
    list[0].by_id    = "usb-SEGGER_J-Link_000683000000-if00";
    list[0].version  = "4.1.1";
    list[0].online   = true;
    list[1].dev_path = "/dev/ttyUSB1";

    REQUIRE(save_registry(list, f.path.string()));

    std::vector<SnifferInfo> back;
    REQUIRE(load_registry(f.path.string(), back));
    REQUIRE(back.size() == 2);
    CHECK(back[0].dev_path == "/dev/ttyACM0");
    CHECK(back[0].by_id == list[0].by_id);
    CHECK(back[0].version == "4.1.1");
    CHECK(back[0].online);
    CHECK(back[1].dev_path == "/dev/ttyUSB1");
    CHECK_FALSE(back[1].online);
}

TEST_CASE("load_registry rejects malformed files") {
    TempFile f("sniffers_bad.json");
    std::vector<SnifferInfo> out;

    SUBCASE("not an array") {
        f.write(R"({"dev_path": "/dev/ttyACM0"})");
        CHECK_FALSE(load_registry(f.path.string(), out));
    }
    SUBCASE("record without dev_path") {
        f.write(R"([{"version": "4.1.1"}])");
        CHECK_FALSE(load_registry(f.path.string(), out));
        CHECK(out.empty());
    }
    SUBCASE("missing file") {
        CHECK_FALSE(load_registry("/nonexistent/sniffers.json", out));
    }
}
