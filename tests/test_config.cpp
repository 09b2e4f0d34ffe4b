#include <doctest/doctest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include "meshsplit/config.hpp"
using namespace meshsplit;

TEST_CASE("parse_config: empty object keeps every default") {
    SplitterConfig cfg;
    std::string err;
    REQUIRE(parse_config("{}", cfg, err));
    CHECK(cfg.limits.total_limit == DEFAULT_TOTAL_LIMIT);
    CHECK(cfg.limits.chunk_limit == DEFAULT_CHUNK_LIMIT);
    CHECK(cfg.pacing.split_delay_ms == 2500);
    CHECK(cfg.pacing.burst_every == 4);
    CHECK(cfg.pacing.burst_pause_ms == 5000);
    CHECK(cfg.device.empty());
    CHECK(cfg.baud == 115200);
}

TEST_CASE("parse_config: full document overrides every field") {
    const char* doc = R"({
        "total_limit": 500, "chunk_limit": 200,
        "pacing": { "split_delay_ms": 1000, "burst_every": 3, "burst_pause_ms": 4000 },
        "serial": { "device": "/dev/ttyACM0", "baud": 57600 }
    })";
    SplitterConfig cfg;
    std::string err;
    REQUIRE(parse_config(doc, cfg, err));
    CHECK(cfg.limits.total_limit == 500);
    CHECK(cfg.limits.chunk_limit == 200);
    CHECK(cfg.pacing.split_delay_ms == 1000);
    CHECK(cfg.pacing.burst_every == 3);
    CHECK(cfg.pacing.burst_pause_ms == 4000);
    CHECK(cfg.device == "/dev/ttyACM0");
    CHECK(cfg.baud == 57600);
}

TEST_CASE("parse_config: bad values name the key and leave cfg unchanged") {
    SplitterConfig cfg;
    std::string err;

    CHECK_FALSE(parse_config(R"({"total_limit": 400, "chunk_limit": -5})", cfg, err));
    CHECK(err == "bad_value:chunk_limit");
    CHECK(cfg.limits.total_limit == DEFAULT_TOTAL_LIMIT);

    CHECK_FALSE(parse_config(R"({"total_limit": "big"})", cfg, err));
    CHECK(err == "bad_value:total_limit");

    CHECK_FALSE(parse_config(R"({"pacing": {"burst_every": 300}})", cfg, err));
    CHECK(err == "bad_value:pacing.burst_every");

    CHECK_FALSE(parse_config(R"({"pacing": 5})", cfg, err));
    CHECK(err == "bad_value:pacing");

    CHECK_FALSE(parse_config(R"({"serial": {"baud": 12345}})", cfg, err));
    CHECK(err == "bad_value:serial.baud");

    CHECK_FALSE(parse_config(R"({"serial": {"device": 7}})", cfg, err));
    CHECK(err == "bad_value:serial.device");
}

TEST_CASE("parse_config: malformed documents") {
    SplitterConfig cfg;
    std::string err;
    CHECK_FALSE(parse_config("{ nope", cfg, err));
    CHECK(err == "parse_error");
    CHECK_FALSE(parse_config("[1,2]", cfg, err));
    CHECK(err == "not_object");
}

TEST_CASE("load_config: reads a file; missing file is open_failed") {
    const std::string path = "meshsplit_test_config.json";
    {
        std::ofstream out(path, std::ios::trunc);
        REQUIRE(out);
        out << R"({"chunk_limit": 80})";
    }
    SplitterConfig cfg;
    std::string err;
    CHECK(load_config(path, cfg, err));
    CHECK(cfg.limits.chunk_limit == 80);
    std::remove(path.c_str());

    CHECK_FALSE(load_config("/nonexistent/meshsplit.json", cfg, err));
    CHECK(err == "open_failed");
}
