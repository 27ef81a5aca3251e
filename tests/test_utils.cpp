#include "floodmap/core/errors.hpp"
#include "floodmap/core/events.hpp"
#include "floodmap/core/utils.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using namespace floodmap;

TEST_CASE("sha256_of_bytes_and_file_agree") {
  const std::string abc = "abc";
  const std::vector<uint8_t> bytes(abc.begin(), abc.end());
  const std::string expected =
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
  REQUIRE(core::sha256_bytes(bytes) == expected);

  const fs::path path = fs::temp_directory_path() / "floodmap_test_sha.txt";
  core::write_text(path, abc);
  REQUIRE(core::sha256_file(path) == expected);
  fs::remove(path);
}

TEST_CASE("write_text_then_read_bytes") {
  const fs::path path = fs::temp_directory_path() / "floodmap_test_text.txt";
  core::write_text(path, "line one\nline two\n");
  REQUIRE(core::read_bytes(path).size() == 18);
  fs::remove(path);
}

TEST_CASE("sha256_file_missing_throws_io_error") {
  REQUIRE_THROWS_AS(core::sha256_file(fs::temp_directory_path() / "floodmap_no_such_file.yaml"),
                    IOError);
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
  core::EventEmitter events;
  std::ostringstream out;

  events.phase_start("run-1", Phase::FLOOD_SEARCH, out);
  events.phase_progress("run-1", Phase::FLOOD_SEARCH, 5, 10, "visited", out);
  events.phase_end("run-1", Phase::FLOOD_SEARCH, "ok", {{"flooded", 3}}, out);

  std::istringstream lines(out.str());
  std::string line;
  int n = 0;
  while (std::getline(lines, line)) {
    const auto ev = core::json::parse(line);
    REQUIRE(ev.at("run_id") == "run-1");
    REQUIRE(ev.at("phase_name") == "FLOOD_SEARCH");
    if (n == 1) {
      REQUIRE(ev.at("type") == "phase_progress");
      REQUIRE(ev.at("current") == 5);
    }
    if (n == 2) {
      REQUIRE(ev.at("type") == "phase_end");
      REQUIRE(ev.at("status") == "ok");
    }
    ++n;
  }
  REQUIRE(n == 3);
}
