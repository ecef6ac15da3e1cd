#include "test_support.hpp"
#include "tomo_preview/core/events.hpp"
#include "tomo_preview/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace tomo_preview;

TEST_CASE("glob_match_is_case_insensitive_and_escapes_dots") {
    REQUIRE(core::glob_match("*.mrc", "tomo_01.MRC"));
    REQUIRE(core::glob_match("tomo_??.st", "tomo_01.st"));
    REQUIRE_FALSE(core::glob_match("*.mrc", "tomo_01xmrc"));
    REQUIRE_FALSE(core::glob_match("*.mrc", "tomo.mrcs"));
}

TEST_CASE("to_lower_leaves_non_ascii_bytes_alone") {
    REQUIRE(core::to_lower("\xC3\x89X.MRC") == "\xC3\x89x.mrc");
    REQUIRE(core::to_lower("\xFF\x80") == "\xFF\x80");
    REQUIRE(core::to_lower("") == "");
}

TEST_CASE("discover_files_matches_patterns_sorted_by_name") {
    test::TempDir tmp;
    for (const char* name : {"b.rec", "a.mrc", "c.txt", "d.st"}) {
        core::write_text(tmp.path() / name, "x");
    }
    fs::create_directories(tmp.path() / "sub.mrc");

    auto files = core::discover_files(tmp.path(), "*.mrc; *.rec ;*.st");
    REQUIRE(files.size() == 3);
    REQUIRE(files[0].filename() == "a.mrc");
    REQUIRE(files[1].filename() == "b.rec");
    REQUIRE(files[2].filename() == "d.st");

    REQUIRE(core::discover_files(tmp.path() / "missing", "*.mrc").empty());
}

TEST_CASE("format_bytes_uses_binary_units") {
    REQUIRE(core::format_bytes(512) == "512 B");
    REQUIRE(core::format_bytes(1536) == "1.50 KiB");
    REQUIRE(core::format_bytes(3ull << 30) == "3.00 GiB");
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
    std::ostringstream out;
    core::EventEmitter emitter("run42", out);
    emitter.phase_start("vol.mrc", Phase::ENHANCE);
    emitter.phase_progress("vol.mrc", Phase::ENHANCE, 5, 10);
    emitter.run_end(true, "ok");

    std::istringstream lines(out.str());
    std::string line;
    std::vector<core::json> events;
    while (std::getline(lines, line)) {
        events.push_back(core::json::parse(line));
    }
    REQUIRE(events.size() == 3);
    REQUIRE(events[0]["type"] == "phase_start");
    REQUIRE(events[0]["phase_name"] == "ENHANCE");
    REQUIRE(events[0]["volume"] == "vol.mrc");
    REQUIRE(events[1]["progress"].get<double>() == 0.5);
    REQUIRE(events[2]["type"] == "run_end");
    for (const auto& e : events) {
        REQUIRE(e["run_id"] == "run42");
        REQUIRE(e.contains("ts"));
    }
}

TEST_CASE("event_emitter_log_lines_never_split_events") {
    std::ostringstream shared;
    std::ostringstream errors;
    core::EventEmitter emitter("run7", shared, shared, errors);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&emitter, t] {
            const std::string volume = "vol" + std::to_string(t) + ".mrc";
            for (size_t i = 1; i <= 100; ++i) {
                emitter.log("[ENHANCE] " + volume + ": step " + std::to_string(i));
                emitter.phase_progress(volume, Phase::ENHANCE, i, 100);
            }
            emitter.log_error("[ERROR] " + volume + ": done");
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::istringstream lines(shared.str());
    std::string line;
    size_t logs = 0;
    size_t events = 0;
    while (std::getline(lines, line)) {
        if (line.rfind("[ENHANCE] ", 0) == 0) {
            ++logs;
        } else {
            REQUIRE(core::json::parse(line)["type"] == "phase_progress");
            ++events;
        }
    }
    REQUIRE(logs == 400);
    REQUIRE(events == 400);
    REQUIRE(errors.str().find("[ERROR] vol3.mrc: done") != std::string::npos);
}
