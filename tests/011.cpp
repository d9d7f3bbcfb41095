#include "utils.hpp"

#include <catch2/catch_approx.hpp>

namespace callsheet::test {

    namespace detail {

        static breakdown_run run_script(std::string_view text, pipeline_config cfg = {}, logger log = {}) {
            auto kb = knowledge_base::builtin();
            scene_parser parser{cfg, std::move(log), kb, analyzer_registry::defaults(cfg)};
            return parser.analyze_document(text);
        }

    }  // namespace detail

    TEST_CASE("011: two-scene script end to end", "[011][pipeline]") {
        auto run = detail::run_script(detail::two_scene_script);

        REQUIRE(run.failures.empty());
        REQUIRE(run.scenes.size() == 2U);

        const auto& office = run.scenes[0];
        CHECK(office.scene_number == "1");
        CHECK(office.header.location == "OFFICE");
        CHECK(office.header.time == time_of_day::day);
        CHECK(office.stage == scene_stage::refined);
        CHECK(detail::contains(office.cast, "JOHN"));
        CHECK(detail::contains(office.set_dressing, "desk"));
        CHECK_FALSE(office.synopsis.empty());

        const auto& street = run.scenes[1];
        CHECK(street.scene_number == "2");
        CHECK(street.header.interior_exterior == int_ext::exterior);
        CHECK(street.header.time == time_of_day::night);
        CHECK(street.stage == scene_stage::refined);
        CHECK(detail::contains(street.cast, "JOHN"));
        CHECK(detail::contains(street.vehicles, "car"));
        CHECK_FALSE(detail::contains(street.props, "car"));
        CHECK_FALSE(street.continues_scene.has_value());
        REQUIRE(street.wardrobe.size() == 1U);
        CHECK(street.wardrobe[0].character == "JOHN");
        CHECK(street.analyzer_failures.empty());
    }

    TEST_CASE("011: batch size does not change the result", "[011][pipeline]") {
        pipeline_config serial{};
        serial.batch_size = 1;
        pipeline_config batched{};
        batched.batch_size = 4;

        auto script = std::string{detail::two_scene_script} +
                      "\nScene 3 INT OFFICE - DAY\nJOHN: Back again.\nMARY: So soon?\n";
        auto a = detail::run_script(script, serial);
        auto b = detail::run_script(script, batched);

        REQUIRE(a.scenes.size() == 3U);
        REQUIRE(b.scenes.size() == a.scenes.size());
        for (std::size_t i = 0; i < a.scenes.size(); ++i) {
            CHECK(a.scenes[i].scene_number == b.scenes[i].scene_number);
            CHECK(a.scenes[i].cast == b.scenes[i].cast);
            CHECK(a.scenes[i].all_items() == b.scenes[i].all_items());
            CHECK(a.scenes[i].synopsis == b.scenes[i].synopsis);
            CHECK(a.scenes[i].continuity_notes == b.scenes[i].continuity_notes);
        }
    }

    TEST_CASE("011: first spelling in the document names a character in every batch size", "[011][pipeline]") {
        constexpr std::string_view script =
                "Scene 1 INT OFFICE - DAY\nJohn: Hi.\n\n"
                "Scene 2 INT OFFICE - DAY\nJOHN enters.\n\n"
                "Scene 3 EXT STREET - NIGHT\nJOHN: Late again.\n";
        const std::vector<std::string> expected{"John"};

        for (std::size_t batch : {1U, 2U, 4U}) {
            pipeline_config cfg{};
            cfg.batch_size = batch;
            for (int attempt = 0; attempt < 8; ++attempt) {
                auto run = detail::run_script(script, cfg);
                REQUIRE(run.scenes.size() == 3U);
                for (const auto& scene : run.scenes) {
                    CHECK(scene.cast == expected);
                    REQUIRE(scene.wardrobe.size() == 1U);
                    CHECK(scene.wardrobe[0].character == "John");
                }
            }
        }
    }

    TEST_CASE("011: continuation and wardrobe matching", "[011][pipeline]") {
        auto run = detail::run_script(
                "Scene 1 INT OFFICE - DAY\nJOHN: Morning.\n\nScene 2 INT OFFICE - DAY\nJOHN: Still here.\n");
        REQUIRE(run.scenes.size() == 2U);

        const auto& second = run.scenes[1];
        CHECK(second.continues_scene == std::optional<std::string>{"1"});
        REQUIRE_FALSE(second.continuity_notes.empty());
        CHECK(second.continuity_notes.front() == "Continues from scene 1");
        CHECK(detail::contains(second.continuity_notes, "Wardrobe continuity with scene 1: JOHN"));
        REQUIRE(second.wardrobe.size() == 1U);
        CHECK(second.wardrobe[0].continuity_note == std::optional<std::string>{"Match wardrobe from scene 1"});

        CHECK_FALSE(run.scenes[0].continues_scene.has_value());
        CHECK_FALSE(run.scenes[0].wardrobe[0].continuity_note.has_value());
    }

    TEST_CASE("011: a failing analyzer only defaults its own fields", "[011][pipeline]") {
        detail::captured_log log{};
        pipeline_config cfg{};
        auto kb = knowledge_base::builtin();
        auto analyzers = analyzer_registry::defaults(cfg);
        analyzers.set(analyzer_kind::effects, [](const scene_context&, const breakdown&) -> partial_result {
            throw analyzer_error{"boom"};
        });

        scene_parser parser{cfg, log.make(log_level::warn), kb, std::move(analyzers)};
        auto run = parser.analyze_document(
                "Scene 1 EXT STREET - NIGHT\nJOHN runs through the rain as the car explodes.\n");

        REQUIRE(run.scenes.size() == 1U);
        const auto& scene = run.scenes[0];
        CHECK(scene.analyzer_failures == std::vector<std::string>{"effects: boom"});
        CHECK(scene.stage == scene_stage::enriched);
        CHECK(scene.special_effects.empty());
        CHECK(scene.sound_cues.empty());
        CHECK(detail::contains(scene.cast, "JOHN"));
        CHECK(detail::contains(scene.vehicles, "car"));
        CHECK_FALSE(scene.production_notes.empty());

        CHECK(parser.continuity().scene_count() == 0U);
        CHECK(log.contains("effects analyzer failed: boom"));
    }

    TEST_CASE("011: malformed blocks are skipped", "[011][pipeline]") {
        auto kb = knowledge_base::builtin();
        pipeline_config cfg{};
        scene_parser parser{cfg, logger{}, kb, analyzer_registry::defaults(cfg)};

        std::vector<scene_block> blocks{
                scene_block{"x", "Scene x\nSomething happens."},
                scene_block{"3", "Scene 3 INT ROOM\n\n"},
                scene_block{"4", "Scene 4 INT ROOM - DAY\nJOHN: Hi."}};
        auto run = parser.analyze_blocks(blocks);

        REQUIRE(run.scenes.size() == 1U);
        CHECK(run.scenes[0].scene_number == "4");

        REQUIRE(run.failures.size() == 2U);
        CHECK(run.failures[0].scene_number == "x");
        CHECK(run.failures[0].stage == scene_stage::extracted);
        CHECK(run.failures[0].message.find("not numeric") != std::string::npos);
        CHECK(run.failures[1].scene_number == "3");
        CHECK(run.failures[1].message.find("empty body") != std::string::npos);

        CHECK_THROWS_AS(parser.analyze_document("no markers at all"), no_scenes_found_error);
    }

    TEST_CASE("011: page length and shoot time", "[011][production]") {
        CHECK(page_eighths("") == 1);
        CHECK(page_eighths("Scene 1 INT ROOM\none\n\ntwo") == 1);
        CHECK(page_eighths("1\n2\n3\n4\n5\n6\n7\n8") == 2);

        CHECK(estimate_shoot_hours(4, 4, int_ext::exterior, true) == Catch::Approx(2.3));
        CHECK(estimate_shoot_hours(8, 2, int_ext::interior, false) == Catch::Approx(2.0));
    }

    TEST_CASE("011: shooting schedule", "[011][schedule]") {
        std::vector<breakdown> scenes(4);
        const int eighths[] = {10, 25, 10, 50};
        for (std::size_t i = 0; i < scenes.size(); ++i) {
            scenes[i].scene_number = std::to_string(i + 1U);
            scenes[i].page_eighths = eighths[i];
            scenes[i].estimated_shoot_hours = 1.0;
        }

        auto days = build_schedule(scenes, 40);
        REQUIRE(days.size() == 3U);
        CHECK(days[0].day_number == 1);
        CHECK(days[0].scenes == std::vector<std::string>{"1", "2"});
        CHECK(days[0].total_eighths == 35);
        CHECK(days[0].total_hours == Catch::Approx(2.0));
        CHECK(days[1].scenes == std::vector<std::string>{"3"});
        CHECK(days[2].day_number == 3);
        CHECK(days[2].scenes == std::vector<std::string>{"4"});
        CHECK(days[2].total_eighths == 50);

        CHECK(build_schedule({}).empty());

        CHECK(format_eighths(11) == "1 3/8");
        CHECK(format_eighths(8) == "1");
        CHECK(format_eighths(3) == "3/8");
    }

    TEST_CASE("011: report output", "[011][report]") {
        auto run = detail::run_script(detail::two_scene_script);
        auto schedule = build_schedule(run.scenes);

        SECTION("json") {
            auto summary = parse_report_summary(render_json(run, schedule));
            CHECK(summary.schema_version == 1);
            CHECK(summary.scene_count == 2U);
            CHECK(summary.failure_count == 0U);
            CHECK(summary.scene_numbers == std::vector<std::string>{"1", "2"});
            CHECK(summary.shooting_days == 1U);

            CHECK(parse_report_summary(render_json(run)).shooting_days == 0U);
            CHECK_THROWS_AS(parse_report_summary("{\"scenes\": 7"), config_error);
        }

        SECTION("json file") {
            auto path = detail::write_temp_file("report.json", "");
            write_report(path, render_json(run));
            std::ifstream in{path};
            std::stringstream ss{};
            ss << in.rdbuf();
            CHECK(parse_report_summary(ss.str()).scene_count == 2U);
        }

        SECTION("table") {
            std::ostringstream os{};
            print_table(os, run, false);
            auto text = os.str();
            CHECK(text.find("SCENE 1 | INT DAY | OFFICE") != std::string::npos);
            CHECK(text.find("SCENE 2") != std::string::npos);
            CHECK(text.find("2 scene(s), 0 skipped") != std::string::npos);
            CHECK(text.find("\x1b[") == std::string::npos);

            std::ostringstream sched{};
            print_schedule(sched, schedule, false);
            CHECK(sched.str().find("day 1") != std::string::npos);
        }
    }

    TEST_CASE("011: logger thresholds", "[011][log]") {
        std::ostringstream os{};
        auto log = logger::to_stream(os, log_level::warn);
        log.info("not shown");
        log.warn("shown");
        auto text = os.str();
        CHECK(text.find("not shown") == std::string::npos);
        CHECK(text.starts_with("warn [011.cpp:"));
        CHECK(text.find("] shown\n") != std::string::npos);

        auto copy = log;
        copy.error("from a copy");
        CHECK(os.str().find("from a copy") != std::string::npos);

        logger silent{};
        CHECK_FALSE(silent.enabled(log_level::error));
        CHECK_FALSE(logger::to_stream(os, log_level::off).enabled(log_level::error));
    }

}  // namespace callsheet::test
