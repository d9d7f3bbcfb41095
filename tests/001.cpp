#include "utils.hpp"

namespace callsheet::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: output, color and log level parsing", "[001][config]") {
        output_mode out_mode = output_mode::table;
        color_mode clr_mode = color_mode::automatic;
        log_level level = log_level::warn;

        REQUIRE(try_parse_output_mode("JSON"sv, out_mode));
        CHECK(out_mode == output_mode::json);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, out_mode));

        REQUIRE(try_parse_color_mode("NEVER"sv, clr_mode));
        CHECK(clr_mode == color_mode::never);
        REQUIRE(try_parse_color_mode("auto"sv, clr_mode));
        CHECK(clr_mode == color_mode::automatic);
        CHECK_FALSE(try_parse_color_mode("sometimes"sv, clr_mode));

        REQUIRE(try_parse_log_level("Debug"sv, level));
        CHECK(level == log_level::debug);
        REQUIRE(try_parse_log_level("warning"sv, level));
        CHECK(level == log_level::warn);
        CHECK_FALSE(try_parse_log_level("trace"sv, level));
    }

    TEST_CASE("001: priority and component parsing", "[001][config]") {
        job_priority priority = job_priority::normal;

        REQUIRE(try_parse_priority("urgent"sv, priority));
        CHECK(priority == job_priority::urgent);
        REQUIRE(try_parse_priority("5"sv, priority));
        CHECK(priority == job_priority::critical);
        CHECK(weight(priority) == 5);
        CHECK_FALSE(try_parse_priority("0"sv, priority));
        CHECK_FALSE(try_parse_priority("6"sv, priority));
        CHECK_FALSE(try_parse_priority("asap"sv, priority));

        analysis_component component = analysis_component::full_analysis;
        REQUIRE(try_parse_component("LEGAL_SCAN"sv, component));
        CHECK(component == analysis_component::legal_scan);
        CHECK_FALSE(try_parse_component("everything"sv, component));

        for (auto c : all_components) {
            analysis_component parsed = analysis_component::full_analysis;
            REQUIRE(try_parse_component(to_string(c), parsed));
            CHECK(parsed == c);
        }
    }

    TEST_CASE("001: config defaults and log threshold", "[001][config]") {
        pipeline_config cfg{};
        CHECK(cfg.max_concurrent_jobs == 2U);
        CHECK(cfg.cache_ttl_seconds == 3'600);
        CHECK(cfg.enable_wardrobe_inference);
        CHECK(cfg.enable_legal_alerts);
        CHECK(cfg.batch_size == 4U);
        CHECK(cfg.max_eighths_per_day == 40);

        startup_config startup{};
        CHECK(startup.effective_log_level() == log_level::warn);
        startup.verbose = true;
        CHECK(startup.effective_log_level() == log_level::debug);
        startup.verbose = false;
        startup.quiet = true;
        CHECK(startup.effective_log_level() == log_level::error);
    }

    TEST_CASE("001: enum names format through std::format", "[001][config]") {
        using namespace callsheet::literals;

        CHECK("{}"_format(int_ext::exterior) == "EXT");
        CHECK("{}"_format(time_of_day::night) == "NIGHT");
        CHECK("{}"_format(prop_category::set_dressing) == "set_dressing");
        CHECK("{}"_format(job_priority::high) == "high");
        CHECK("{}"_format(analyzer_kind::wardrobe) == "wardrobe");
    }

    TEST_CASE("001: text helpers", "[001][utils]") {
        CHECK(utils::normalize_digits("مشهد ١٢") == "مشهد 12");
        CHECK(utils::normalize_digits("scene ۳") == "scene 3");

        CHECK(utils::utf8_length("نور") == 3U);
        CHECK(utils::utf8_prefix("نهال سماحة", 4U) == "نهال");

        CHECK(utils::collapse_whitespace("  a \t b\n\nc  ") == "a b c");
        CHECK(utils::trim_view("\r\n x \t") == "x");

        auto lines = utils::split_lines("one\r\ntwo\n\nthree");
        REQUIRE(lines.size() == 4U);
        CHECK(lines[0] == "one");
        CHECK(lines[2].empty());

        CHECK(utils::contains_term("she drives a bmw today", "BMW"));
        CHECK_FALSE(utils::contains_term("a bmwx prototype", "BMW"));
        CHECK(utils::contains_term("يغني عمرو دياب الليلة", "عمرو دياب"));

        CHECK(utils::parse_arithmetic<int>("42") == 42);
        CHECK_FALSE(utils::parse_arithmetic<int>("4x"));

        CHECK(utils::join_with_separator({"a", "b", "c"}, ", ") == "a, b, c");
        CHECK(utils::join_with_separator({}, ", ").empty());
        CHECK(utils::hash_hex("abc") == utils::hash_hex("abc"));
        CHECK(utils::hash_hex("abc") != utils::hash_hex("abd"));
    }

}  // namespace callsheet::test
