#include "utils.hpp"

#include "callsheet/cli.hpp"

#include <vector>

namespace callsheet::test {

    namespace detail {
        std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }
    }  // namespace detail

    TEST_CASE("002: parse_cli accepts startup options", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{
                "callsheet",
                "--output",
                "json",
                "--out",
                "/tmp/callsheet_tests/report.json",
                "--max-jobs",
                "3",
                "--cache-ttl",
                "120",
                "--batch-size",
                "8",
                "--no-legal",
                "--schedule",
                "--color",
                "never",
                "--verbose",
                "script.txt"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.output == output_mode::json);
        REQUIRE(cfg.output_path);
        CHECK(*cfg.output_path == "/tmp/callsheet_tests/report.json");
        REQUIRE(cfg.script_path);
        CHECK(*cfg.script_path == "script.txt");
        CHECK(cfg.pipeline.max_concurrent_jobs == 3U);
        CHECK(cfg.pipeline.cache_ttl_seconds == 120);
        CHECK(cfg.pipeline.batch_size == 8U);
        CHECK(cfg.pipeline.enable_wardrobe_inference);
        CHECK_FALSE(cfg.pipeline.enable_legal_alerts);
        CHECK(cfg.print_schedule);
        CHECK(cfg.color == color_mode::never);
        CHECK(cfg.effective_log_level() == log_level::debug);
    }

    TEST_CASE("002: parse_cli rejects invalid startup combos", "[002][cli]") {
        SECTION("quiet and verbose cannot be combined") {
            startup_config cfg{};
            std::vector<std::string> args{"callsheet", "--quiet", "--verbose", "script.txt"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("unknown output mode is rejected") {
            startup_config cfg{};
            std::vector<std::string> args{"callsheet", "--output", "yaml", "script.txt"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("zero workers is rejected") {
            startup_config cfg{};
            std::vector<std::string> args{"callsheet", "--max-jobs", "0", "script.txt"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("a script or the job console is required") {
            startup_config cfg{};
            std::vector<std::string> args{"callsheet"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }
    }

    TEST_CASE("002: one-shot actions exit with zero", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{"callsheet", "--print-config"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        REQUIRE(result);
        CHECK(*result == 0);

        std::ostringstream os{};
        cli::print_config(cfg, os);
        CHECK(os.str().find("batch_size=4") != std::string::npos);
        CHECK(os.str().find("script=<none>") != std::string::npos);
    }

    TEST_CASE("002: config file values sit under explicit flags", "[002][cli]") {
        auto path = test::detail::write_temp_file(
                "pipeline.json",
                R"({"schema_version":1,"max_concurrent_jobs":3,"batch_size":2,"enable_wardrobe_inference":false,"theme":"dark"})");

        startup_config cfg{};
        std::vector<std::string> args{"callsheet", "--config", path.string(), "--batch-size", "5", "--jobs-console"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.jobs_console);
        CHECK(cfg.pipeline.max_concurrent_jobs == 3U);
        CHECK(cfg.pipeline.batch_size == 5U);
        CHECK_FALSE(cfg.pipeline.enable_wardrobe_inference);
        CHECK(cfg.pipeline.cache_ttl_seconds == 3'600);
    }

    TEST_CASE("002: malformed config files are fatal", "[002][cli]") {
        SECTION("newer schema") {
            auto path = test::detail::write_temp_file("future.json", R"({"schema_version":2})");
            CHECK_THROWS_AS(cli::load_pipeline_config(path), config_error);
        }

        SECTION("not json") {
            auto path = test::detail::write_temp_file("broken.json", "max_concurrent_jobs = 3");
            CHECK_THROWS_AS(cli::load_pipeline_config(path), config_error);
        }

        SECTION("invalid value") {
            auto path = test::detail::write_temp_file("zero.json", R"({"batch_size":0})");
            CHECK_THROWS_AS(cli::load_pipeline_config(path), config_error);
        }

        SECTION("missing file") {
            CHECK_THROWS_AS(cli::load_pipeline_config("/nonexistent/callsheet/config.json"), config_error);
        }
    }

    TEST_CASE("002: run_once renders a json report", "[002][cli]") {
        auto script = test::detail::write_temp_file("two_scenes.txt", test::detail::two_scene_script);

        startup_config cfg{};
        cfg.script_path = script;
        cfg.output = output_mode::json;
        cfg.quiet = true;

        std::ostringstream out{}, err{};
        CHECK(cli::run_once(cfg, out, err) == 0);

        auto summary = parse_report_summary(out.str());
        CHECK(summary.schema_version == 1);
        CHECK(summary.scene_count == 2U);
        CHECK(summary.scene_numbers == std::vector<std::string>{"1", "2"});
    }

    TEST_CASE("002: job console drives the job manager", "[002][cli]") {
        auto script = test::detail::write_temp_file("console_scenes.txt", test::detail::two_scene_script);

        startup_config cfg{};
        cfg.quiet = true;
        cfg.color = color_mode::never;

        std::istringstream in{":submit " + script.string() + " high cast_analysis\n"
                              ":status job-99\n"
                              ":bogus\n"
                              ":stats\n"
                              ":quit\n"};
        std::ostringstream out{}, err{};
        cli::run_jobs_console(cfg, in, out, err);

        CHECK(out.str().find("job-1") != std::string::npos);
        CHECK(out.str().find("queue_length=") != std::string::npos);
        CHECK(err.str().find("unknown job id: 'job-99'") != std::string::npos);
        CHECK(err.str().find("unknown command: :bogus") != std::string::npos);
    }

}  // namespace callsheet::test
