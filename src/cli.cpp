#include "callsheet/cli.hpp"

#include "callsheet/analyzers.hpp"
#include "callsheet/errors.hpp"
#include "callsheet/format.hpp"
#include "callsheet/job_manager.hpp"
#include "callsheet/knowledge.hpp"
#include "callsheet/log.hpp"
#include "callsheet/report.hpp"
#include "callsheet/schedule.hpp"
#include "callsheet/scene_parser.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

extern "C" {
#include <unistd.h>
}

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace callsheet::literals;

namespace callsheet::cli { namespace detail {

    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    struct persisted_config {
        int schema_version{1};
        std::size_t max_concurrent_jobs{};
        int cache_ttl_seconds{};
        bool enable_wardrobe_inference{true};
        bool enable_legal_alerts{true};
        std::size_t batch_size{};
        int max_eighths_per_day{};
    };

}}  // namespace callsheet::cli::detail

namespace glz {

    template <>
    struct meta<callsheet::cli::detail::persisted_config> {
        using T = callsheet::cli::detail::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "max_concurrent_jobs",
                       &T::max_concurrent_jobs,
                       "cache_ttl_seconds",
                       &T::cache_ttl_seconds,
                       "enable_wardrobe_inference",
                       &T::enable_wardrobe_inference,
                       "enable_legal_alerts",
                       &T::enable_legal_alerts,
                       "batch_size",
                       &T::batch_size,
                       "max_eighths_per_day",
                       &T::max_eighths_per_day);
    };

}  // namespace glz

namespace callsheet::cli {

    namespace detail {

        static constexpr auto version_string = "callsheet 0.1.0"sv;

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read {}"_format(path.string()));
            }
            return ss.str();
        }

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw config_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

        // Empty when `cfg` is usable; otherwise the first offending option.
        static std::optional<std::string> validate_pipeline(const pipeline_config& cfg) {
            if (cfg.max_concurrent_jobs == 0U) {
                return "max_concurrent_jobs must be at least 1";
            }
            if (cfg.batch_size == 0U) {
                return "batch_size must be at least 1";
            }
            if (cfg.cache_ttl_seconds < 0) {
                return "cache_ttl_seconds must not be negative";
            }
            if (cfg.max_eighths_per_day < 1) {
                return "max_eighths_per_day must be at least 1";
            }
            return std::nullopt;
        }

        static std::string_view optional_or_default(const std::optional<fs::path>& value, std::string& storage) {
            if (!value) {
                return "<none>"sv;
            }
            storage = value->string();
            return storage;
        }

        static bool resolve_color(color_mode mode) {
            switch (mode) {
                case color_mode::always:
                    return true;
                case color_mode::never:
                    return false;
                case color_mode::automatic:
                    break;
            }
            return ::isatty(STDOUT_FILENO) == 1;
        }

        static knowledge_base load_knowledge(const startup_config& cfg, const logger& log) {
            auto kb = knowledge_base::builtin();
            if (cfg.knowledge_path) {
                kb.merge(load_knowledge_file(*cfg.knowledge_path));
                log.info("loaded knowledge base extension {}"_format(cfg.knowledge_path->string()));
            }
            return kb;
        }

        static std::vector<std::string_view> split_words(std::string_view text) {
            std::vector<std::string_view> words{};
            while (true) {
                text = utils::trim_view(text);
                if (text.empty()) {
                    break;
                }
                auto end = text.find_first_of(" \t"sv);
                words.push_back(text.substr(0, end));
                if (end == std::string_view::npos) {
                    break;
                }
                text.remove_prefix(end);
            }
            return words;
        }

        static void print_help(std::ostream& os) {
            os << "commands:\n";
            os << "  :submit <file> [priority] [component]\n";
            os << "  :status <job>\n";
            os << "  :result <job>\n";
            os << "  :cancel <job>\n";
            os << "  :stats\n";
            os << "  :help\n";
            os << "  :quit\n";
            os << "priorities: low|normal|high|urgent|critical or 1..5\n";
            os << "components:";
            for (auto c : all_components) {
                os << ' ' << to_string(c);
            }
            os << '\n';
        }

        static void print_job_result(
                const job_result& result, const startup_config& cfg, bool color, std::ostream& out) {
            if (result.status == job_status::failed) {
                out << "failed: " << result.error.value_or("unknown error") << '\n';
                return;
            }
            if (result.status != job_status::completed || !result.result) {
                out << "no result, job is " << to_string(result.status) << '\n';
                return;
            }
            if (cfg.output == output_mode::json) {
                out << render_json(*result.result) << '\n';
                return;
            }
            if (result.cache_hit) {
                out << "(cached)\n";
            }
            print_table(out, *result.result, color);
        }

        struct console_state {
            const startup_config& cfg;
            job_manager& manager;
            bool color{false};
        };

        static void submit_command(
                console_state& state, const std::vector<std::string_view>& args, std::ostream& out, std::ostream& err) {
            if (args.empty() || args.size() > 3U) {
                err << "usage: :submit <file> [priority] [component]\n";
                return;
            }

            analysis_request request{};
            if (args.size() > 1U && !try_parse_priority(args[1], request.priority)) {
                err << "invalid priority: " << args[1] << " (expected low|normal|high|urgent|critical or 1..5)\n";
                return;
            }
            if (args.size() > 2U && !try_parse_component(args[2], request.component)) {
                err << "invalid component: " << args[2] << '\n';
                return;
            }

            try {
                request.text = read_text_file(fs::path{args[0]});
            } catch (const std::runtime_error& e) {
                err << e.what() << '\n';
                return;
            }

            auto id = state.manager.submit(std::move(request));
            auto status = state.manager.get_status(id);
            out << id << ' ' << to_string(status.status);
            if (status.queue_position) {
                out << " (queue position " << *status.queue_position << ')';
            }
            out << '\n';
        }

        static bool process_command(
                console_state& state, std::string_view line, std::ostream& out, std::ostream& err, bool& should_quit) {
            auto cmd = utils::trim_view(line);
            if (cmd.empty()) {
                return true;
            }
            if (!cmd.starts_with(':')) {
                err << "commands start with ':' (try :help)\n";
                return false;
            }

            auto words = split_words(cmd);
            auto name = words.front();
            std::vector<std::string_view> args(words.begin() + 1, words.end());

            if (name == ":quit"sv || name == ":q"sv) {
                should_quit = true;
                return true;
            }
            if (name == ":help"sv) {
                print_help(out);
                return true;
            }
            if (name == ":stats"sv) {
                auto s = state.manager.stats();
                out << ("  pending={}\n"
                        "  processing={}\n"
                        "  completed={}\n"
                        "  failed={}\n"
                        "  cancelled={}\n"
                        "  queue_length={}\n"
                        "  cache_entries={}\n"
                        "  cache_hits={}\n"_format(
                                s.pending,
                                s.processing,
                                s.completed,
                                s.failed,
                                s.cancelled,
                                s.queue_length,
                                s.cache_entries,
                                s.cache_hits));
                return true;
            }
            if (name == ":submit"sv) {
                submit_command(state, args, out, err);
                return true;
            }

            if (name != ":status"sv && name != ":result"sv && name != ":cancel"sv) {
                err << "unknown command: " << name << '\n';
                return false;
            }
            if (args.size() != 1U) {
                err << "usage: " << name << " <job>\n";
                return false;
            }

            try {
                if (name == ":status"sv) {
                    auto status = state.manager.get_status(args[0]);
                    out << args[0] << ' ' << to_string(status.status);
                    if (status.queue_position) {
                        out << " (queue position " << *status.queue_position << ')';
                    }
                    out << '\n';
                }
                else if (name == ":result"sv) {
                    print_job_result(state.manager.get_result(args[0]), state.cfg, state.color, out);
                }
                else if (state.manager.cancel(args[0])) {
                    out << args[0] << " cancelled\n";
                }
                else {
                    out << args[0] << " is not pending, not cancelled\n";
                }
            } catch (const job_not_found_error& e) {
                err << e.what() << '\n';
                return false;
            }
            return true;
        }

    }  // namespace detail

    pipeline_config load_pipeline_config(const std::filesystem::path& path, pipeline_config base) {
        detail::persisted_config data{};
        data.max_concurrent_jobs = base.max_concurrent_jobs;
        data.cache_ttl_seconds = base.cache_ttl_seconds;
        data.enable_wardrobe_inference = base.enable_wardrobe_inference;
        data.enable_legal_alerts = base.enable_legal_alerts;
        data.batch_size = base.batch_size;
        data.max_eighths_per_day = base.max_eighths_per_day;

        std::string json{};
        try {
            json = detail::read_text_file(path);
        } catch (const std::runtime_error& e) {
            throw config_error(e.what());
        }
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(data, json);
        if (ec) {
            throw config_error("failed to parse json file {}"_format(path.string()));
        }
        detail::validate_supported_schema_version(data.schema_version, path);

        base.max_concurrent_jobs = data.max_concurrent_jobs;
        base.cache_ttl_seconds = data.cache_ttl_seconds;
        base.enable_wardrobe_inference = data.enable_wardrobe_inference;
        base.enable_legal_alerts = data.enable_legal_alerts;
        base.batch_size = data.batch_size;
        base.max_eighths_per_day = data.max_eighths_per_day;

        if (auto problem = detail::validate_pipeline(base)) {
            throw config_error("{}: {}"_format(path.string(), *problem));
        }
        return base;
    }

    void print_config(const startup_config& cfg, std::ostream& os) {
        std::string script{}, config{}, knowledge{}, output_path{};
        os << ("  max_concurrent_jobs={}\n"
               "  cache_ttl_seconds={}\n"
               "  enable_wardrobe_inference={}\n"
               "  enable_legal_alerts={}\n"
               "  batch_size={}\n"
               "  max_eighths_per_day={}\n"
               "  script={}\n"
               "  config={}\n"
               "  knowledge={}\n"
               "  out={}\n"
               "  output={}\n"
               "  color={}\n"
               "  log_level={}\n"_format(
                       cfg.pipeline.max_concurrent_jobs,
                       cfg.pipeline.cache_ttl_seconds,
                       cfg.pipeline.enable_wardrobe_inference,
                       cfg.pipeline.enable_legal_alerts,
                       cfg.pipeline.batch_size,
                       cfg.pipeline.max_eighths_per_day,
                       detail::optional_or_default(cfg.script_path, script),
                       detail::optional_or_default(cfg.config_path, config),
                       detail::optional_or_default(cfg.knowledge_path, knowledge),
                       detail::optional_or_default(cfg.output_path, output_path),
                       to_string(cfg.output),
                       to_string(cfg.color),
                       to_string(cfg.effective_log_level())));
    }

    int run_once(const startup_config& cfg, std::ostream& out, std::ostream& err) {
        if (!cfg.script_path) {
            err << "no script given (pass a file or --jobs-console)\n";
            return 2;
        }

        auto log = logger::to_stream(err, cfg.effective_log_level());
        auto kb = detail::load_knowledge(cfg, log);
        auto text = detail::read_text_file(*cfg.script_path);

        scene_parser parser{cfg.pipeline, log, kb, analyzer_registry::defaults(cfg.pipeline)};
        breakdown_run run{};
        try {
            run = parser.analyze_document(text);
        } catch (const no_scenes_found_error& e) {
            err << cfg.script_path->string() << ": " << e.what() << '\n';
            return 1;
        }

        std::vector<shooting_day> schedule{};
        if (cfg.print_schedule) {
            schedule = build_schedule(run.scenes, cfg.pipeline.max_eighths_per_day);
        }

        if (cfg.output == output_mode::json || cfg.output_path) {
            auto json = render_json(run, schedule);
            if (cfg.output_path) {
                write_report(*cfg.output_path, json);
                log.info("wrote report to {}"_format(cfg.output_path->string()));
            }
            else {
                out << json << '\n';
            }
        }

        if (cfg.output == output_mode::table) {
            auto color = detail::resolve_color(cfg.color);
            print_table(out, run, color);
            if (cfg.print_schedule) {
                print_schedule(out, schedule, color);
            }
        }
        return 0;
    }

    void run_jobs_console(const startup_config& cfg, std::istream& in, std::ostream& out, std::ostream& err) {
        auto log = logger::to_stream(err, cfg.effective_log_level());
        auto kb = detail::load_knowledge(cfg, log);

        job_manager manager{cfg.pipeline, log, kb};
        manager.start();

        detail::console_state state{cfg, manager, detail::resolve_color(cfg.color)};
        std::string line{};
        bool should_quit = false;

        out << detail::version_string << " job console\n";
        out << "type :help for commands\n";

        while (!should_quit) {
            out << "callsheet> " << std::flush;
            if (!std::getline(in, line)) {
                out << '\n';
                break;
            }
            detail::process_command(state, line, out, err, should_quit);
        }

        manager.stop();
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"callsheet"};

        bool show_version = false;
        std::string script_arg{};
        std::string config_arg{};
        std::string knowledge_arg{};
        std::string out_arg{};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string color_arg{std::string{to_string(cfg.color)}};
        std::size_t max_jobs_arg{cfg.pipeline.max_concurrent_jobs};
        int cache_ttl_arg{cfg.pipeline.cache_ttl_seconds};
        std::size_t batch_size_arg{cfg.pipeline.batch_size};
        bool no_wardrobe = false;
        bool no_legal = false;

        app.add_option("script", script_arg, "Screenplay file to break down");
        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_option("--out", out_arg, "Write the JSON report to this file");
        app.add_option("--config", config_arg, "Pipeline config JSON file");
        app.add_option("--knowledge", knowledge_arg, "Knowledge base extension JSON file");
        app.add_option("--max-jobs", max_jobs_arg, "Maximum concurrently processing jobs");
        app.add_option("--cache-ttl", cache_ttl_arg, "Result cache lifetime in seconds");
        app.add_option("--batch-size", batch_size_arg, "Scenes analyzed concurrently per batch");
        app.add_flag("--no-wardrobe", no_wardrobe, "Disable wardrobe inference");
        app.add_flag("--no-legal", no_legal, "Disable legal clearance alerts");
        app.add_flag("--schedule", cfg.print_schedule, "Print the shooting schedule");
        app.add_flag("--jobs-console", cfg.jobs_console, "Start the interactive job console");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Only log errors");
        app.add_flag("--verbose", cfg.verbose, "Log debug detail");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{2};
        }

        if (show_version) {
            std::cout << detail::version_string << '\n';
            return std::optional<int>{0};
        }

        if (!config_arg.empty()) {
            cfg.config_path = config_arg;
            cfg.pipeline = load_pipeline_config(*cfg.config_path, cfg.pipeline);
        }
        if (app.get_option("--max-jobs")->count() > 0U) {
            cfg.pipeline.max_concurrent_jobs = max_jobs_arg;
        }
        if (app.get_option("--cache-ttl")->count() > 0U) {
            cfg.pipeline.cache_ttl_seconds = cache_ttl_arg;
        }
        if (app.get_option("--batch-size")->count() > 0U) {
            cfg.pipeline.batch_size = batch_size_arg;
        }
        if (no_wardrobe) {
            cfg.pipeline.enable_wardrobe_inference = false;
        }
        if (no_legal) {
            cfg.pipeline.enable_legal_alerts = false;
        }
        if (auto problem = detail::validate_pipeline(cfg.pipeline)) {
            std::cerr << "invalid option: " << *problem << '\n';
            return std::optional<int>{2};
        }

        if (!script_arg.empty()) {
            cfg.script_path = script_arg;
        }
        if (!knowledge_arg.empty()) {
            cfg.knowledge_path = knowledge_arg;
        }
        if (!out_arg.empty()) {
            cfg.output_path = out_arg;
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (!cfg.jobs_console && !cfg.script_path) {
            std::cerr << "no script given (pass a file or --jobs-console)\n";
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

}  // namespace callsheet::cli
