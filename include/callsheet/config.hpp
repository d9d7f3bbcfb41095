#pragma once

#include "log.hpp"
#include "utils.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace callsheet {

    using namespace std::string_view_literals;

    /*
     * Callsheet Config Options
     *
     * Pipeline (read-only inputs to the scene parser and job manager at construction)
     * - max_concurrent_jobs: Hard cap on jobs in the processing state; also the worker count.
     * - cache_ttl_seconds: Lifetime of a cached job result.
     * - enable_wardrobe_inference: Run the wardrobe engine after cast analysis.
     * - enable_legal_alerts: Run the celebrity/brand/music clearance scan.
     * - batch_size: Scenes analyzed concurrently before each continuity pass.
     * - max_eighths_per_day: Page budget of one shooting day in the schedule.
     *
     * Session and UX
     * - script_path: Screenplay file to analyze.
     * - config_path: JSON file holding persisted pipeline options.
     * - knowledge_path: JSON file extending the built-in knowledge base.
     * - output_path: Write the JSON report here instead of stdout.
     * - output_mode: "table" or "json".
     * - color_mode: ANSI color behavior for table output.
     * - quiet/verbose: Log threshold error or debug (default warn).
     *
     * One-shot actions
     * - print_config: Print resolved config and exit.
     * - print_schedule: Append the shooting schedule to the report.
     * - jobs_console: Start the interactive job console instead of a one-shot run.
     */

    enum class output_mode : uint8_t { table, json };
    enum class color_mode : uint8_t { automatic, always, never };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    enum class job_priority : uint8_t { low = 1, normal = 2, high = 3, urgent = 4, critical = 5 };

    inline constexpr int weight(job_priority priority) {
        return static_cast<int>(priority);
    }

    inline constexpr std::string_view to_string(job_priority priority) {
        switch (priority) {
            case job_priority::low:
                return "low"sv;
            case job_priority::normal:
                return "normal"sv;
            case job_priority::high:
                return "high"sv;
            case job_priority::urgent:
                return "urgent"sv;
            case job_priority::critical:
                return "critical"sv;
        }
        return "normal"sv;
    }

    // Accepts a name or a weight 1..5
    inline constexpr bool try_parse_priority(std::string_view text, job_priority& out) {
        for (auto p : {job_priority::low,
                       job_priority::normal,
                       job_priority::high,
                       job_priority::urgent,
                       job_priority::critical}) {
            if (utils::str_case_eq(text, to_string(p))) {
                out = p;
                return true;
            }
        }
        if (auto w = utils::parse_arithmetic<int>(text); w && *w >= 1 && *w <= 5) {
            out = static_cast<job_priority>(*w);
            return true;
        }
        return false;
    }

    enum class analysis_component : uint8_t {
        full_analysis,
        scene_breakdown,
        cast_analysis,
        prop_classification,
        wardrobe_inference,
        effects_analysis,
        legal_scan,
        cinematic_patterns,
        semantic_synopsis,
        continuity_check
    };

    inline constexpr std::array all_components{
            analysis_component::full_analysis,
            analysis_component::scene_breakdown,
            analysis_component::cast_analysis,
            analysis_component::prop_classification,
            analysis_component::wardrobe_inference,
            analysis_component::effects_analysis,
            analysis_component::legal_scan,
            analysis_component::cinematic_patterns,
            analysis_component::semantic_synopsis,
            analysis_component::continuity_check};

    inline constexpr std::string_view to_string(analysis_component component) {
        switch (component) {
            case analysis_component::full_analysis:
                return "full_analysis"sv;
            case analysis_component::scene_breakdown:
                return "scene_breakdown"sv;
            case analysis_component::cast_analysis:
                return "cast_analysis"sv;
            case analysis_component::prop_classification:
                return "prop_classification"sv;
            case analysis_component::wardrobe_inference:
                return "wardrobe_inference"sv;
            case analysis_component::effects_analysis:
                return "effects_analysis"sv;
            case analysis_component::legal_scan:
                return "legal_scan"sv;
            case analysis_component::cinematic_patterns:
                return "cinematic_patterns"sv;
            case analysis_component::semantic_synopsis:
                return "semantic_synopsis"sv;
            case analysis_component::continuity_check:
                return "continuity_check"sv;
        }
        return "full_analysis"sv;
    }

    inline constexpr bool try_parse_component(std::string_view text, analysis_component& out) {
        for (auto c : all_components) {
            if (utils::str_case_eq(text, to_string(c))) {
                out = c;
                return true;
            }
        }
        return false;
    }

    struct pipeline_config {
        std::size_t max_concurrent_jobs{2U};
        int cache_ttl_seconds{3'600};
        bool enable_wardrobe_inference{true};
        bool enable_legal_alerts{true};
        std::size_t batch_size{4U};
        int max_eighths_per_day{40};
    };

    struct startup_config {
        pipeline_config pipeline{};

        std::optional<std::filesystem::path> script_path{};
        std::optional<std::filesystem::path> config_path{};
        std::optional<std::filesystem::path> knowledge_path{};
        std::optional<std::filesystem::path> output_path{};
        output_mode output{output_mode::table};
        color_mode color{color_mode::automatic};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
        bool print_schedule{false};
        bool jobs_console{false};

        log_level effective_log_level() const {
            if (quiet) {
                return log_level::error;
            }
            if (verbose) {
                return log_level::debug;
            }
            return log_level::warn;
        }
    };

}  // namespace callsheet
