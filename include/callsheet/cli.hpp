#pragma once

#include "config.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>

namespace callsheet::cli {

    // nullopt: continue; otherwise the process exit code (2 for invalid input, 0 after a one-shot action).
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // Pipeline options persisted as JSON; unknown keys are ignored. Throws config_error.
    pipeline_config load_pipeline_config(const std::filesystem::path& path, pipeline_config base = {});

    void print_config(const startup_config& cfg, std::ostream& os);

    // Analyzes `cfg.script_path` once and renders the report; returns the exit code.
    int run_once(const startup_config& cfg, std::ostream& out, std::ostream& err);

    void run_jobs_console(const startup_config& cfg, std::istream& in, std::ostream& out, std::ostream& err);

}  // namespace callsheet::cli
