#pragma once

#include "schedule.hpp"
#include "types.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace callsheet {

    struct report_summary {
        int schema_version{};
        std::size_t scene_count{};
        std::size_t failure_count{};
        std::vector<std::string> scene_numbers{};
        std::size_t shooting_days{};
    };

    // JSON report (schema_version 1); `schedule` is emitted only when non-empty.
    std::string render_json(const breakdown_run& run, const std::vector<shooting_day>& schedule = {});

    void write_report(const std::filesystem::path& path, std::string_view json);

    // Reads back the top-level shape of a report; throws config_error on malformed input.
    report_summary parse_report_summary(std::string_view json);

    void print_table(std::ostream& os, const breakdown_run& run, bool color);
    void print_schedule(std::ostream& os, const std::vector<shooting_day>& schedule, bool color);

}  // namespace callsheet
