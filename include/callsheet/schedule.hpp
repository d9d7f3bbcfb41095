#pragma once

#include "types.hpp"

#include <string>
#include <vector>

namespace callsheet {

    struct shooting_day {
        int day_number{1};
        std::vector<std::string> scenes{};
        int total_eighths{};
        double total_hours{};
    };

    /// Packs breakdowns, in order, into days of at most `max_eighths_per_day` eighths. A scene longer than
    /// the budget gets a day of its own.
    std::vector<shooting_day> build_schedule(const std::vector<breakdown>& scenes, int max_eighths_per_day = 40);

    // "1 3/8" style page count for a number of eighths.
    std::string format_eighths(int eighths);

}  // namespace callsheet
