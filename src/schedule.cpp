#include "callsheet/schedule.hpp"

#include "callsheet/format.hpp"

#include <cmath>

namespace callsheet {

    using namespace callsheet::literals;

    std::vector<shooting_day> build_schedule(const std::vector<breakdown>& scenes, int max_eighths_per_day) {
        std::vector<shooting_day> days{};
        shooting_day current{};

        for (const auto& scene : scenes) {
            if (!current.scenes.empty() && current.total_eighths + scene.page_eighths > max_eighths_per_day) {
                days.push_back(std::move(current));
                current = shooting_day{};
                current.day_number = static_cast<int>(days.size()) + 1;
            }
            current.scenes.push_back(scene.scene_number);
            current.total_eighths += scene.page_eighths;
            current.total_hours = std::round((current.total_hours + scene.estimated_shoot_hours) * 10.0) / 10.0;
        }

        if (!current.scenes.empty()) {
            days.push_back(std::move(current));
        }
        return days;
    }

    std::string format_eighths(int eighths) {
        auto pages = eighths / 8;
        auto rest = eighths % 8;
        if (pages == 0) {
            return "{}/8"_format(rest);
        }
        if (rest == 0) {
            return "{}"_format(pages);
        }
        return "{} {}/8"_format(pages, rest);
    }

}  // namespace callsheet
