#include "callsheet/analyzers.hpp"

#include "callsheet/format.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <initializer_list>

using namespace callsheet::literals;

namespace callsheet {

    namespace detail {

        static constexpr int lines_per_eighth = 7;

        struct location_dressing {
            location_type type;
            std::array<std::string_view, 2> items;
        };

        static constexpr std::array location_dressings{
                location_dressing{location_type::office, {"desk"sv, "office chair"sv}},
                location_dressing{location_type::home, {"sofa"sv, "dining table"sv}},
                location_dressing{location_type::room, {"bed"sv, "bedside lamp"sv}},
                location_dressing{location_type::villa, {"luxury furniture"sv, "paintings"sv}},
                location_dressing{location_type::precinct, {"interrogation table"sv, "filing cabinets"sv}},
                location_dressing{location_type::hospital, {"hospital bed"sv, "medical monitors"sv}},
                location_dressing{location_type::station, {"broadcast equipment"sv, "studio lights"sv}}};

        static bool has_label(const std::vector<term_pattern>& vocabulary,
                              std::string_view text,
                              std::initializer_list<std::string_view> labels) {
            return std::ranges::any_of(vocabulary, [&](const term_pattern& term) {
                return std::ranges::find(labels, std::string_view{term.label}) != labels.end() && term.search(text);
            });
        }

    }  // namespace detail

    int page_eighths(std::string_view text) {
        auto lines = utils::split_lines(text);
        auto content = std::ranges::count_if(lines, [](const std::string& l) { return !utils::trim_view(l).empty(); });
        auto eighths = static_cast<int>(std::ceil(static_cast<double>(content) / detail::lines_per_eighth));
        return std::max(1, eighths);
    }

    double estimate_shoot_hours(int eighths, std::size_t cast_size, int_ext setting, bool special_requirements) {
        double hours = eighths * 0.25;
        if (cast_size > 3U) {
            hours *= 1.3;
        }
        if (setting == int_ext::exterior) {
            hours *= 1.2;
        }
        if (special_requirements) {
            hours *= 1.5;
        }
        return std::round(hours * 10.0) / 10.0;
    }

    production_result analyze_production(const scene_context& ctx, const breakdown& so_far) {
        production_result out{};
        const auto& patterns = ctx.patterns;
        auto text = ctx.text();

        auto existing = so_far.all_items();
        auto location = classify_location(ctx.header.location);
        for (const auto& dressing : detail::location_dressings) {
            if (dressing.type != location) {
                continue;
            }
            for (auto item : dressing.items) {
                if (std::ranges::find(existing, item) == existing.end()) {
                    out.set_dressing.emplace_back(item);
                }
            }
        }

        if (detail::has_label(patterns.effects, text, {"explosion"sv, "fire"sv, "smoke"sv})) {
            out.special_requirements.emplace_back("Special effects: explosion, fire or smoke");
        }
        if (std::ranges::any_of(patterns.stunts, [&](const term_pattern& t) { return t.search(text); })) {
            out.special_requirements.emplace_back("Stunt coordinator required");
        }
        if (detail::has_label(patterns.effects, text, {"rain"sv, "snow"sv, "wind"sv, "fog"sv, "lightning"sv})) {
            out.special_requirements.emplace_back("Weather effects");
        }
        if (detail::has_label(patterns.effects, text, {"blood"sv})) {
            out.special_requirements.emplace_back("SFX makeup");
        }

        if (ctx.header.time == time_of_day::night) {
            out.production_notes.emplace_back("Night shoot: additional lighting and crew turnaround");
        }
        if (ctx.header.interior_exterior == int_ext::exterior) {
            out.production_notes.emplace_back("Exterior: prepare a weather contingency");
        }
        if (so_far.cast.size() > 5U) {
            out.production_notes.emplace_back("Group scene: schedule extra time for blocking");
        }
        if (!so_far.extras.empty()) {
            out.production_notes.push_back(
                    "Background extras: {}"_format(utils::join_with_separator(so_far.extras, ", "sv)));
        }
        if (!so_far.vehicles.empty()) {
            out.production_notes.emplace_back("Vehicles on camera: car rig and picture-car coordinator");
        }
        if (regex_found(patterns.sensitive_institutions, text)) {
            out.production_notes.emplace_back("Sensitive institution named: legal review of depiction");
        }

        out.page_eighths = page_eighths(text);
        out.estimated_shoot_hours = estimate_shoot_hours(
                out.page_eighths,
                so_far.cast.size(),
                ctx.header.interior_exterior,
                !out.special_requirements.empty());
        return out;
    }

}  // namespace callsheet
