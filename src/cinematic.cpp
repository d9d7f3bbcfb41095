#include "callsheet/analyzers.hpp"

#include "callsheet/format.hpp"

#include <algorithm>

using namespace callsheet::literals;

namespace callsheet {

    namespace detail {

        static bool fires(const cinematic_pattern& pattern, std::string_view text) {
            auto matched = std::ranges::count_if(pattern.triggers, [&](const std::regex& re) { return regex_found(re, text); });
            auto required = pattern.triggers.empty() ? std::size_t{1} : pattern.triggers.size() - 1U;
            return static_cast<std::size_t>(matched) >= std::max<std::size_t>(required, 1U);
        }

        static std::string lighting_note(const scene_header& header) {
            auto setting = header.interior_exterior == int_ext::exterior ? "exterior"sv : "interior"sv;
            auto light = header.time == time_of_day::night ? "night"sv : "day"sv;
            return "Standard coverage, {} {} lighting"_format(setting, light);
        }

    }  // namespace detail

    cinematic_note match_cinematic(const scene_context& ctx) {
        for (const auto& pattern : ctx.patterns.cinematic) {
            if (detail::fires(pattern, ctx.text())) {
                return cinematic_note{pattern.name, pattern.production_note, pattern.camera_note};
            }
        }

        switch (ctx.type) {
            case scene_type::dialogue_heavy:
                return cinematic_note{
                        std::nullopt, "Dialogue coverage: master, singles and reverses", "Shot/reverse-shot at eye level"};
            case scene_type::action:
                return cinematic_note{std::nullopt,
                                      "Action coverage: rehearse blocking with safety on set",
                                      "Wide master plus handheld inserts"};
            case scene_type::confrontation:
                return cinematic_note{std::nullopt,
                                      "Confrontation: build tension through tightening framing",
                                      "Progressively closer singles as the conflict escalates"};
            default:
                break;
        }
        return cinematic_note{std::nullopt, "Continuity review", detail::lighting_note(ctx.header)};
    }

}  // namespace callsheet
