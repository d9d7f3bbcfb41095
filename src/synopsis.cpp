#include "callsheet/analyzers.hpp"

#include "callsheet/scene.hpp"

#include <array>
#include <optional>

namespace callsheet {

    namespace detail {

        static constexpr std::size_t max_synopsis_length = 250U;
        static constexpr std::size_t excerpt_budget = 200U;
        static constexpr std::size_t min_excerpt_line = 15U;

        struct synopsis_slots {
            std::optional<std::string> char1{};
            std::optional<std::string> char2{};
            std::optional<std::string> character{};
            std::optional<std::string> action{};
            std::optional<std::string> discovery{};
            std::optional<std::string> object{};
            std::optional<std::string> location_detail{};
            std::optional<std::string> emotion{};
            std::optional<std::string> topic{};
            std::optional<std::string> location{};

            const std::optional<std::string>* lookup(std::string_view key) const {
                if (key == "char1"sv)
                    return &char1;
                if (key == "char2"sv)
                    return &char2;
                if (key == "character"sv)
                    return &character;
                if (key == "action"sv)
                    return &action;
                if (key == "discovery"sv)
                    return &discovery;
                if (key == "object"sv)
                    return &object;
                if (key == "location_detail"sv)
                    return &location_detail;
                if (key == "emotion"sv)
                    return &emotion;
                if (key == "topic"sv)
                    return &topic;
                if (key == "location"sv)
                    return &location;
                return nullptr;
            }
        };

        struct synopsis_templates {
            scene_type type;
            std::array<std::string_view, 3> templates;
        };

        // Tried in order; an empty slot ends the list.
        static constexpr std::array templates{
                synopsis_templates{scene_type::dialogue_heavy,
                                   {"{location}: {char1} and {char2} discuss {topic}"sv,
                                    "{char1} and {char2} discuss {topic}"sv,
                                    "{character} talks about {topic}"sv}},
                synopsis_templates{scene_type::confrontation,
                                   {"{char1} confronts {char2} over {topic}"sv,
                                    "Tension erupts between {char1} and {char2}"sv,
                                    "{character} confronts someone over {topic}"sv}},
                synopsis_templates{scene_type::discovery,
                                   {"{character} {discovery} {object} {location_detail}"sv,
                                    "{character} {discovery} {object}"sv,
                                    "{location}: {character} {discovery} something unexpected"sv}},
                synopsis_templates{scene_type::action,
                                   {"{location}: {character} {action}"sv, "{character} {action}"sv, ""sv}},
                synopsis_templates{scene_type::emotional,
                                   {"{location}: {character} struggles with {emotion}"sv,
                                    "{character} is overwhelmed by {emotion}"sv,
                                    ""sv}},
                synopsis_templates{scene_type::transitional,
                                   {"{location}: {character} {action}"sv,
                                    "{character} {action}"sv,
                                    "Transition to {location}"sv}}};

        static std::optional<std::string> first_label(const std::vector<term_pattern>& vocabulary, std::string_view text) {
            for (const auto& term : vocabulary) {
                if (term.search(text)) {
                    return term.label;
                }
            }
            return std::nullopt;
        }

        static std::optional<std::string> find_topic(const scene_context& ctx) {
            std::string spoken{};
            for (const auto& line : utils::split_lines(ctx.text())) {
                if (!is_dialogue_line(line, ctx.patterns)) {
                    continue;
                }
                auto colon = line.find(':');
                spoken += line.substr(colon + 1U);
                spoken.push_back('\n');
            }
            if (spoken.empty()) {
                return std::nullopt;
            }
            if (auto topic = first_label(ctx.patterns.topics, spoken)) {
                return topic;
            }
            return std::string{"a private matter"};
        }

        static synopsis_slots extract_slots(const scene_context& ctx, const std::vector<std::string>& cast) {
            synopsis_slots slots{};
            if (!cast.empty()) {
                slots.char1 = cast[0];
                slots.character = cast[0];
            }
            if (cast.size() > 1U) {
                slots.char2 = cast[1];
            }
            slots.action = first_label(ctx.patterns.action_verbs, ctx.text());
            slots.discovery = first_label(ctx.patterns.discovery_verbs, ctx.text());
            slots.object = first_label(ctx.patterns.discovered_objects, ctx.text());
            slots.location_detail = first_label(ctx.patterns.location_details, ctx.text());
            slots.emotion = first_label(ctx.patterns.emotions, ctx.text());
            slots.topic = find_topic(ctx);
            if (ctx.header.location != "unspecified"sv) {
                slots.location = ctx.header.location;
            }
            return slots;
        }

        static std::optional<std::string> fill(std::string_view tmpl, const synopsis_slots& slots) {
            std::string out{};
            std::size_t pos = 0;
            while (pos < tmpl.size()) {
                auto open = tmpl.find('{', pos);
                if (open == std::string_view::npos) {
                    out += tmpl.substr(pos);
                    break;
                }
                auto close = tmpl.find('}', open);
                if (close == std::string_view::npos) {
                    return std::nullopt;
                }
                out += tmpl.substr(pos, open - pos);
                const auto* slot = slots.lookup(tmpl.substr(open + 1U, close - open - 1U));
                if (slot == nullptr || !*slot) {
                    return std::nullopt;
                }
                out += **slot;
                pos = close + 1U;
            }
            return out;
        }

        static std::string truncate(std::string text) {
            if (utils::utf8_length(text) <= max_synopsis_length) {
                return text;
            }
            std::string out{utils::utf8_prefix(text, max_synopsis_length - 3U)};
            out += "...";
            return out;
        }

    }  // namespace detail

    std::string excerpt_summary(std::string_view text, const pattern_library& patterns) {
        auto lines = utils::split_lines(text);
        std::string excerpt{};
        for (std::size_t i = 1; i < lines.size(); ++i) {
            auto line = utils::trim_view(lines[i]);
            if (utils::utf8_length(line) < detail::min_excerpt_line || is_dialogue_line(line, patterns)) {
                continue;
            }
            if (!excerpt.empty()) {
                excerpt.push_back(' ');
            }
            excerpt += line;
            if (utils::utf8_length(excerpt) > detail::excerpt_budget) {
                break;
            }
        }
        return detail::truncate(std::move(excerpt));
    }

    std::string generate_synopsis(const scene_context& ctx, const std::vector<std::string>& cast) {
        auto slots = detail::extract_slots(ctx, cast);
        for (const auto& group : detail::templates) {
            if (group.type != ctx.type) {
                continue;
            }
            for (auto tmpl : group.templates) {
                if (tmpl.empty()) {
                    break;
                }
                if (auto filled = detail::fill(tmpl, slots)) {
                    return *filled;
                }
            }
        }
        return excerpt_summary(ctx.text(), ctx.patterns);
    }

    std::string refine_synopsis(std::string synopsis) {
        auto text = utils::collapse_whitespace(synopsis);
        if (text.empty()) {
            return "Synopsis unavailable.";
        }
        text.front() = utils::char_toupper(text.front());
        if (!text.ends_with('.') && !text.ends_with('!') && !text.ends_with('?') && !text.ends_with("\u061F")) {
            text.push_back('.');
        }
        return detail::truncate(std::move(text));
    }

}  // namespace callsheet
