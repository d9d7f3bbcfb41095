#include "callsheet/scene.hpp"

#include "callsheet/errors.hpp"
#include "callsheet/format.hpp"

#include <algorithm>
#include <array>

using namespace callsheet::literals;

namespace callsheet {

    namespace detail {

        using namespace std::string_view_literals;

        // Header tokens that classify a scene rather than name its location.
        static constexpr std::array classifier_tokens{
                "int"sv,      "interior"sv, "ext"sv,      "exterior"sv, "int/ext"sv,   "ext/int"sv,
                "i/e"sv,      "day"sv,      "night"sv,    "morning"sv,  "afternoon"sv, "evening"sv,
                "dawn"sv,     "dusk"sv,     "noon"sv,     "midnight"sv, "continuous"sv, "later"sv,
                "داخلي"sv,    "داخلى"sv,    "خارجي"sv,    "خارجى"sv,    "ليل"sv,       "ليلا"sv,
                "ليلاً"sv,    "نهار"sv,     "نهارا"sv,    "نهاراً"sv,    "صباح"sv,      "صباحا"sv,
                "مساء"sv,     "مساءً"sv,     "فجر"sv,      "/"sv};

        static bool is_classifier_token(std::string_view token) {
            while (!token.empty() && (token.back() == '.' || token.back() == ',' || token.back() == ':')) {
                token.remove_suffix(1);
            }
            while (!token.empty() && token.front() == '.') {
                token.remove_prefix(1);
            }
            if (token.empty()) {
                return true;
            }
            return std::ranges::any_of(classifier_tokens, [&](std::string_view t) { return utils::str_case_eq(token, t); });
        }

        static bool is_separator_at(std::string_view text, std::size_t i, std::size_t& width) {
            static constexpr std::array separators{"-"sv, "|"sv, ":"sv, "\xE2\x80\x93"sv, "\xE2\x80\x94"sv};
            for (auto sep : separators) {
                if (text.substr(i).starts_with(sep)) {
                    width = sep.size();
                    return true;
                }
            }
            return false;
        }

        static std::vector<std::string> split_on_separators(std::string_view text) {
            std::vector<std::string> parts{};
            std::string current{};
            for (std::size_t i = 0; i < text.size();) {
                std::size_t width = 0;
                if (is_separator_at(text, i, width)) {
                    parts.push_back(std::move(current));
                    current.clear();
                    i += width;
                    continue;
                }
                current.push_back(text[i]);
                ++i;
            }
            parts.push_back(std::move(current));
            return parts;
        }

        static std::string strip_classifiers(std::string_view part) {
            std::vector<std::string> kept{};
            std::string word{};
            auto flush = [&] {
                if (!word.empty() && !is_classifier_token(word)) {
                    kept.push_back(word);
                }
                word.clear();
            };
            for (char c : part) {
                if (c == ' ' || c == '\t') {
                    flush();
                    continue;
                }
                word.push_back(c);
            }
            flush();
            return utils::join_with_separator(kept, " "sv);
        }

        static std::string_view first_line(std::string_view text) {
            auto end = text.find('\n');
            auto line = end == std::string_view::npos ? text : text.substr(0, end);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            return line;
        }

        static std::string second_nonempty_line(std::string_view text) {
            auto lines = utils::split_lines(text);
            for (std::size_t i = 1; i < lines.size(); ++i) {
                if (auto t = utils::trim_view(lines[i]); !t.empty()) {
                    return std::string{t};
                }
            }
            return {};
        }

    }  // namespace detail

    std::vector<scene_block> split_scenes(std::string_view text, const pattern_library& patterns) {
        auto lines = utils::split_lines(text);

        struct pending_block {
            uint64_t ordinal{};
            scene_block block{};
        };
        std::vector<pending_block> blocks{};

        for (const auto& line : lines) {
            std::smatch m{};
            if (std::regex_search(line, m, patterns.scene_marker)) {
                auto number = utils::normalize_digits(m[1].str());
                auto ordinal = utils::parse_arithmetic<uint64_t>(number);
                if (ordinal) {
                    pending_block next{};
                    next.ordinal = *ordinal;
                    next.block.scene_number = std::to_string(*ordinal);
                    next.block.raw_text = line;
                    blocks.push_back(std::move(next));
                    continue;
                }
            }
            if (blocks.empty()) {
                continue;
            }
            auto& raw = blocks.back().block.raw_text;
            raw.push_back('\n');
            raw += line;
        }

        if (blocks.empty()) {
            throw no_scenes_found_error("no scene markers found in document");
        }

        std::ranges::stable_sort(blocks, {}, &pending_block::ordinal);

        std::vector<scene_block> out{};
        out.reserve(blocks.size());
        for (auto& b : blocks) {
            out.push_back(std::move(b.block));
        }
        return out;
    }

    uint64_t scene_ordinal(const scene_block& block) {
        auto parsed = utils::parse_arithmetic<uint64_t>(block.scene_number);
        if (!parsed) {
            throw scene_parse_error("scene number is not numeric: '{}'"_format(block.scene_number));
        }
        return *parsed;
    }

    std::string extract_location(std::string_view header_line, const pattern_library& patterns) {
        std::string remainder{header_line};
        std::smatch m{};
        if (std::regex_search(remainder, m, patterns.scene_marker)) {
            remainder = m[2].str();
        }

        std::vector<std::string> parts{};
        for (const auto& part : detail::split_on_separators(remainder)) {
            auto cleaned = detail::strip_classifiers(part);
            if (!cleaned.empty()) {
                parts.push_back(std::move(cleaned));
            }
        }
        return utils::join_with_separator(parts, " - "sv);
    }

    scene_header parse_header(const scene_block& block, const pattern_library& patterns) {
        scene_header header{};
        auto header_line = detail::first_line(block.raw_text);

        bool has_interior = regex_found(patterns.interior, header_line);
        bool has_exterior = regex_found(patterns.exterior, header_line);
        header.interior_exterior = (has_exterior && !has_interior) ? int_ext::exterior : int_ext::interior;

        if (regex_found(patterns.night, header_line)) {
            header.time = time_of_day::night;
        }
        else if (regex_found(patterns.day, header_line)) {
            header.time = time_of_day::day;
        }
        else if (regex_found(patterns.night, block.raw_text)) {
            header.time = time_of_day::night;
        }

        auto location = extract_location(header_line, patterns);
        if (utils::utf8_length(location) <= 3U) {
            location = detail::second_nonempty_line(block.raw_text);
        }
        if (location.empty()) {
            location = "unspecified";
        }
        header.location = std::move(location);
        return header;
    }

    bool is_dialogue_line(std::string_view line, const pattern_library& patterns) {
        if (regex_found(patterns.scene_marker, line)) {
            return false;
        }
        std::cmatch m{};
        if (!std::regex_search(line.data(), line.data() + line.size(), m, patterns.dialogue_cue)) {
            return false;
        }
        // a cue is a short speaker label, not a sentence that happens to contain a colon
        auto speaker = utils::trim_view(std::string_view{m[1].first, m[1].second});
        return !speaker.empty() && std::ranges::count(speaker, ' ') <= 3;
    }

    std::size_t count_dialogue_lines(std::string_view text, const pattern_library& patterns) {
        std::size_t count = 0;
        for (const auto& line : utils::split_lines(text)) {
            if (is_dialogue_line(line, patterns)) {
                ++count;
            }
        }
        return count;
    }

    scene_type classify_scene_type(std::string_view text, const pattern_library& patterns) {
        std::size_t content_lines = 0;
        std::size_t dialogue_lines = 0;
        for (const auto& line : utils::split_lines(text)) {
            if (utils::trim_view(line).empty() || regex_found(patterns.scene_marker, line)) {
                continue;
            }
            ++content_lines;
            if (is_dialogue_line(line, patterns)) {
                ++dialogue_lines;
            }
        }

        double dialogue_ratio =
                content_lines == 0 ? 0.0 : static_cast<double>(dialogue_lines) / static_cast<double>(content_lines);
        if (dialogue_ratio > 0.4) {
            return regex_found(patterns.conflict, text) ? scene_type::confrontation : scene_type::dialogue_heavy;
        }
        if (regex_found(patterns.discovery, text)) {
            return scene_type::discovery;
        }
        auto action_hits = std::ranges::count_if(patterns.action_verbs, [&](const term_pattern& p) { return p.search(text); });
        if (action_hits >= 2) {
            return scene_type::action;
        }
        if (regex_found(patterns.emotion, text)) {
            return scene_type::emotional;
        }
        return scene_type::transitional;
    }

}  // namespace callsheet
