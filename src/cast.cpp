#include "callsheet/analyzers.hpp"

#include <algorithm>
#include <array>

namespace callsheet {

    namespace detail {

        static constexpr std::array non_names{
                "scene"sv,    "int"sv,     "ext"sv,      "cut to"sv,    "fade in"sv,  "fade out"sv, "dissolve to"sv,
                "note"sv,     "continued"sv, "later"sv,  "the end"sv,   "title"sv,    "super"sv,    "intercut"sv,
                "he"sv,       "she"sv,     "they"sv,     "it"sv,        "we"sv,       "i"sv,        "you"sv,
                "مشهد"sv,     "داخلي"sv,   "خارجي"sv,    "ليل"sv,       "نهار"sv,     "قطع"sv,      "ملاحظة"sv,
                "إلى"sv,      "الى"sv,     "من"sv,       "في"sv,        "على"sv,      "ببطء"sv,     "مسرعا"sv,
                "مسرعة"sv,    "و"sv};

        // Sentence openers that a capitalized-run match can drag in before the actual name.
        static constexpr std::array leading_words{
                "the"sv,  "then"sv, "suddenly"sv, "finally"sv, "meanwhile"sv, "when"sv, "as"sv,
                "and"sv,  "but"sv,  "later"sv,    "now"sv,     "slowly"sv,    "quickly"sv, "he"sv,
                "she"sv,  "they"sv, "it"sv,       "we"sv,      "a"sv,         "an"sv};

        static bool in_set(std::string_view word, auto const& set) {
            return std::ranges::any_of(set, [&](std::string_view w) { return utils::str_case_eq(word, w); });
        }

        static std::string strip_parentheticals(std::string_view text) {
            std::string out{};
            int depth = 0;
            for (char c : text) {
                if (c == '(') {
                    ++depth;
                    continue;
                }
                if (c == ')') {
                    depth = std::max(0, depth - 1);
                    continue;
                }
                if (depth == 0) {
                    out.push_back(c);
                }
            }
            return out;
        }

        static std::string clean_candidate(std::string_view raw) {
            auto name = utils::collapse_whitespace(strip_parentheticals(raw));
            // trailing ASCII punctuation and the Arabic comma
            while (!name.empty()) {
                if (name.back() == '.' || name.back() == ',' || name.back() == ';' || name.back() == '!') {
                    name.pop_back();
                    continue;
                }
                if (name.ends_with("\xD8\x8C")) {
                    name.resize(name.size() - 2U);
                    continue;
                }
                break;
            }
            return utils::trim(name);
        }

        static std::vector<std::string> tokens_of(std::string_view name) {
            std::vector<std::string> tokens{};
            std::string token{};
            for (char c : name) {
                if (c == ' ') {
                    if (!token.empty()) {
                        tokens.push_back(std::move(token));
                    }
                    token.clear();
                    continue;
                }
                token.push_back(c);
            }
            if (!token.empty()) {
                tokens.push_back(std::move(token));
            }
            return tokens;
        }

        static std::string drop_leading_words(std::string_view name) {
            auto tokens = tokens_of(name);
            auto first = std::ranges::find_if(tokens, [](const std::string& t) { return !in_set(t, leading_words); });
            return utils::join_with_separator(std::vector<std::string>(first, tokens.end()), " "sv);
        }

        static bool is_valid_name(std::string_view name) {
            if (utils::utf8_length(name) < 2U) {
                return false;
            }
            if (tokens_of(name).size() > 3U) {
                return false;
            }
            bool alphabetic = std::ranges::all_of(name, [](char c) {
                return utils::is_ascii_alpha(c) || utils::is_non_ascii(c) || c == ' ' || c == '\'' || c == '-';
            });
            if (!alphabetic) {
                return false;
            }
            return !in_set(name, non_names) && !in_set(tokens_of(name).front(), std::array{"scene"sv, "مشهد"sv});
        }

        static void append_name(std::vector<std::string>& names, std::string candidate) {
            if (!is_valid_name(candidate)) {
                return;
            }
            bool seen = std::ranges::any_of(names, [&](const std::string& n) { return utils::str_case_eq(n, candidate); });
            if (!seen) {
                names.push_back(std::move(candidate));
            }
        }

    }  // namespace detail

    std::vector<std::string> extract_cast_names(std::string_view text, const pattern_library& patterns) {
        std::vector<std::string> names{};

        for (const auto& line : utils::split_lines(text)) {
            if (regex_found(patterns.scene_marker, line)) {
                continue;
            }

            std::smatch cue{};
            if (std::regex_search(line, cue, patterns.dialogue_cue)) {
                detail::append_name(names, detail::clean_candidate(cue[1].str()));
            }

            for (std::sregex_iterator it{line.begin(), line.end(), patterns.stage_direction}, end{}; it != end; ++it) {
                auto candidate = detail::drop_leading_words(detail::clean_candidate((*it)[1].str()));
                if (!candidate.empty()) {
                    detail::append_name(names, std::move(candidate));
                }
            }

            for (std::sregex_iterator it{line.begin(), line.end(), patterns.stage_direction_localized}, end{}; it != end;
                 ++it) {
                detail::append_name(names, detail::clean_candidate((*it)[1].str()));
            }
        }
        return names;
    }

    cast_result analyze_cast(const scene_context& ctx) {
        cast_result out{};
        for (const auto& raw : ctx.raw_cast) {
            auto profile = ctx.characters.resolve(raw);
            const auto& name = profile->canonical_name;
            bool seen = std::ranges::any_of(out.cast, [&](const std::string& n) { return utils::str_case_eq(n, name); });
            if (seen) {
                continue;
            }
            out.cast.push_back(name);
            out.profiles.emplace(name, profile);
        }

        for (const auto& crowd : ctx.patterns.crowds) {
            if (crowd.search(ctx.text())) {
                utils::append_unique(out.extras, crowd.label);
            }
        }
        return out;
    }

}  // namespace callsheet
