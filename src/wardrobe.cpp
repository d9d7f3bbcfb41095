#include "callsheet/analyzers.hpp"

#include <algorithm>
#include <array>

namespace callsheet {

    namespace detail {

        struct keyword_rule {
            std::regex keywords;
            std::string_view phrase;
        };

        struct setting_rule {
            time_of_day time;
            location_type location;
            std::string_view phrase;
        };

        struct profession_rule {
            std::vector<std::string_view> keywords;
            std::string_view phrase;
        };

        struct location_rule {
            location_type type;
            std::vector<std::string_view> keywords;
        };

        static const std::vector<keyword_rule>& descriptor_rules() {
            static const std::vector<keyword_rule> rules = [] {
                constexpr auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
                auto rule = [&](const char* pattern, std::string_view phrase) {
                    return keyword_rule{std::regex{pattern, flags}, phrase};
                };
                return std::vector<keyword_rule>{
                        rule(R"(\b(?:stern|strict)\b|صارم|صارمة)", "conservative formal suit or skirt suit"sv),
                        rule(R"(\b(?:elegant|glamorous|chic)\b|أنيق|أنيقة)", "elegant tailored outfit"sv),
                        rule(R"(\b(?:dignified|distinguished)\b|وقور|مهيب)", "luxury formal suit"sv),
                        rule(R"(\b(?:handsome|charming)\b|وسيم)", "smart casual shirt and jacket"sv),
                        rule(R"(\b(?:sporty|athletic|jogging|gym)\b|رياضي|رياضية)", "sportswear and trainers"sv),
                        rule(R"(\b(?:frustrated|exhausted|tired)\b|محبط|محبطة|منهك|منهكة)",
                             "neat clothes worn slightly disheveled"sv),
                        rule(R"(\b(?:disheveled|messy|unkempt)\b|مبعثر|مبعثرة)", "rumpled clothes"sv),
                        rule(R"(\brain(?:s|ing|y)?\b|مطر|أمطار)", "raincoat over the base costume"sv),
                        rule(R"(\b(?:wedding|party|gala)\b|حفلة|فرح)", "formal evening wear"sv)};
            }();
            return rules;
        }

        static constexpr std::array setting_rules{
                setting_rule{time_of_day::night, location_type::home, "comfortable home wear or pajamas"sv},
                setting_rule{time_of_day::day, location_type::home, "casual home clothes"sv},
                setting_rule{time_of_day::night, location_type::room, "nightwear or pajamas"sv},
                setting_rule{time_of_day::day, location_type::room, "casual indoor clothes"sv},
                setting_rule{time_of_day::day, location_type::office, "business attire"sv},
                setting_rule{time_of_day::night, location_type::office, "business attire, jacket off"sv},
                setting_rule{time_of_day::day, location_type::precinct, "formal suit with holster or police uniform"sv},
                setting_rule{time_of_day::night, location_type::precinct, "police uniform with outer jacket"sv},
                setting_rule{time_of_day::day, location_type::station, "smart work wear"sv},
                setting_rule{time_of_day::night, location_type::station, "smart work wear with a coat"sv},
                setting_rule{time_of_day::day, location_type::villa, "upscale day wear"sv},
                setting_rule{time_of_day::night, location_type::villa, "elegant evening wear"sv},
                setting_rule{time_of_day::day, location_type::hospital, "everyday clothes, gowns for patients"sv},
                setting_rule{time_of_day::night, location_type::hospital, "everyday clothes, gowns for patients"sv},
                setting_rule{time_of_day::day, location_type::car, "travel clothes with a light jacket"sv},
                setting_rule{time_of_day::night, location_type::car, "travel clothes with a warm jacket"sv},
                setting_rule{time_of_day::day, location_type::exterior, "everyday street clothes"sv},
                setting_rule{time_of_day::night, location_type::exterior, "layered outerwear for the night"sv}};

        static const std::array<profession_rule, 8>& profession_rules() {
            static const std::array<profession_rule, 8> rules{
                    profession_rule{{"detective"sv, "police"sv, "officer"sv, "investigator"sv, "مباحث"sv, "ضابط"sv, "محقق"sv},
                                    "plain-clothes detective suit"sv},
                    profession_rule{{"producer"sv, "manager"sv, "منتج"sv, "مدير"sv}, "business casual blazer"sv},
                    profession_rule{{"actress"sv, "actor"sv, "star"sv, "ممثلة"sv, "ممثل"sv, "نجم"sv},
                                    "fashionable designer outfit"sv},
                    profession_rule{
                            {"anchor"sv, "presenter"sv, "host"sv, "broadcaster"sv, "إعلامي"sv, "إعلامية"sv, "مذيع"sv},
                            "broadcast-ready formal wear"sv},
                    profession_rule{{"doctor"sv, "physician"sv, "طبيب"sv, "طبيبة"sv, "دكتور"sv},
                                    "white coat over work clothes"sv},
                    profession_rule{{"nurse"sv, "ممرضة"sv, "ممرض"sv}, "nurse scrubs"sv},
                    profession_rule{{"lawyer"sv, "attorney"sv, "محامي"sv, "محامية"sv}, "tailored dark suit"sv},
                    profession_rule{{"student"sv, "طالب"sv, "طالبة"sv}, "casual student clothes"sv}};
            return rules;
        }

        static const std::array<location_rule, 9>& location_rules() {
            static const std::array<location_rule, 9> rules{
                    location_rule{location_type::villa, {"villa"sv, "mansion"sv, "palace"sv, "فيلا"sv, "قصر"sv}},
                    location_rule{location_type::precinct, {"precinct"sv, "police"sv, "قسم"sv, "مباحث"sv, "أمن"sv}},
                    location_rule{location_type::hospital, {"hospital"sv, "clinic"sv, "ward"sv, "مستشفى"sv, "عيادة"sv}},
                    location_rule{location_type::office, {"office"sv, "offices"sv, "مكتب"sv}},
                    location_rule{location_type::station,
                                  {"station"sv, "studio"sv, "ستوديو"sv, "استوديو"sv, "محطة"sv}},
                    location_rule{location_type::home,
                                  {"home"sv, "house"sv, "apartment"sv, "flat"sv, "منزل"sv, "بيت"sv, "شقة"sv}},
                    location_rule{location_type::room, {"room"sv, "bedroom"sv, "غرفة"sv}},
                    location_rule{location_type::car, {"car"sv, "taxi"sv, "سيارة"sv, "تاكسي"sv}},
                    location_rule{location_type::exterior,
                                  {"street"sv,
                                   "road"sv,
                                   "square"sv,
                                   "park"sv,
                                   "market"sv,
                                   "garden"sv,
                                   "شارع"sv,
                                   "طريق"sv,
                                   "ميدان"sv,
                                   "حديقة"sv,
                                   "سوق"sv}}};
            return rules;
        }

        static constexpr std::array upper_class_markers{
                "upper"sv, "upper class"sv, "upper-class"sv, "wealthy"sv, "rich"sv, "عليا"sv};

        static constexpr std::array impaired_markers{
                "paralyzed"sv, "paralysed"sv, "ill"sv,    "sick"sv,    "injured"sv,
                "bedridden"sv, "مشلول"sv,    "مشلولة"sv, "مريض"sv,    "مريضة"sv,  "مصاب"sv};

        static bool any_term(std::string_view lowered, const std::vector<std::string_view>& terms) {
            return std::ranges::any_of(terms, [&](std::string_view t) { return utils::contains_term(lowered, t); });
        }

        static bool is_upper_class(const character_profile& profile) {
            if (!profile.social_class) {
                return false;
            }
            return std::ranges::any_of(
                    upper_class_markers, [&](std::string_view m) { return utils::str_case_eq(*profile.social_class, m); });
        }

        static bool is_impaired(const character_profile& profile) {
            if (!profile.psychological_state) {
                return false;
            }
            auto lowered = utils::to_lower(*profile.psychological_state);
            return std::ranges::any_of(impaired_markers, [&](std::string_view m) { return utils::contains_term(lowered, m); });
        }

        // Phrases sharing a leading word name the same garment concept; the first one wins.
        static std::string concept_of(std::string_view phrase) {
            auto end = phrase.find(' ');
            return utils::to_lower(phrase.substr(0, end));
        }

    }  // namespace detail

    location_type classify_location(std::string_view location) {
        auto lowered = utils::to_lower(location);
        for (const auto& rule : detail::location_rules()) {
            if (detail::any_term(lowered, rule.keywords)) {
                return rule.type;
            }
        }
        return location_type::other;
    }

    std::string infer_wardrobe(const character_profile& profile, const scene_context& ctx) {
        std::vector<std::string> phrases{};

        for (const auto& rule : detail::descriptor_rules()) {
            if (regex_found(rule.keywords, ctx.text())) {
                phrases.emplace_back(rule.phrase);
            }
        }

        auto location = classify_location(ctx.header.location);
        if (location == location_type::other && ctx.header.interior_exterior == int_ext::exterior) {
            location = location_type::exterior;
        }
        for (const auto& rule : detail::setting_rules) {
            if (rule.time == ctx.header.time && rule.location == location) {
                phrases.emplace_back(rule.phrase);
                break;
            }
        }

        if (profile.profession) {
            auto profession = utils::to_lower(*profile.profession);
            for (const auto& rule : detail::profession_rules()) {
                if (detail::any_term(profession, rule.keywords)) {
                    phrases.emplace_back(rule.phrase);
                    break;
                }
            }
        }

        bool upper = detail::is_upper_class(profile);
        if (upper && location == location_type::villa) {
            phrases.emplace_back("luxury upscale outfit");
        }
        else if (upper && location == location_type::office) {
            phrases.emplace_back("designer business wear");
        }

        if (detail::is_impaired(profile)) {
            phrases.emplace_back(upper ? "silk loungewear, robe or premium pajamas" : "loungewear or a soft robe");
        }

        std::vector<std::string> concepts{};
        std::vector<std::string> merged{};
        for (auto& phrase : phrases) {
            auto key = detail::concept_of(phrase);
            if (std::ranges::find(concepts, key) != concepts.end()) {
                continue;
            }
            concepts.push_back(std::move(key));
            merged.push_back(std::move(phrase));
        }

        if (merged.empty()) {
            return "context-dependent";
        }
        return utils::join_with_separator(merged, " | "sv);
    }

    wardrobe_result analyze_wardrobe(const scene_context& ctx, const std::vector<std::string>& cast) {
        wardrobe_result out{};
        for (const auto& name : cast) {
            auto profile = ctx.characters.resolve(name);
            wardrobe_spec spec{};
            spec.character = name;
            spec.description = infer_wardrobe(*profile, ctx);
            spec.is_inferred = true;
            out.specs.push_back(std::move(spec));
        }
        return out;
    }

}  // namespace callsheet
