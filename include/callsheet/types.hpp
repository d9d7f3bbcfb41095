#pragma once

#include "utils.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace callsheet {

    using namespace std::string_view_literals;

    enum class int_ext : uint8_t { interior, exterior };
    enum class time_of_day : uint8_t { day, night };
    enum class scene_type : uint8_t { dialogue_heavy, action, discovery, confrontation, emotional, transitional };
    enum class prop_category : uint8_t { props, set_dressing, vehicles };
    enum class alert_type : uint8_t { celebrity, brand, music };
    enum class alert_severity : uint8_t { warning, critical };
    enum class scene_stage : uint8_t { extracted, enriched, refined };

    inline constexpr std::string_view to_string(int_ext value) {
        return value == int_ext::exterior ? "EXT"sv : "INT"sv;
    }

    inline constexpr std::string_view to_string(time_of_day value) {
        return value == time_of_day::night ? "NIGHT"sv : "DAY"sv;
    }

    inline constexpr std::string_view to_string(scene_type value) {
        switch (value) {
            case scene_type::dialogue_heavy:
                return "dialogue_heavy"sv;
            case scene_type::action:
                return "action"sv;
            case scene_type::discovery:
                return "discovery"sv;
            case scene_type::confrontation:
                return "confrontation"sv;
            case scene_type::emotional:
                return "emotional"sv;
            case scene_type::transitional:
                return "transitional"sv;
        }
        return "transitional"sv;
    }

    inline constexpr std::string_view to_string(prop_category value) {
        switch (value) {
            case prop_category::props:
                return "props"sv;
            case prop_category::set_dressing:
                return "set_dressing"sv;
            case prop_category::vehicles:
                return "vehicles"sv;
        }
        return "props"sv;
    }

    inline constexpr std::string_view to_string(alert_type value) {
        switch (value) {
            case alert_type::celebrity:
                return "celebrity"sv;
            case alert_type::brand:
                return "brand"sv;
            case alert_type::music:
                return "music"sv;
        }
        return "brand"sv;
    }

    inline constexpr std::string_view to_string(alert_severity value) {
        return value == alert_severity::critical ? "critical"sv : "warning"sv;
    }

    inline constexpr std::string_view to_string(scene_stage value) {
        switch (value) {
            case scene_stage::extracted:
                return "extracted"sv;
            case scene_stage::enriched:
                return "enriched"sv;
            case scene_stage::refined:
                return "refined"sv;
        }
        return "extracted"sv;
    }

    struct scene_block {
        std::string scene_number{};
        std::string raw_text{};
    };

    struct scene_header {
        int_ext interior_exterior{int_ext::interior};
        time_of_day time{time_of_day::day};
        std::string location{"unspecified"};
    };

    struct character_profile {
        std::string canonical_name{};
        std::string full_name{};
        std::optional<std::string> gender{};
        std::optional<std::string> age_range{};
        std::optional<std::string> profession{};
        std::optional<std::string> social_class{};
        std::optional<std::string> psychological_state{};
        std::vector<std::string> aliases{};
    };

    using profile_ref = std::shared_ptr<const character_profile>;

    struct wardrobe_spec {
        std::string character{};
        std::string description{};
        bool is_inferred{true};
        std::optional<std::string> continuity_note{};
    };

    struct legal_alert {
        alert_type type{alert_type::brand};
        std::string entity_name{};
        std::string description{};
        alert_severity severity{alert_severity::warning};
    };

    struct cinematic_note {
        std::optional<std::string> pattern{};
        std::string production_note{};
        std::string camera_note{};
    };

    struct breakdown {
        std::string scene_number{};
        scene_header header{};
        scene_type type{scene_type::transitional};
        scene_stage stage{scene_stage::extracted};
        std::string synopsis{};

        std::vector<std::string> cast{};
        std::map<std::string, profile_ref> profiles{};
        std::vector<std::string> extras{};

        std::vector<std::string> props{};
        std::vector<std::string> set_dressing{};
        std::vector<std::string> vehicles{};

        std::vector<wardrobe_spec> wardrobe{};

        std::vector<std::string> special_effects{};
        std::vector<std::string> sound_cues{};
        std::vector<std::string> stunts{};

        std::vector<legal_alert> legal_alerts{};
        cinematic_note cinematic{};

        std::vector<std::string> continuity_notes{};
        std::optional<std::string> continues_scene{};

        std::vector<std::string> production_notes{};
        std::vector<std::string> special_requirements{};
        int page_eighths{1};
        double estimated_shoot_hours{0.0};

        std::vector<std::string> analyzer_failures{};

        // Every classified item across the three categories, in category order.
        std::vector<std::string> all_items() const {
            std::vector<std::string> items{props};
            items.insert(items.end(), set_dressing.begin(), set_dressing.end());
            items.insert(items.end(), vehicles.begin(), vehicles.end());
            return items;
        }

        const std::vector<std::string>& items(prop_category category) const {
            switch (category) {
                case prop_category::set_dressing:
                    return set_dressing;
                case prop_category::vehicles:
                    return vehicles;
                case prop_category::props:
                    break;
            }
            return props;
        }

        std::vector<std::string>& items(prop_category category) {
            return const_cast<std::vector<std::string>&>(std::as_const(*this).items(category));
        }
    };

    struct scene_failure {
        std::string scene_number{};
        scene_stage stage{scene_stage::extracted};
        std::string message{};
    };

    struct breakdown_run {
        std::vector<breakdown> scenes{};
        std::vector<scene_failure> failures{};
    };

}  // namespace callsheet
