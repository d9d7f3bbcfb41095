#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace callsheet {

    /// A compiled pattern paired with the label it reports when it matches.
    struct term_pattern {
        std::string label{};
        std::regex re{};

        bool search(std::string_view text) const;
        std::size_t count(std::string_view text) const;
    };

    struct cinematic_pattern {
        std::string name{};
        std::vector<std::regex> triggers{};
        std::string production_note{};
        std::string camera_note{};
    };

    struct ambiguous_item {
        std::string label{};
        std::vector<std::regex> vehicle_indicators{};
        std::vector<std::regex> stationary_indicators{};
    };

    /*
     * Every compiled regex the pipeline matches against. English alternatives carry word boundaries; Arabic
     * alternatives are literal byte sequences. Built once and read concurrently afterwards.
     */
    struct pattern_library {
        // scene structure
        std::regex scene_marker{};  // 1: number, 2: header remainder
        std::regex dialogue_cue{};  // 1: speaker
        std::regex stage_direction{};  // 1: name, case-sensitive
        std::regex stage_direction_localized{};  // 1: name
        std::regex interior{};
        std::regex exterior{};
        std::regex night{};
        std::regex day{};

        // scene type
        std::regex conflict{};
        std::regex discovery{};
        std::vector<term_pattern> action_verbs{};
        std::regex emotion{};

        // item vocabulary and taxonomy
        std::vector<term_pattern> items{};
        std::vector<ambiguous_item> ambiguous_items{};
        std::regex vehicles_taxonomy{};
        std::regex props_taxonomy{};
        std::regex set_dressing_taxonomy{};

        // effects and sound
        std::vector<term_pattern> effects{};
        std::vector<term_pattern> sound_cues{};
        std::vector<term_pattern> stunts{};
        std::vector<term_pattern> crowds{};
        std::regex speech{};
        std::regex music_keywords{};
        std::regex sensitive_institutions{};

        // synopsis entities
        std::vector<term_pattern> discovery_verbs{};
        std::vector<term_pattern> discovered_objects{};
        std::vector<term_pattern> location_details{};
        std::vector<term_pattern> emotions{};
        std::vector<term_pattern> topics{};

        std::vector<cinematic_pattern> cinematic{};
    };

    const pattern_library& default_patterns();

    bool regex_found(const std::regex& re, std::string_view text);

}  // namespace callsheet
