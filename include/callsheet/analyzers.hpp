#pragma once

#include "config.hpp"
#include "knowledge.hpp"
#include "patterns.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace callsheet {

    using namespace std::string_view_literals;

    /// Everything pass 1 learned about a scene, shared read-only by the pass 2 analyzers.
    struct scene_context {
        const scene_block& block;
        const scene_header& header;
        scene_type type;
        std::string lowered;
        std::vector<std::string> raw_cast;
        std::size_t dialogue_lines;
        const knowledge_base& knowledge;
        character_registry& characters;
        const pattern_library& patterns;

        std::string_view text() const { return block.raw_text; }
    };

    // Builds a context from a block and its header; runs raw cast extraction and dialogue counting.
    scene_context make_scene_context(
            const scene_block& block,
            const scene_header& header,
            scene_type type,
            const knowledge_base& knowledge,
            character_registry& characters,
            const pattern_library& patterns = default_patterns());

    enum class analyzer_kind : uint8_t { cast, props, wardrobe, effects, legal, cinematic, synopsis, production };

    inline constexpr std::string_view to_string(analyzer_kind kind) {
        switch (kind) {
            case analyzer_kind::cast:
                return "cast"sv;
            case analyzer_kind::props:
                return "props"sv;
            case analyzer_kind::wardrobe:
                return "wardrobe"sv;
            case analyzer_kind::effects:
                return "effects"sv;
            case analyzer_kind::legal:
                return "legal"sv;
            case analyzer_kind::cinematic:
                return "cinematic"sv;
            case analyzer_kind::synopsis:
                return "synopsis"sv;
            case analyzer_kind::production:
                return "production"sv;
        }
        return "cast"sv;
    }

    struct cast_result {
        std::vector<std::string> cast{};
        std::map<std::string, profile_ref> profiles{};
        std::vector<std::string> extras{};
    };

    struct prop_result {
        std::vector<std::string> props{};
        std::vector<std::string> set_dressing{};
        std::vector<std::string> vehicles{};
    };

    struct wardrobe_result {
        std::vector<wardrobe_spec> specs{};
    };

    struct effects_result {
        std::vector<std::string> special_effects{};
        std::vector<std::string> sound_cues{};
        std::vector<std::string> stunts{};
    };

    struct legal_result {
        std::vector<legal_alert> alerts{};
    };

    struct cinematic_result {
        cinematic_note note{};
    };

    struct synopsis_result {
        std::string synopsis{};
    };

    struct production_result {
        std::vector<std::string> set_dressing{};
        std::vector<std::string> production_notes{};
        std::vector<std::string> special_requirements{};
        int page_eighths{1};
        double estimated_shoot_hours{0.0};
    };

    using partial_result = std::variant<
            cast_result,
            prop_result,
            wardrobe_result,
            effects_result,
            legal_result,
            cinematic_result,
            synopsis_result,
            production_result>;

    // `so_far` holds the merged output of every analyzer that ran earlier in registry order.
    using analyzer_fn = std::function<partial_result(const scene_context& ctx, const breakdown& so_far)>;

    struct analyzer_entry {
        analyzer_kind kind{analyzer_kind::cast};
        analyzer_fn run{};
    };

    /*
     * Ordered set of analyzers for pass 2. Entries stay sorted by analyzer_kind, so cast always runs
     * before wardrobe, synopsis and production, which read its output.
     */
    class analyzer_registry {
      public:
        analyzer_registry() = default;

        // Every built-in analyzer, minus wardrobe/legal when the config disables them.
        static analyzer_registry defaults(const pipeline_config& cfg);

        // Analyzers a job for `component` needs, subject to the same config switches.
        static analyzer_registry for_component(analysis_component component, const pipeline_config& cfg);

        // Inserts or replaces the entry for `kind`.
        void set(analyzer_kind kind, analyzer_fn fn);
        void remove(analyzer_kind kind);
        bool contains(analyzer_kind kind) const;

        const std::vector<analyzer_entry>& entries() const { return entries_; }

      private:
        std::vector<analyzer_entry> entries_{};
    };

    // Folds one analyzer's output into the breakdown.
    void merge_partial(breakdown& out, partial_result&& result);

    // Resets the fields owned by `kind` to their defaults.
    void default_fields(breakdown& out, analyzer_kind kind);

    /* cast */
    std::vector<std::string> extract_cast_names(std::string_view text, const pattern_library& patterns = default_patterns());
    cast_result analyze_cast(const scene_context& ctx);

    /* props */
    prop_category classify_item(
            std::string_view item, std::string_view context, const pattern_library& patterns = default_patterns());
    std::string canonical_item_name(std::string_view item, prop_category category);
    prop_result analyze_props(const scene_context& ctx);

    /* wardrobe */
    enum class location_type : uint8_t { home, room, office, precinct, station, villa, car, hospital, exterior, other };

    inline constexpr std::string_view to_string(location_type type) {
        switch (type) {
            case location_type::home:
                return "home"sv;
            case location_type::room:
                return "room"sv;
            case location_type::office:
                return "office"sv;
            case location_type::precinct:
                return "precinct"sv;
            case location_type::station:
                return "station"sv;
            case location_type::villa:
                return "villa"sv;
            case location_type::car:
                return "car"sv;
            case location_type::hospital:
                return "hospital"sv;
            case location_type::exterior:
                return "exterior"sv;
            case location_type::other:
                return "other"sv;
        }
        return "other"sv;
    }

    location_type classify_location(std::string_view location);
    std::string infer_wardrobe(const character_profile& profile, const scene_context& ctx);
    wardrobe_result analyze_wardrobe(const scene_context& ctx, const std::vector<std::string>& cast);

    /* effects and sound */
    effects_result analyze_effects(const scene_context& ctx);

    /* legal */
    legal_result scan_legal(
            std::string_view text, const knowledge_base& knowledge, const pattern_library& patterns = default_patterns());

    /* cinematic */
    cinematic_note match_cinematic(const scene_context& ctx);

    /* synopsis */
    std::string generate_synopsis(const scene_context& ctx, const std::vector<std::string>& cast);
    std::string excerpt_summary(std::string_view text, const pattern_library& patterns = default_patterns());
    std::string refine_synopsis(std::string synopsis);

    /* production */
    int page_eighths(std::string_view text);
    double estimate_shoot_hours(int eighths, std::size_t cast_size, int_ext setting, bool special_requirements);
    production_result analyze_production(const scene_context& ctx, const breakdown& so_far);

}  // namespace callsheet
