#include "callsheet/analyzers.hpp"

namespace callsheet {

    namespace detail {

        static void collect_labels(
                const std::vector<term_pattern>& vocabulary, std::string_view text, std::vector<std::string>& out) {
            for (const auto& term : vocabulary) {
                if (term.search(text)) {
                    utils::append_unique(out, term.label);
                }
            }
        }

    }  // namespace detail

    effects_result analyze_effects(const scene_context& ctx) {
        effects_result out{};
        detail::collect_labels(ctx.patterns.effects, ctx.text(), out.special_effects);

        if (ctx.dialogue_lines > 0 || regex_found(ctx.patterns.speech, ctx.text())) {
            out.sound_cues.emplace_back("dialogue");
        }
        detail::collect_labels(ctx.patterns.sound_cues, ctx.text(), out.sound_cues);
        detail::collect_labels(ctx.patterns.stunts, ctx.text(), out.stunts);
        return out;
    }

}  // namespace callsheet
