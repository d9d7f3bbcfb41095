#include "callsheet/analyzers.hpp"

#include "callsheet/scene.hpp"

#include <algorithm>
#include <type_traits>

namespace callsheet {

    namespace detail {

        template <typename... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };

        static analyzer_fn builtin(analyzer_kind kind) {
            switch (kind) {
                case analyzer_kind::cast:
                    return [](const scene_context& ctx, const breakdown&) -> partial_result { return analyze_cast(ctx); };
                case analyzer_kind::props:
                    return [](const scene_context& ctx, const breakdown&) -> partial_result { return analyze_props(ctx); };
                case analyzer_kind::wardrobe:
                    return [](const scene_context& ctx, const breakdown& so_far) -> partial_result {
                        return analyze_wardrobe(ctx, so_far.cast);
                    };
                case analyzer_kind::effects:
                    return [](const scene_context& ctx, const breakdown&) -> partial_result { return analyze_effects(ctx); };
                case analyzer_kind::legal:
                    return [](const scene_context& ctx, const breakdown&) -> partial_result {
                        return scan_legal(ctx.text(), ctx.knowledge, ctx.patterns);
                    };
                case analyzer_kind::cinematic:
                    return [](const scene_context& ctx, const breakdown&) -> partial_result {
                        return cinematic_result{match_cinematic(ctx)};
                    };
                case analyzer_kind::synopsis:
                    return [](const scene_context& ctx, const breakdown& so_far) -> partial_result {
                        return synopsis_result{generate_synopsis(ctx, so_far.cast)};
                    };
                case analyzer_kind::production:
                    return [](const scene_context& ctx, const breakdown& so_far) -> partial_result {
                        return analyze_production(ctx, so_far);
                    };
            }
            return {};
        }

        static void append_items(breakdown& out, prop_category category, std::vector<std::string>&& items) {
            auto existing = out.all_items();
            auto& target = out.items(category);
            for (auto& item : items) {
                if (std::ranges::find(existing, item) != existing.end()) {
                    continue;
                }
                existing.push_back(item);
                target.push_back(std::move(item));
            }
        }

    }  // namespace detail

    scene_context make_scene_context(
            const scene_block& block,
            const scene_header& header,
            scene_type type,
            const knowledge_base& knowledge,
            character_registry& characters,
            const pattern_library& patterns) {
        return scene_context{
                block,
                header,
                type,
                utils::to_lower(block.raw_text),
                extract_cast_names(block.raw_text, patterns),
                count_dialogue_lines(block.raw_text, patterns),
                knowledge,
                characters,
                patterns};
    }

    analyzer_registry analyzer_registry::defaults(const pipeline_config& cfg) {
        return for_component(analysis_component::full_analysis, cfg);
    }

    analyzer_registry analyzer_registry::for_component(analysis_component component, const pipeline_config& cfg) {
        std::vector<analyzer_kind> kinds{};
        switch (component) {
            case analysis_component::full_analysis:
            case analysis_component::scene_breakdown:
                kinds = {analyzer_kind::cast,
                         analyzer_kind::props,
                         analyzer_kind::wardrobe,
                         analyzer_kind::effects,
                         analyzer_kind::legal,
                         analyzer_kind::cinematic,
                         analyzer_kind::synopsis,
                         analyzer_kind::production};
                break;
            case analysis_component::cast_analysis:
                kinds = {analyzer_kind::cast};
                break;
            case analysis_component::prop_classification:
                kinds = {analyzer_kind::props};
                break;
            case analysis_component::wardrobe_inference:
                kinds = {analyzer_kind::cast, analyzer_kind::wardrobe};
                break;
            case analysis_component::effects_analysis:
                kinds = {analyzer_kind::effects};
                break;
            case analysis_component::legal_scan:
                kinds = {analyzer_kind::legal};
                break;
            case analysis_component::cinematic_patterns:
                kinds = {analyzer_kind::cinematic};
                break;
            case analysis_component::semantic_synopsis:
                kinds = {analyzer_kind::cast, analyzer_kind::synopsis};
                break;
            case analysis_component::continuity_check:
                kinds = {analyzer_kind::cast, analyzer_kind::props};
                break;
        }

        analyzer_registry registry{};
        for (auto kind : kinds) {
            if (kind == analyzer_kind::wardrobe && !cfg.enable_wardrobe_inference) {
                continue;
            }
            if (kind == analyzer_kind::legal && !cfg.enable_legal_alerts) {
                continue;
            }
            registry.set(kind, detail::builtin(kind));
        }
        return registry;
    }

    void analyzer_registry::set(analyzer_kind kind, analyzer_fn fn) {
        auto it = std::ranges::lower_bound(entries_, kind, {}, &analyzer_entry::kind);
        if (it != entries_.end() && it->kind == kind) {
            it->run = std::move(fn);
            return;
        }
        entries_.insert(it, analyzer_entry{kind, std::move(fn)});
    }

    void analyzer_registry::remove(analyzer_kind kind) {
        std::erase_if(entries_, [kind](const analyzer_entry& e) { return e.kind == kind; });
    }

    bool analyzer_registry::contains(analyzer_kind kind) const {
        return std::ranges::any_of(entries_, [kind](const analyzer_entry& e) { return e.kind == kind; });
    }

    void merge_partial(breakdown& out, partial_result&& result) {
        std::visit(
                detail::overloaded{
                        [&](cast_result&& r) {
                            out.cast = std::move(r.cast);
                            out.profiles = std::move(r.profiles);
                            out.extras = std::move(r.extras);
                        },
                        [&](prop_result&& r) {
                            detail::append_items(out, prop_category::vehicles, std::move(r.vehicles));
                            detail::append_items(out, prop_category::props, std::move(r.props));
                            detail::append_items(out, prop_category::set_dressing, std::move(r.set_dressing));
                        },
                        [&](wardrobe_result&& r) { out.wardrobe = std::move(r.specs); },
                        [&](effects_result&& r) {
                            out.special_effects = std::move(r.special_effects);
                            out.sound_cues = std::move(r.sound_cues);
                            out.stunts = std::move(r.stunts);
                        },
                        [&](legal_result&& r) { out.legal_alerts = std::move(r.alerts); },
                        [&](cinematic_result&& r) { out.cinematic = std::move(r.note); },
                        [&](synopsis_result&& r) { out.synopsis = std::move(r.synopsis); },
                        [&](production_result&& r) {
                            detail::append_items(out, prop_category::set_dressing, std::move(r.set_dressing));
                            out.production_notes = std::move(r.production_notes);
                            out.special_requirements = std::move(r.special_requirements);
                            out.page_eighths = r.page_eighths;
                            out.estimated_shoot_hours = r.estimated_shoot_hours;
                        }},
                std::move(result));
    }

    void default_fields(breakdown& out, analyzer_kind kind) {
        switch (kind) {
            case analyzer_kind::cast:
                out.cast.clear();
                out.profiles.clear();
                out.extras.clear();
                break;
            case analyzer_kind::props:
                out.props.clear();
                out.set_dressing.clear();
                out.vehicles.clear();
                break;
            case analyzer_kind::wardrobe:
                out.wardrobe.clear();
                break;
            case analyzer_kind::effects:
                out.special_effects.clear();
                out.sound_cues.clear();
                out.stunts.clear();
                break;
            case analyzer_kind::legal:
                out.legal_alerts.clear();
                break;
            case analyzer_kind::cinematic:
                out.cinematic = cinematic_note{};
                break;
            case analyzer_kind::synopsis:
                out.synopsis.clear();
                break;
            case analyzer_kind::production:
                out.production_notes.clear();
                out.special_requirements.clear();
                out.page_eighths = 1;
                out.estimated_shoot_hours = 0.0;
                break;
        }
    }

}  // namespace callsheet
