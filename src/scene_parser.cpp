#include "callsheet/scene_parser.hpp"

#include "callsheet/errors.hpp"
#include "callsheet/format.hpp"
#include "callsheet/scene.hpp"

#include <algorithm>
#include <exception>
#include <ranges>
#include <thread>

namespace callsheet {

    using namespace callsheet::literals;

    namespace detail {

        static bool has_body(std::string_view text) {
            auto lines = utils::split_lines(text);
            return std::ranges::any_of(
                    lines | std::views::drop(1), [](std::string_view line) { return !utils::trim_view(line).empty(); });
        }

        static bool is_analyzable(const scene_block& block) {
            return utils::parse_arithmetic<uint64_t>(block.scene_number).has_value() && has_body(block.raw_text);
        }

    }  // namespace detail

    scene_parser::scene_parser(
            pipeline_config cfg,
            logger log,
            const knowledge_base& knowledge,
            analyzer_registry analyzers,
            const pattern_library& patterns)
        : cfg_{cfg},
          log_{std::move(log)},
          knowledge_{knowledge},
          analyzers_{std::move(analyzers)},
          patterns_{patterns},
          characters_{knowledge} {
        if (cfg_.batch_size == 0) {
            cfg_.batch_size = 1;
        }
    }

    breakdown_run scene_parser::analyze_document(std::string_view text) {
        auto blocks = split_scenes(text, patterns_);
        log_.info("split document into {} scene(s)"_format(blocks.size()));
        return analyze_blocks(blocks);
    }

    breakdown_run scene_parser::analyze_blocks(const std::vector<scene_block>& blocks) {
        breakdown_run run{};

        for (std::size_t start = 0; start < blocks.size(); start += cfg_.batch_size) {
            auto end = std::min(blocks.size(), start + cfg_.batch_size);
            std::vector<stage_outcome> outcomes(end - start);

            // synthesized profiles keep the spelling first seen in document order, not the first thread's
            if (analyzers_.contains(analyzer_kind::cast)) {
                for (std::size_t i = start; i < end; ++i) {
                    if (!detail::is_analyzable(blocks[i])) {
                        continue;
                    }
                    for (const auto& name : extract_cast_names(blocks[i].raw_text, patterns_)) {
                        characters_.resolve(name);
                    }
                }
            }

            {
                std::vector<std::thread> workers{};
                workers.reserve(end - start);
                for (std::size_t i = start; i < end; ++i) {
                    workers.emplace_back([this, &blocks, &outcomes, i, start] {
                        outcomes[i - start] = extract_and_enrich(blocks[i]);
                    });
                }
                for (auto& t : workers) {
                    t.join();
                }
            }

            for (auto& outcome : outcomes) {
                if (outcome.failure) {
                    run.failures.push_back(std::move(*outcome.failure));
                }
                if (!outcome.scene) {
                    continue;
                }
                auto& scene = *outcome.scene;
                if (scene.analyzer_failures.empty()) {
                    refine(scene);
                }
                else {
                    log_.warn("scene {} left {} after {} analyzer failure(s)"_format(
                            scene.scene_number, scene.stage, scene.analyzer_failures.size()));
                }
                run.scenes.push_back(std::move(scene));
            }
        }

        log_.info("analyzed {} scene(s), {} failure(s)"_format(run.scenes.size(), run.failures.size()));
        return run;
    }

    scene_parser::stage_outcome scene_parser::extract_and_enrich(const scene_block& block) {
        stage_outcome outcome{};
        breakdown scene{};
        scene.scene_number = block.scene_number;

        std::optional<scene_context> ctx{};
        try {
            scene_ordinal(block);
            if (!detail::has_body(block.raw_text)) {
                throw scene_parse_error("scene {} has an empty body"_format(block.scene_number));
            }
            scene.header = parse_header(block, patterns_);
            scene.type = classify_scene_type(block.raw_text, patterns_);
            ctx.emplace(make_scene_context(block, scene.header, scene.type, knowledge_, characters_, patterns_));
        } catch (const std::exception& e) {
            log_.warn("skipping scene '{}': {}"_format(block.scene_number, e.what()));
            outcome.failure = scene_failure{block.scene_number, scene_stage::extracted, e.what()};
            return outcome;
        }

        for (const auto& entry : analyzers_.entries()) {
            try {
                if (!entry.run) {
                    throw analyzer_error("no analyzer bound");
                }
                merge_partial(scene, entry.run(*ctx, scene));
            } catch (const std::exception& e) {
                default_fields(scene, entry.kind);
                scene.analyzer_failures.push_back("{}: {}"_format(entry.kind, e.what()));
                log_.warn("scene {}: {} analyzer failed: {}"_format(scene.scene_number, entry.kind, e.what()));
            }
        }
        scene.stage = scene_stage::enriched;

        log_.debug("scene {} enriched: {} cast, {} item(s)"_format(
                scene.scene_number, scene.cast.size(), scene.all_items().size()));
        outcome.scene = std::move(scene);
        return outcome;
    }

    void scene_parser::refine(breakdown& scene) {
        scene.continues_scene = continuity_.detect_continuation(scene);

        auto findings = continuity_.continuity_notes(scene);
        for (auto& spec : scene.wardrobe) {
            if (auto it = findings.wardrobe_links.find(spec.character); it != findings.wardrobe_links.end()) {
                spec.continuity_note = "Match wardrobe from scene {}"_format(it->second);
            }
        }
        if (scene.continues_scene) {
            scene.continuity_notes.push_back("Continues from scene {}"_format(*scene.continues_scene));
        }
        for (auto& note : findings.notes) {
            scene.continuity_notes.push_back(std::move(note));
        }

        continuity_.register_scene(scene);

        scene.synopsis = refine_synopsis(std::move(scene.synopsis));
        scene.stage = scene_stage::refined;
    }

}  // namespace callsheet
