#pragma once

#include "analyzers.hpp"
#include "config.hpp"
#include "continuity.hpp"
#include "knowledge.hpp"
#include "log.hpp"
#include "patterns.hpp"
#include "types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace callsheet {

    /*
     * Three-pass breakdown pipeline.
     *
     * Pass 1 parses the header, scene type and raw cast of a block; pass 2 runs the registry's analyzers in
     * order. Both run concurrently for up to `batch_size` scenes, one thread per scene. Pass 3 then walks the
     * batch in document order against the continuity graph and finalizes each synopsis.
     *
     * One parser serves one run: its continuity graph and character registry accumulate across calls.
     */
    class scene_parser {
      public:
        scene_parser(
                pipeline_config cfg,
                logger log,
                const knowledge_base& knowledge,
                analyzer_registry analyzers,
                const pattern_library& patterns = default_patterns());

        scene_parser(const scene_parser&) = delete;
        scene_parser& operator=(const scene_parser&) = delete;

        // Throws no_scenes_found_error when `text` carries no scene marker.
        breakdown_run analyze_document(std::string_view text);

        breakdown_run analyze_blocks(const std::vector<scene_block>& blocks);

        const continuity_graph& continuity() const { return continuity_; }
        const character_registry& characters() const { return characters_; }

      private:
        struct stage_outcome {
            std::optional<breakdown> scene{};
            std::optional<scene_failure> failure{};
        };

        stage_outcome extract_and_enrich(const scene_block& block);
        void refine(breakdown& scene);

        pipeline_config cfg_;
        logger log_;
        const knowledge_base& knowledge_;
        analyzer_registry analyzers_;
        const pattern_library& patterns_;
        character_registry characters_;
        continuity_graph continuity_{};
    };

}  // namespace callsheet
