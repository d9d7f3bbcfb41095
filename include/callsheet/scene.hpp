#pragma once

#include "patterns.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace callsheet {

    /// Cuts `text` at every scene-marker line. Text before the first marker is dropped; blocks come back
    /// ordered by numeric scene number (stable for repeated numbers). Throws no_scenes_found_error when
    /// no marker is present.
    std::vector<scene_block> split_scenes(std::string_view text, const pattern_library& patterns = default_patterns());

    // Numeric value of a block's scene number; throws scene_parse_error when it is not a number.
    uint64_t scene_ordinal(const scene_block& block);

    scene_header parse_header(const scene_block& block, const pattern_library& patterns = default_patterns());

    // Header text with the marker, INT/EXT and DAY/NIGHT tokens and separators removed.
    std::string extract_location(std::string_view header_line, const pattern_library& patterns = default_patterns());

    bool is_dialogue_line(std::string_view line, const pattern_library& patterns = default_patterns());
    std::size_t count_dialogue_lines(std::string_view text, const pattern_library& patterns = default_patterns());

    scene_type classify_scene_type(std::string_view text, const pattern_library& patterns = default_patterns());

}  // namespace callsheet
