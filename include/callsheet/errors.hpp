#pragma once

#include <stdexcept>
#include <string>

namespace callsheet {

    // Run-fatal: the document has no recognizable scene markers.
    struct no_scenes_found_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Scene-local: the block cannot be turned into a scene; the scene is skipped.
    struct scene_parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Scene-local: one analyzer failed; its output is defaulted.
    struct analyzer_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct job_not_found_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct invalid_transition_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Invalid config or knowledge-base input at startup.
    struct config_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

}  // namespace callsheet
