#pragma once

#include "types.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace callsheet {

    struct timeline_entry {
        std::string scene_number{};
        time_of_day time{time_of_day::day};
        std::string location{};
        std::size_t sequence{};
    };

    struct continuity_findings {
        std::vector<std::string> notes{};
        // character -> prior scene in the same location, for wardrobe matching
        std::map<std::string, std::string> wardrobe_links{};
    };

    /*
     * Cross-scene index of who was where, which items appeared in which scenes, and what was shot at each
     * location. Append-only for the length of a run; every public member takes the graph's lock.
     */
    class continuity_graph {
      public:
        continuity_graph() = default;

        continuity_graph(const continuity_graph&) = delete;
        continuity_graph& operator=(const continuity_graph&) = delete;

        void register_scene(const breakdown& scene);

        // Scene number of the most recent prior scene sharing a cast member, location and time of day.
        std::optional<std::string> detect_continuation(const breakdown& scene) const;

        // Notes for a scene that has not been registered yet.
        continuity_findings continuity_notes(const breakdown& scene) const;

        std::vector<timeline_entry> timeline(std::string_view character) const;
        std::vector<std::string> item_appearances(std::string_view item) const;
        std::vector<std::string> location_history(std::string_view location) const;

        // Items seen in more than one scene, with their scene numbers.
        std::map<std::string, std::vector<std::string>> recurring_items() const;

        std::size_t scene_count() const;

      private:
        static constexpr std::size_t lookback{3U};

        mutable std::mutex mutex_;
        std::size_t sequence_{};
        std::map<std::string, std::vector<timeline_entry>> timelines_{};
        std::map<std::string, std::vector<std::string>> items_{};
        std::map<std::string, std::vector<std::string>> locations_{};
    };

}  // namespace callsheet
