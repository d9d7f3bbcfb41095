#include "callsheet/continuity.hpp"

#include "callsheet/format.hpp"
#include "callsheet/utils.hpp"

#include <algorithm>
#include <ranges>

namespace callsheet {

    using namespace callsheet::literals;

    namespace detail {

        static std::string location_key(std::string_view location) {
            return utils::to_lower(utils::trim_view(location));
        }

        static bool same_place(const timeline_entry& entry, const breakdown& scene) {
            return entry.time == scene.header.time &&
                   location_key(entry.location) == location_key(scene.header.location);
        }

    }  // namespace detail

    void continuity_graph::register_scene(const breakdown& scene) {
        std::lock_guard lock{mutex_};
        auto seq = sequence_++;

        for (const auto& name : scene.cast) {
            timelines_[name].push_back(
                    timeline_entry{scene.scene_number, scene.header.time, scene.header.location, seq});
        }
        for (auto&& item : scene.all_items()) {
            utils::append_unique(items_[item], scene.scene_number);
        }
        utils::append_unique(locations_[detail::location_key(scene.header.location)], scene.scene_number);
    }

    std::optional<std::string> continuity_graph::detect_continuation(const breakdown& scene) const {
        std::lock_guard lock{mutex_};

        const timeline_entry* best{nullptr};
        for (const auto& name : scene.cast) {
            auto it = timelines_.find(name);
            if (it == timelines_.end()) {
                continue;
            }
            auto recent = it->second | std::views::reverse | std::views::take(lookback);
            for (const auto& entry : recent) {
                if (entry.scene_number == scene.scene_number || !detail::same_place(entry, scene)) {
                    continue;
                }
                if (!best || entry.sequence > best->sequence) {
                    best = &entry;
                }
                break;
            }
        }

        if (!best) {
            return std::nullopt;
        }
        return best->scene_number;
    }

    continuity_findings continuity_graph::continuity_notes(const breakdown& scene) const {
        std::lock_guard lock{mutex_};
        continuity_findings out{};

        for (auto&& item : scene.all_items()) {
            auto it = items_.find(item);
            if (it == items_.end()) {
                continue;
            }
            std::vector<std::string> prior{};
            for (const auto& number : it->second) {
                if (number != scene.scene_number) {
                    prior.push_back(number);
                }
            }
            if (prior.empty()) {
                continue;
            }
            out.notes.push_back("{} continues from scene(s) {}"_format(item, utils::join_with_separator(prior, ", ")));
        }

        std::vector<std::string> matched{};
        std::string matched_scene{};
        for (const auto& name : scene.cast) {
            auto it = timelines_.find(name);
            if (it == timelines_.end() || it->second.empty()) {
                continue;
            }
            const auto& latest = it->second.back();
            if (latest.scene_number == scene.scene_number ||
                detail::location_key(latest.location) != detail::location_key(scene.header.location)) {
                continue;
            }
            out.wardrobe_links[name] = latest.scene_number;
            matched.push_back(name);
            if (matched_scene.empty()) {
                matched_scene = latest.scene_number;
            }
        }

        if (!matched.empty()) {
            out.notes.push_back("Wardrobe continuity with scene {}: {}"_format(
                    matched_scene, utils::join_with_separator(matched, ", ")));
        }
        return out;
    }

    std::vector<timeline_entry> continuity_graph::timeline(std::string_view character) const {
        std::lock_guard lock{mutex_};
        if (auto it = timelines_.find(std::string{character}); it != timelines_.end()) {
            return it->second;
        }
        return {};
    }

    std::vector<std::string> continuity_graph::item_appearances(std::string_view item) const {
        std::lock_guard lock{mutex_};
        if (auto it = items_.find(std::string{item}); it != items_.end()) {
            return it->second;
        }
        return {};
    }

    std::vector<std::string> continuity_graph::location_history(std::string_view location) const {
        std::lock_guard lock{mutex_};
        if (auto it = locations_.find(detail::location_key(location)); it != locations_.end()) {
            return it->second;
        }
        return {};
    }

    std::map<std::string, std::vector<std::string>> continuity_graph::recurring_items() const {
        std::lock_guard lock{mutex_};
        std::map<std::string, std::vector<std::string>> out{};
        for (const auto& [item, scenes] : items_) {
            if (scenes.size() > 1) {
                out.emplace(item, scenes);
            }
        }
        return out;
    }

    std::size_t continuity_graph::scene_count() const {
        std::lock_guard lock{mutex_};
        return sequence_;
    }

}  // namespace callsheet
