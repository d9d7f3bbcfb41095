#include "callsheet/analyzers.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace callsheet {

    namespace detail {

        struct item_span {
            std::size_t item{};
            std::size_t begin{};
            std::size_t end{};

            std::size_t length() const { return end - begin; }
            bool inside(const item_span& other) const {
                return other.begin <= begin && end <= other.end && other.length() > length();
            }
        };

        struct canonical_label {
            std::string_view item;
            std::optional<prop_category> category;
            std::string_view label;
        };

        static constexpr std::array canonical_labels{
                canonical_label{"phone"sv, std::nullopt, "mobile phone"sv},
                canonical_label{"هاتف"sv, std::nullopt, "هاتف محمول"sv},
                canonical_label{"laptop"sv, std::nullopt, "laptop computer"sv},
                canonical_label{"لابتوب"sv, std::nullopt, "حاسب آلي محمول"sv},
                canonical_label{"envelope"sv, std::nullopt, "postal envelope"sv},
                canonical_label{"ظرف"sv, std::nullopt, "ظرف بريدي"sv},
                canonical_label{"wheelchair"sv, prop_category::props, "medical wheelchair"sv},
                canonical_label{"wheelchair"sv, prop_category::vehicles, "motorized wheelchair"sv},
                canonical_label{"كرسي متحرك"sv, prop_category::props, "كرسي متحرك طبي"sv},
                canonical_label{"كرسي متحرك"sv, prop_category::vehicles, "كرسي متحرك آلي"sv}};

        static const ambiguous_item* find_ambiguous(std::string_view item, const pattern_library& patterns) {
            auto lowered = utils::to_lower(item);
            for (const auto& amb : patterns.ambiguous_items) {
                if (lowered.find(utils::to_lower(amb.label)) != std::string::npos) {
                    return &amb;
                }
            }
            return nullptr;
        }

        static std::size_t indicator_score(const std::vector<std::regex>& indicators, std::string_view context) {
            return static_cast<std::size_t>(
                    std::ranges::count_if(indicators, [&](const std::regex& re) { return regex_found(re, context); }));
        }

        static std::vector<item_span> collect_spans(std::string_view text, const pattern_library& patterns) {
            std::vector<item_span> spans{};
            for (std::size_t i = 0; i < patterns.items.size(); ++i) {
                const auto& re = patterns.items[i].re;
                for (std::cregex_iterator it{text.data(), text.data() + text.size(), re}, end{}; it != end; ++it) {
                    auto begin = static_cast<std::size_t>(it->position(0));
                    spans.push_back(item_span{i, begin, begin + static_cast<std::size_t>(it->length(0))});
                }
            }
            return spans;
        }

    }  // namespace detail

    prop_category classify_item(std::string_view item, std::string_view context, const pattern_library& patterns) {
        if (const auto* amb = detail::find_ambiguous(item, patterns)) {
            auto lowered = utils::to_lower(context);
            auto vehicle_score = detail::indicator_score(amb->vehicle_indicators, lowered);
            auto stationary_score = detail::indicator_score(amb->stationary_indicators, lowered);
            return vehicle_score > stationary_score ? prop_category::vehicles : prop_category::props;
        }

        bool is_vehicle = regex_found(patterns.vehicles_taxonomy, item);
        bool is_prop = regex_found(patterns.props_taxonomy, item);
        bool is_set = regex_found(patterns.set_dressing_taxonomy, item);

        if (is_prop && is_set) {
            return prop_category::props;
        }
        if (is_vehicle) {
            return prop_category::vehicles;
        }
        if (is_prop) {
            return prop_category::props;
        }
        if (is_set) {
            return prop_category::set_dressing;
        }
        return prop_category::props;
    }

    std::string canonical_item_name(std::string_view item, prop_category category) {
        for (const auto& entry : detail::canonical_labels) {
            if (!utils::str_case_eq(entry.item, item)) {
                continue;
            }
            if (entry.category && *entry.category != category) {
                continue;
            }
            return std::string{entry.label};
        }
        return std::string{item};
    }

    prop_result analyze_props(const scene_context& ctx) {
        const auto& patterns = ctx.patterns;
        auto spans = detail::collect_spans(ctx.text(), patterns);

        // a hit swallowed by a longer hit ("mirror" inside "hand mirror") is not a separate item
        std::vector<std::pair<std::size_t, std::size_t>> first_seen{};  // (position, item index)
        for (const auto& span : spans) {
            bool swallowed = std::ranges::any_of(
                    spans, [&](const detail::item_span& other) { return other.item != span.item && span.inside(other); });
            if (swallowed) {
                continue;
            }
            auto it = std::ranges::find(first_seen, span.item, &std::pair<std::size_t, std::size_t>::second);
            if (it == first_seen.end()) {
                first_seen.emplace_back(span.begin, span.item);
            }
            else if (span.begin < it->first) {
                it->first = span.begin;
            }
        }
        std::ranges::sort(first_seen);

        prop_result out{};
        std::vector<std::string> assigned{};
        for (const auto& [position, index] : first_seen) {
            const auto& item = patterns.items[index].label;
            auto category = classify_item(item, ctx.lowered, patterns);
            auto name = canonical_item_name(item, category);
            if (std::ranges::find(assigned, name) != assigned.end()) {
                continue;
            }
            assigned.push_back(name);
            switch (category) {
                case prop_category::props:
                    out.props.push_back(std::move(name));
                    break;
                case prop_category::set_dressing:
                    out.set_dressing.push_back(std::move(name));
                    break;
                case prop_category::vehicles:
                    out.vehicles.push_back(std::move(name));
                    break;
            }
        }
        return out;
    }

}  // namespace callsheet
