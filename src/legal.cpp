#include "callsheet/analyzers.hpp"

#include "callsheet/format.hpp"

using namespace callsheet::literals;

namespace callsheet {

    legal_result scan_legal(std::string_view text, const knowledge_base& knowledge, const pattern_library& patterns) {
        legal_result out{};
        auto lowered = utils::to_lower(text);

        for (const auto& name : knowledge.celebrities()) {
            if (utils::contains_term(lowered, name)) {
                out.alerts.push_back(legal_alert{
                        alert_type::celebrity,
                        name,
                        "Real person \"{}\" is named; requires legal review"_format(name),
                        alert_severity::warning});
            }
        }

        for (const auto& brand : knowledge.brands()) {
            if (utils::contains_term(lowered, brand)) {
                out.alerts.push_back(legal_alert{
                        alert_type::brand,
                        brand,
                        "Trademark \"{}\" appears; clear usage or replace with a generic product"_format(brand),
                        alert_severity::warning});
            }
        }

        bool title_matched = false;
        for (const auto& title : knowledge.songs()) {
            if (utils::contains_term(lowered, title)) {
                title_matched = true;
                out.alerts.push_back(legal_alert{
                        alert_type::music,
                        title,
                        "Copyrighted song \"{}\"; sync and master licenses required"_format(title),
                        alert_severity::critical});
            }
        }

        if (!title_matched && regex_found(patterns.music_keywords, text)) {
            out.alerts.push_back(legal_alert{
                    alert_type::music,
                    "music content",
                    "Music is performed or played; identify the track and clear rights",
                    alert_severity::warning});
        }
        return out;
    }

}  // namespace callsheet
