#include "callsheet/report.hpp"

#include "callsheet/errors.hpp"
#include "callsheet/format.hpp"
#include "callsheet/utils.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <ostream>
#include <stdexcept>

namespace callsheet::detail {

    struct cast_profile_record {
        std::string canonical_name{};
        std::string full_name{};
        std::optional<std::string> gender{};
        std::optional<std::string> age_range{};
        std::optional<std::string> profession{};
        std::optional<std::string> social_class{};
        std::optional<std::string> psychological_state{};
        std::vector<std::string> aliases{};
    };

    struct wardrobe_record {
        std::string character{};
        std::string description{};
        bool is_inferred{true};
        std::optional<std::string> continuity_note{};
    };

    struct legal_alert_record {
        std::string type{};
        std::string entity_name{};
        std::string description{};
        std::string severity{};
    };

    struct cinematic_record {
        std::optional<std::string> pattern{};
        std::string production_note{};
        std::string camera_note{};
    };

    struct scene_record {
        std::string scene_number{};
        std::string interior_exterior{};
        std::string time_of_day{};
        std::string location{};
        std::string scene_type{};
        std::string stage{};
        std::string synopsis{};
        std::vector<std::string> cast{};
        std::vector<cast_profile_record> profiles{};
        std::vector<std::string> extras{};
        std::vector<std::string> props{};
        std::vector<std::string> set_dressing{};
        std::vector<std::string> vehicles{};
        std::vector<wardrobe_record> wardrobe{};
        std::vector<std::string> special_effects{};
        std::vector<std::string> sound_cues{};
        std::vector<std::string> stunts{};
        std::vector<legal_alert_record> legal_alerts{};
        cinematic_record cinematic{};
        std::vector<std::string> continuity_notes{};
        std::optional<std::string> continues_scene{};
        std::vector<std::string> production_notes{};
        std::vector<std::string> special_requirements{};
        int page_eighths{1};
        double estimated_shoot_hours{};
        std::vector<std::string> analyzer_failures{};
    };

    struct failure_record {
        std::string scene_number{};
        std::string stage{};
        std::string message{};
    };

    struct shooting_day_record {
        int day_number{};
        std::vector<std::string> scenes{};
        int total_eighths{};
        double total_hours{};
    };

    struct report_record {
        int schema_version{1};
        std::size_t scene_count{};
        std::vector<scene_record> scenes{};
        std::vector<failure_record> failures{};
        std::optional<std::vector<shooting_day_record>> schedule{};
    };

}  // namespace callsheet::detail

namespace glz {

    template <>
    struct meta<callsheet::detail::cast_profile_record> {
        using T = callsheet::detail::cast_profile_record;
        static constexpr auto value =
                object("canonical_name",
                       &T::canonical_name,
                       "full_name",
                       &T::full_name,
                       "gender",
                       &T::gender,
                       "age_range",
                       &T::age_range,
                       "profession",
                       &T::profession,
                       "social_class",
                       &T::social_class,
                       "psychological_state",
                       &T::psychological_state,
                       "aliases",
                       &T::aliases);
    };

    template <>
    struct meta<callsheet::detail::wardrobe_record> {
        using T = callsheet::detail::wardrobe_record;
        static constexpr auto value =
                object("character",
                       &T::character,
                       "description",
                       &T::description,
                       "is_inferred",
                       &T::is_inferred,
                       "continuity_note",
                       &T::continuity_note);
    };

    template <>
    struct meta<callsheet::detail::legal_alert_record> {
        using T = callsheet::detail::legal_alert_record;
        static constexpr auto value = object(
                "type", &T::type, "entity_name", &T::entity_name, "description", &T::description, "severity", &T::severity);
    };

    template <>
    struct meta<callsheet::detail::cinematic_record> {
        using T = callsheet::detail::cinematic_record;
        static constexpr auto value = object(
                "pattern", &T::pattern, "production_note", &T::production_note, "camera_note", &T::camera_note);
    };

    template <>
    struct meta<callsheet::detail::scene_record> {
        using T = callsheet::detail::scene_record;
        static constexpr auto value =
                object("scene_number",
                       &T::scene_number,
                       "interior_exterior",
                       &T::interior_exterior,
                       "time_of_day",
                       &T::time_of_day,
                       "location",
                       &T::location,
                       "scene_type",
                       &T::scene_type,
                       "stage",
                       &T::stage,
                       "synopsis",
                       &T::synopsis,
                       "cast",
                       &T::cast,
                       "profiles",
                       &T::profiles,
                       "extras",
                       &T::extras,
                       "props",
                       &T::props,
                       "set_dressing",
                       &T::set_dressing,
                       "vehicles",
                       &T::vehicles,
                       "wardrobe",
                       &T::wardrobe,
                       "special_effects",
                       &T::special_effects,
                       "sound_cues",
                       &T::sound_cues,
                       "stunts",
                       &T::stunts,
                       "legal_alerts",
                       &T::legal_alerts,
                       "cinematic",
                       &T::cinematic,
                       "continuity_notes",
                       &T::continuity_notes,
                       "continues_scene",
                       &T::continues_scene,
                       "production_notes",
                       &T::production_notes,
                       "special_requirements",
                       &T::special_requirements,
                       "page_eighths",
                       &T::page_eighths,
                       "estimated_shoot_hours",
                       &T::estimated_shoot_hours,
                       "analyzer_failures",
                       &T::analyzer_failures);
    };

    template <>
    struct meta<callsheet::detail::failure_record> {
        using T = callsheet::detail::failure_record;
        static constexpr auto value =
                object("scene_number", &T::scene_number, "stage", &T::stage, "message", &T::message);
    };

    template <>
    struct meta<callsheet::detail::shooting_day_record> {
        using T = callsheet::detail::shooting_day_record;
        static constexpr auto value =
                object("day_number",
                       &T::day_number,
                       "scenes",
                       &T::scenes,
                       "total_eighths",
                       &T::total_eighths,
                       "total_hours",
                       &T::total_hours);
    };

    template <>
    struct meta<callsheet::detail::report_record> {
        using T = callsheet::detail::report_record;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "scene_count",
                       &T::scene_count,
                       "scenes",
                       &T::scenes,
                       "failures",
                       &T::failures,
                       "schedule",
                       &T::schedule);
    };

}  // namespace glz

namespace callsheet {

    using namespace callsheet::literals;

    namespace detail {

        static constexpr int report_schema_version = 1;

        static std::string str(std::string_view sv) { return std::string{sv}; }

        static cast_profile_record to_record(const character_profile& p) {
            return cast_profile_record{
                    p.canonical_name,
                    p.full_name,
                    p.gender,
                    p.age_range,
                    p.profession,
                    p.social_class,
                    p.psychological_state,
                    p.aliases};
        }

        static scene_record to_record(const breakdown& b) {
            scene_record r{};
            r.scene_number = b.scene_number;
            r.interior_exterior = str(to_string(b.header.interior_exterior));
            r.time_of_day = str(to_string(b.header.time));
            r.location = b.header.location;
            r.scene_type = str(to_string(b.type));
            r.stage = str(to_string(b.stage));
            r.synopsis = b.synopsis;
            r.cast = b.cast;
            for (const auto& name : b.cast) {
                if (auto it = b.profiles.find(name); it != b.profiles.end() && it->second) {
                    r.profiles.push_back(to_record(*it->second));
                }
            }
            r.extras = b.extras;
            r.props = b.props;
            r.set_dressing = b.set_dressing;
            r.vehicles = b.vehicles;
            for (const auto& w : b.wardrobe) {
                r.wardrobe.push_back(wardrobe_record{w.character, w.description, w.is_inferred, w.continuity_note});
            }
            r.special_effects = b.special_effects;
            r.sound_cues = b.sound_cues;
            r.stunts = b.stunts;
            for (const auto& a : b.legal_alerts) {
                r.legal_alerts.push_back(
                        legal_alert_record{str(to_string(a.type)), a.entity_name, a.description, str(to_string(a.severity))});
            }
            r.cinematic = cinematic_record{b.cinematic.pattern, b.cinematic.production_note, b.cinematic.camera_note};
            r.continuity_notes = b.continuity_notes;
            r.continues_scene = b.continues_scene;
            r.production_notes = b.production_notes;
            r.special_requirements = b.special_requirements;
            r.page_eighths = b.page_eighths;
            r.estimated_shoot_hours = b.estimated_shoot_hours;
            r.analyzer_failures = b.analyzer_failures;
            return r;
        }

        struct palette {
            bool enabled{false};

            std::string bold(std::string_view text) const {
                return enabled ? "\x1b[1m{}\x1b[0m"_format(text) : std::string{text};
            }
            std::string dim(std::string_view text) const {
                return enabled ? "\x1b[2m{}\x1b[0m"_format(text) : std::string{text};
            }
            std::string alert(std::string_view text) const {
                return enabled ? "\x1b[31m{}\x1b[0m"_format(text) : std::string{text};
            }
        };

        static void print_list(std::ostream& os, const palette& p, std::string_view label, const std::vector<std::string>& values) {
            if (values.empty()) {
                return;
            }
            os << "  " << p.dim("{:<18}"_format(label)) << utils::join_with_separator(values, ", ") << '\n';
        }

    }  // namespace detail

    std::string render_json(const breakdown_run& run, const std::vector<shooting_day>& schedule) {
        detail::report_record record{};
        record.schema_version = detail::report_schema_version;
        record.scene_count = run.scenes.size();
        for (const auto& scene : run.scenes) {
            record.scenes.push_back(detail::to_record(scene));
        }
        for (const auto& f : run.failures) {
            record.failures.push_back(detail::failure_record{f.scene_number, detail::str(to_string(f.stage)), f.message});
        }
        if (!schedule.empty()) {
            auto& days = record.schedule.emplace();
            for (const auto& day : schedule) {
                days.push_back(detail::shooting_day_record{day.day_number, day.scenes, day.total_eighths, day.total_hours});
            }
        }

        std::string json{};
        auto ec = glz::write_json(record, json);
        if (ec) {
            throw std::runtime_error("failed to serialize breakdown report");
        }
        return json;
    }

    void write_report(const std::filesystem::path& path, std::string_view json) {
        std::ofstream out{path};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        out << json << '\n';
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(path.string()));
        }
    }

    report_summary parse_report_summary(std::string_view json) {
        detail::report_record record{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(record, json);
        if (ec) {
            throw config_error("failed to parse breakdown report json");
        }

        report_summary out{};
        out.schema_version = record.schema_version;
        out.scene_count = record.scene_count;
        out.failure_count = record.failures.size();
        for (const auto& scene : record.scenes) {
            out.scene_numbers.push_back(scene.scene_number);
        }
        out.shooting_days = record.schedule ? record.schedule->size() : 0U;
        return out;
    }

    void print_table(std::ostream& os, const breakdown_run& run, bool color) {
        detail::palette p{color};

        for (const auto& b : run.scenes) {
            os << p.bold("SCENE {} | {} {} | {}"_format(
                            b.scene_number, b.header.interior_exterior, b.header.time, b.header.location))
               << '\n';
            os << "  " << p.dim("{:<18}"_format("type")) << "{} ({})"_format(b.type, b.stage) << '\n';
            os << "  " << p.dim("{:<18}"_format("length")) << format_eighths(b.page_eighths) << " pages, ~"
               << b.estimated_shoot_hours << "h\n";
            if (!b.synopsis.empty()) {
                os << "  " << p.dim("{:<18}"_format("synopsis")) << b.synopsis << '\n';
            }
            detail::print_list(os, p, "cast", b.cast);
            detail::print_list(os, p, "extras", b.extras);
            detail::print_list(os, p, "props", b.props);
            detail::print_list(os, p, "set dressing", b.set_dressing);
            detail::print_list(os, p, "vehicles", b.vehicles);
            for (const auto& w : b.wardrobe) {
                os << "  " << p.dim("{:<18}"_format("wardrobe")) << w.character << ": " << w.description;
                if (w.continuity_note) {
                    os << " [" << *w.continuity_note << ']';
                }
                os << '\n';
            }
            detail::print_list(os, p, "effects", b.special_effects);
            detail::print_list(os, p, "sound", b.sound_cues);
            detail::print_list(os, p, "stunts", b.stunts);
            for (const auto& a : b.legal_alerts) {
                auto line = "{} {}: {}"_format(a.severity, a.type, a.entity_name);
                os << "  " << p.dim("{:<18}"_format("legal")) << (a.severity == alert_severity::critical ? p.alert(line) : line)
                   << '\n';
            }
            if (b.cinematic.pattern) {
                os << "  " << p.dim("{:<18}"_format("cinematic")) << *b.cinematic.pattern << ": "
                   << b.cinematic.camera_note << '\n';
            }
            detail::print_list(os, p, "continuity", b.continuity_notes);
            detail::print_list(os, p, "production", b.production_notes);
            detail::print_list(os, p, "requirements", b.special_requirements);
            if (!b.analyzer_failures.empty()) {
                os << "  " << p.dim("{:<18}"_format("failures"))
                   << p.alert(utils::join_with_separator(b.analyzer_failures, "; ")) << '\n';
            }
            os << '\n';
        }

        for (const auto& f : run.failures) {
            os << p.alert("skipped scene {} ({}): {}"_format(f.scene_number, f.stage, f.message)) << '\n';
        }
        os << "{} scene(s), {} skipped\n"_format(run.scenes.size(), run.failures.size());
    }

    void print_schedule(std::ostream& os, const std::vector<shooting_day>& schedule, bool color) {
        detail::palette p{color};
        os << p.bold("SHOOTING SCHEDULE") << '\n';
        for (const auto& day : schedule) {
            os << "  day {:<3} {:>8} pages  ~{:.1f}h  scenes {}\n"_format(
                    day.day_number,
                    format_eighths(day.total_eighths),
                    day.total_hours,
                    utils::join_with_separator(day.scenes, ", "));
        }
    }

}  // namespace callsheet
