#include "callsheet/knowledge.hpp"

#include "callsheet/errors.hpp"
#include "callsheet/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <memory>
#include <optional>
#include <sstream>

using namespace callsheet::literals;

namespace callsheet::detail {

    struct profile_record {
        std::string canonical_name{};
        std::string full_name{};
        std::optional<std::string> gender{};
        std::optional<std::string> age_range{};
        std::optional<std::string> profession{};
        std::optional<std::string> social_class{};
        std::optional<std::string> psychological_state{};
        std::vector<std::string> aliases{};
    };

    struct knowledge_record {
        int schema_version{1};
        std::vector<profile_record> characters{};
        std::vector<std::string> celebrities{};
        std::vector<std::string> brands{};
        std::vector<std::string> songs{};
    };

}  // namespace callsheet::detail

namespace glz {

    template <>
    struct meta<callsheet::detail::profile_record> {
        using T = callsheet::detail::profile_record;
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
    struct meta<callsheet::detail::knowledge_record> {
        using T = callsheet::detail::knowledge_record;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "characters",
                       &T::characters,
                       "celebrities",
                       &T::celebrities,
                       "brands",
                       &T::brands,
                       "songs",
                       &T::songs);
    };

}  // namespace glz

namespace callsheet {

    namespace detail {

        static character_profile make_profile(
                std::string full_name,
                std::vector<std::string> aliases,
                std::string gender,
                std::string age_range,
                std::optional<std::string> profession,
                std::string social_class,
                std::optional<std::string> psychological_state = std::nullopt) {
            character_profile p{};
            p.canonical_name = full_name;
            p.full_name = std::move(full_name);
            p.aliases = std::move(aliases);
            p.gender = std::move(gender);
            p.age_range = std::move(age_range);
            p.profession = std::move(profession);
            p.social_class = std::move(social_class);
            p.psychological_state = std::move(psychological_state);
            return p;
        }

        static character_profile from_record(profile_record record) {
            character_profile p{};
            p.canonical_name = utils::collapse_whitespace(record.canonical_name);
            p.full_name = record.full_name.empty() ? p.canonical_name : std::move(record.full_name);
            p.gender = std::move(record.gender);
            p.age_range = std::move(record.age_range);
            p.profession = std::move(record.profession);
            p.social_class = std::move(record.social_class);
            p.psychological_state = std::move(record.psychological_state);
            p.aliases = std::move(record.aliases);
            return p;
        }

    }  // namespace detail

    knowledge_base knowledge_base::builtin() {
        knowledge_base kb{};

        kb.add_profile(detail::make_profile(
                "نهال سماحة", {"نهال"}, "female", "30s", std::nullopt, "متوسطة-عليا", "قلقة/صارمة"));
        kb.add_profile(detail::make_profile("نور توفيق", {"نور"}, "female", "30s", "ممثلة", "عليا"));
        kb.add_profile(detail::make_profile("كريم رزق", {"كريم"}, "male", "50s", "منتج", "عليا"));
        kb.add_profile(detail::make_profile("مدحت محفوظ", {"مدحت"}, "male", "30s", "مباحث أمن دولة", "متوسطة"));
        kb.add_profile(detail::make_profile("طارق يحي", {"طارق"}, "male", "40s", "إعلامي ديني", "متوسطة-عليا"));
        kb.add_profile(detail::make_profile("أميرة حشمت", {"أميرة", "اميرة"}, "female", "30s", std::nullopt, "عليا"));
        kb.add_profile(detail::make_profile(
                "رأفت فريد", {"رأفت", "رافت"}, "male", "40s", std::nullopt, "عليا", "مشلول"));

        for (auto* name : {"عمرو دياب",
                           "تامر حسني",
                           "محمد منير",
                           "أنغام",
                           "شيرين",
                           "عمرو مصطفى",
                           "حميد الشاعري",
                           "أسامة أنور عكاشة",
                           "يوسف شاهين",
                           "Elvis Presley",
                           "Michael Jackson",
                           "Madonna"}) {
            kb.add_celebrity(name);
        }
        for (auto* name : {"iPhone",
                           "آيفون",
                           "Samsung",
                           "سامسونج",
                           "Mercedes",
                           "مرسيدس",
                           "BMW",
                           "بي إم دبليو",
                           "Facebook",
                           "فيسبوك",
                           "WhatsApp",
                           "واتساب",
                           "Twitter",
                           "تويتر",
                           "Instagram",
                           "إنستجرام",
                           "Coca-Cola"}) {
            kb.add_brand(name);
        }
        for (auto* title : {"بعدت ليه",
                            "تملي معاك",
                            "قلبي اختارك",
                            "معاك قلبي",
                            "أنا ليلة",
                            "نور العين",
                            "Bohemian Rhapsody",
                            "Hotel California"}) {
            kb.add_song(title);
        }
        return kb;
    }

    void knowledge_base::add_profile(character_profile profile) {
        if (profile.canonical_name.empty()) {
            throw config_error("character profile without canonical_name");
        }
        if (profile.full_name.empty()) {
            profile.full_name = profile.canonical_name;
        }
        auto ref = std::make_shared<const character_profile>(std::move(profile));
        profiles_.push_back(ref);

        alias_index_[utils::to_lower(ref->canonical_name)] = ref;
        alias_index_[utils::to_lower(ref->full_name)] = ref;
        for (const auto& alias : ref->aliases) {
            alias_index_[utils::to_lower(utils::collapse_whitespace(alias))] = ref;
        }
    }

    void knowledge_base::merge(const knowledge_base& other) {
        for (const auto& p : other.profiles_) {
            add_profile(*p);
        }
        for (const auto& c : other.celebrities_) {
            add_celebrity(c);
        }
        for (const auto& b : other.brands_) {
            add_brand(b);
        }
        for (const auto& s : other.songs_) {
            add_song(s);
        }
    }

    profile_ref knowledge_base::find(std::string_view alias) const {
        auto key = utils::to_lower(utils::collapse_whitespace(alias));
        if (auto it = alias_index_.find(key); it != alias_index_.end()) {
            return it->second;
        }
        return nullptr;
    }

    knowledge_base parse_knowledge_json(std::string_view json, std::string_view origin) {
        detail::knowledge_record record{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(record, json);
        if (ec) {
            throw config_error("failed to parse knowledge file {}"_format(origin));
        }
        constexpr int supported_schema_version = 1;
        if (record.schema_version > supported_schema_version) {
            throw config_error(
                    "unsupported schema_version in {}: {} > {}"_format(
                            origin, record.schema_version, supported_schema_version));
        }

        knowledge_base kb{};
        for (auto& p : record.characters) {
            kb.add_profile(detail::from_record(std::move(p)));
        }
        for (auto& c : record.celebrities) {
            kb.add_celebrity(std::move(c));
        }
        for (auto& b : record.brands) {
            kb.add_brand(std::move(b));
        }
        for (auto& s : record.songs) {
            kb.add_song(std::move(s));
        }
        return kb;
    }

    knowledge_base load_knowledge_file(const std::filesystem::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw config_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        return parse_knowledge_json(ss.str(), path.string());
    }

    profile_ref character_registry::resolve(std::string_view name) {
        if (auto known = knowledge_.find(name)) {
            return known;
        }
        auto canonical = utils::collapse_whitespace(name);
        auto key = utils::to_lower(canonical);

        std::lock_guard lock{mutex_};
        auto [it, inserted] = synthesized_.try_emplace(key);
        if (inserted) {
            character_profile p{};
            p.canonical_name = canonical;
            p.full_name = canonical;
            it->second = std::make_shared<const character_profile>(std::move(p));
        }
        return it->second;
    }

    std::size_t character_registry::synthesized_count() const {
        std::lock_guard lock{mutex_};
        return synthesized_.size();
    }

}  // namespace callsheet
