#pragma once

#include "types.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace callsheet {

    /*
     * Static reference data: known characters (looked up by any alias, case-insensitively) and the
     * celebrity, brand and song-title sets the legal scanner clears against.
     */
    class knowledge_base {
      public:
        knowledge_base() = default;

        // Characters and clearance sets shipped with the tool.
        static knowledge_base builtin();

        // Indexes canonical name, full name and every alias. A later profile replaces an earlier alias.
        void add_profile(character_profile profile);
        void add_celebrity(std::string name) { utils::append_unique(celebrities_, std::move(name)); }
        void add_brand(std::string name) { utils::append_unique(brands_, std::move(name)); }
        void add_song(std::string title) { utils::append_unique(songs_, std::move(title)); }

        void merge(const knowledge_base& other);

        profile_ref find(std::string_view alias) const;

        const std::vector<profile_ref>& profiles() const { return profiles_; }
        const std::vector<std::string>& celebrities() const { return celebrities_; }
        const std::vector<std::string>& brands() const { return brands_; }
        const std::vector<std::string>& songs() const { return songs_; }

      private:
        std::vector<profile_ref> profiles_{};
        std::unordered_map<std::string, profile_ref> alias_index_{};
        std::vector<std::string> celebrities_{};
        std::vector<std::string> brands_{};
        std::vector<std::string> songs_{};
    };

    // Reads a JSON knowledge file; throws config_error on unreadable or malformed input.
    knowledge_base load_knowledge_file(const std::filesystem::path& path);
    knowledge_base parse_knowledge_json(std::string_view json, std::string_view origin = "<memory>");

    /// Per-run resolver: knowledge-base profiles first, otherwise one synthesized profile per name,
    /// handed out to every scene that mentions it.
    class character_registry {
      public:
        explicit character_registry(const knowledge_base& knowledge) : knowledge_{knowledge} {}

        character_registry(const character_registry&) = delete;
        character_registry& operator=(const character_registry&) = delete;

        profile_ref resolve(std::string_view name);
        std::size_t synthesized_count() const;

      private:
        const knowledge_base& knowledge_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, profile_ref> synthesized_{};
    };

}  // namespace callsheet
